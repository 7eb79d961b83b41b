#pragma once

#include <cstdint>
#include <optional>

namespace pairs::core {

struct Cell {
    std::int32_t col{};
    std::int32_t row{};

    constexpr bool operator==(const Cell& other) const noexcept {
        return col == other.col && row == other.row;
    }

    constexpr bool operator!=(const Cell& other) const noexcept {
        return !(*this == other);
    }

    constexpr bool operator<(const Cell& other) const noexcept {
        return row < other.row || (row == other.row && col < other.col);
    }
};

// Empty when the pointer landed outside the grid.
using CellTarget = std::optional<Cell>;

// Milliseconds on the host's monotonic clock.
using TimeMs = std::uint64_t;

}  // namespace pairs::core
