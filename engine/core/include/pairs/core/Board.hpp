#pragma once

#include <cstdint>
#include <map>
#include <random>
#include <vector>

#include "pairs/core/TileIdentity.hpp"
#include "pairs/core/Types.hpp"

namespace pairs::core {

inline constexpr int kMaxBoardSide = 64;

struct Tile {
    TileIdentity identity;
    bool revealed = false;
};

// Fixed rows x cols grid stored row-major. Every identity on the board occurs
// exactly twice. Tiles can only be flipped by SelectionState.
class Board {
public:
    Board() = default;

    // Lays the identities out row-major. Throws ConfigurationError unless the
    // layout holds rows * cols tiles forming complete pairs.
    Board(int rows, int cols, std::vector<TileIdentity> layout);

    int rows() const noexcept { return rows_; }
    int cols() const noexcept { return cols_; }
    int size() const noexcept { return rows_ * cols_; }

    bool inBounds(int row, int col) const noexcept;
    bool inBounds(const Cell& cell) const noexcept { return inBounds(cell.row, cell.col); }

    // Precondition: inBounds(row, col).
    const Tile& tileAt(int row, int col) const;
    const Tile& tileAt(const Cell& cell) const { return tileAt(cell.row, cell.col); }

    int revealedCount() const noexcept;

private:
    friend class SelectionState;

    void setRevealed(const Cell& cell, bool revealed);

    int index(int row, int col) const noexcept;

    int rows_{0};
    int cols_{0};
    std::vector<Tile> tiles_;
};

// Throws ConfigurationError unless 1 <= rows, cols <= kMaxBoardSide and
// rows * cols is even.
void CheckBoardDimensions(std::int64_t rows, std::int64_t cols);

// Takes the first rows * cols / 2 distinct identities from identity_source,
// duplicates each one and shuffles the result onto a new board.
Board NewBoard(int rows,
               int cols,
               const std::vector<TileIdentity>& identity_source,
               std::uint32_t seed = std::random_device{}());

std::map<TileIdentity, int> IdentityCounts(const Board& board);

bool EveryIdentityPaired(const Board& board);

}  // namespace pairs::core
