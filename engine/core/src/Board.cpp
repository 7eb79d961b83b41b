#include "pairs/core/Board.hpp"

#include <algorithm>
#include <cassert>
#include <set>
#include <string>
#include <utility>

#include "pairs/core/Errors.hpp"

namespace pairs::core {

Board::Board(int rows, int cols, std::vector<TileIdentity> layout) : rows_(rows), cols_(cols) {
    CheckBoardDimensions(rows, cols);
    if (layout.size() != static_cast<std::size_t>(rows) * static_cast<std::size_t>(cols)) {
        throw ConfigurationError("layout holds " + std::to_string(layout.size()) +
                                 " identities for a " + std::to_string(rows) + "x" +
                                 std::to_string(cols) + " board");
    }
    tiles_.reserve(layout.size());
    for (auto& identity : layout) {
        tiles_.push_back(Tile{std::move(identity), false});
    }
    if (!EveryIdentityPaired(*this)) {
        throw ConfigurationError("every identity must appear exactly twice on the board");
    }
}

void CheckBoardDimensions(std::int64_t rows, std::int64_t cols) {
    if (rows <= 0 || cols <= 0) {
        throw ConfigurationError("board dimensions must be positive, got " + std::to_string(rows) +
                                 "x" + std::to_string(cols));
    }
    if (rows > kMaxBoardSide || cols > kMaxBoardSide) {
        throw ConfigurationError("board sides are limited to " + std::to_string(kMaxBoardSide) +
                                 ", got " + std::to_string(rows) + "x" + std::to_string(cols));
    }
    if ((rows * cols) % 2 != 0) {
        throw ConfigurationError("board must hold an even number of tiles, got " +
                                 std::to_string(rows) + "x" + std::to_string(cols));
    }
}

bool Board::inBounds(int row, int col) const noexcept {
    return row >= 0 && row < rows_ && col >= 0 && col < cols_;
}

const Tile& Board::tileAt(int row, int col) const {
    assert(inBounds(row, col));
    return tiles_[static_cast<std::size_t>(index(row, col))];
}

int Board::revealedCount() const noexcept {
    return static_cast<int>(
        std::count_if(tiles_.begin(), tiles_.end(), [](const Tile& tile) { return tile.revealed; }));
}

void Board::setRevealed(const Cell& cell, bool revealed) {
    assert(inBounds(cell));
    tiles_[static_cast<std::size_t>(index(cell.row, cell.col))].revealed = revealed;
}

int Board::index(int row, int col) const noexcept {
    return row * cols_ + col;
}

Board NewBoard(int rows,
               int cols,
               const std::vector<TileIdentity>& identity_source,
               std::uint32_t seed) {
    CheckBoardDimensions(rows, cols);
    const std::size_t pair_count = static_cast<std::size_t>(rows) * static_cast<std::size_t>(cols) / 2;

    std::vector<TileIdentity> distinct;
    distinct.reserve(pair_count);
    std::set<TileIdentity> seen;
    for (const auto& identity : identity_source) {
        if (distinct.size() == pair_count) {
            break;
        }
        if (seen.insert(identity).second) {
            distinct.push_back(identity);
        }
    }
    if (distinct.size() < pair_count) {
        throw ConfigurationError("a " + std::to_string(rows) + "x" + std::to_string(cols) +
                                 " board needs " + std::to_string(pair_count) +
                                 " distinct identities, only " + std::to_string(distinct.size()) +
                                 " supplied");
    }

    std::vector<TileIdentity> layout;
    layout.reserve(pair_count * 2);
    for (const auto& identity : distinct) {
        layout.push_back(identity);
        layout.push_back(identity);
    }
    std::mt19937 rng(seed);
    std::shuffle(layout.begin(), layout.end(), rng);

    return Board(rows, cols, std::move(layout));
}

std::map<TileIdentity, int> IdentityCounts(const Board& board) {
    std::map<TileIdentity, int> counts;
    for (int row = 0; row < board.rows(); ++row) {
        for (int col = 0; col < board.cols(); ++col) {
            ++counts[board.tileAt(row, col).identity];
        }
    }
    return counts;
}

bool EveryIdentityPaired(const Board& board) {
    const auto counts = IdentityCounts(board);
    return std::all_of(counts.begin(), counts.end(),
                       [](const auto& entry) { return entry.second == 2; });
}

}  // namespace pairs::core
