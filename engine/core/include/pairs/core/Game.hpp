#pragma once

#include <cstdint>

#include "pairs/core/Board.hpp"
#include "pairs/core/GameConfig.hpp"
#include "pairs/core/SelectionState.hpp"

namespace pairs::core {

// One round of play: the shuffled board, its turn machine and round statistics.
// Owned by the host event loop; replaced wholesale to start another round.
class Game {
public:
    // Throws ConfigurationError.
    Game(const GameConfig& config, std::uint32_t seed);
    Game(Board board, TimeMs rollback_delay_ms);

    ClickOutcome Click(const CellTarget& target, TimeMs now_ms);
    TickOutcome Tick(TimeMs now_ms);

    bool IsGameOver() const noexcept { return selection_.isGameOver(); }

    const Board& board() const noexcept { return board_; }
    const SelectionState& selection() const noexcept { return selection_; }
    TimeMs rollbackDelayMs() const noexcept { return rollback_delay_ms_; }
    std::uint32_t seed() const noexcept { return seed_; }

    int attempts() const noexcept { return attempts_; }
    int pairsFound() const noexcept { return pairs_found_; }
    int pairCount() const noexcept { return board_.size() / 2; }

private:
    Board board_;
    SelectionState selection_;
    TimeMs rollback_delay_ms_ = 0;
    std::uint32_t seed_ = 0;
    int attempts_ = 0;
    int pairs_found_ = 0;
};

}  // namespace pairs::core
