#pragma once

#include <optional>

#include "pairs/core/Board.hpp"
#include "pairs/core/Types.hpp"

namespace pairs::core {

enum class TurnPhase { Idle, OneSelected, PairMatched, PairMismatched };

enum class ClickOutcome { Ignored, FirstRevealed, PairMatched, PairMismatched };

enum class TickOutcome { None, Waiting, Cleared, RolledBack };

// Turn machine for one round. Holds cell references into the board it was
// built for and is the only code allowed to flip tiles on it.
//
// Idle -> OneSelected on a click on a hidden tile.
// OneSelected -> PairMatched / PairMismatched on a second click.
// PairMatched -> Idle on the next tick.
// PairMismatched -> Idle on the first tick at or after the reveal deadline,
// hiding both tiles again.
class SelectionState {
public:
    explicit SelectionState(const Board& board) noexcept;

    // Never throws; clicks that fail a guard are absorbed.
    ClickOutcome Click(Board& board, const CellTarget& target, TimeMs now_ms, TimeMs rollback_delay_ms);
    TickOutcome Tick(Board& board, TimeMs now_ms);

    TurnPhase phase() const noexcept;

    const std::optional<Cell>& pendingFirst() const noexcept { return pending_first_; }
    const std::optional<Cell>& pendingSecond() const noexcept { return pending_second_; }
    bool needsRollback() const noexcept { return needs_rollback_; }
    int hiddenCount() const noexcept { return hidden_count_; }
    TimeMs revealDeadline() const noexcept { return reveal_deadline_ms_; }

    bool acceptsClicks() const noexcept;
    bool isGameOver() const noexcept { return hidden_count_ == 0; }

private:
    void Reveal(Board& board, const Cell& cell);
    void ClearPending() noexcept;

    std::optional<Cell> pending_first_;
    std::optional<Cell> pending_second_;
    bool needs_rollback_ = false;
    int hidden_count_ = 0;
    TimeMs reveal_deadline_ms_ = 0;
};

const char* ToString(TurnPhase phase) noexcept;

}  // namespace pairs::core
