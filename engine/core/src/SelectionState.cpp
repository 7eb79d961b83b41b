#include "pairs/core/SelectionState.hpp"

namespace pairs::core {

SelectionState::SelectionState(const Board& board) noexcept
    : hidden_count_(board.size() - board.revealedCount()) {}

TurnPhase SelectionState::phase() const noexcept {
    if (!pending_first_) {
        return TurnPhase::Idle;
    }
    if (!pending_second_) {
        return TurnPhase::OneSelected;
    }
    return needs_rollback_ ? TurnPhase::PairMismatched : TurnPhase::PairMatched;
}

bool SelectionState::acceptsClicks() const noexcept {
    return !pending_second_;
}

ClickOutcome SelectionState::Click(Board& board,
                                   const CellTarget& target,
                                   TimeMs now_ms,
                                   TimeMs rollback_delay_ms) {
    if (!acceptsClicks() || !target || !board.inBounds(*target)) {
        return ClickOutcome::Ignored;
    }
    const Cell cell = *target;
    if (board.tileAt(cell).revealed) {
        return ClickOutcome::Ignored;
    }

    Reveal(board, cell);

    if (!pending_first_) {
        pending_first_ = cell;
        return ClickOutcome::FirstRevealed;
    }

    pending_second_ = cell;
    if (board.tileAt(cell).identity == board.tileAt(*pending_first_).identity) {
        needs_rollback_ = false;
        return ClickOutcome::PairMatched;
    }
    needs_rollback_ = true;
    reveal_deadline_ms_ = now_ms + rollback_delay_ms;
    return ClickOutcome::PairMismatched;
}

TickOutcome SelectionState::Tick(Board& board, TimeMs now_ms) {
    switch (phase()) {
        case TurnPhase::PairMatched:
            ClearPending();
            return TickOutcome::Cleared;
        case TurnPhase::PairMismatched:
            if (now_ms < reveal_deadline_ms_) {
                return TickOutcome::Waiting;
            }
            board.setRevealed(*pending_first_, false);
            board.setRevealed(*pending_second_, false);
            hidden_count_ += 2;
            ClearPending();
            return TickOutcome::RolledBack;
        case TurnPhase::Idle:
        case TurnPhase::OneSelected:
            break;
    }
    return TickOutcome::None;
}

void SelectionState::Reveal(Board& board, const Cell& cell) {
    board.setRevealed(cell, true);
    --hidden_count_;
}

void SelectionState::ClearPending() noexcept {
    pending_first_.reset();
    pending_second_.reset();
    needs_rollback_ = false;
    reveal_deadline_ms_ = 0;
}

const char* ToString(TurnPhase phase) noexcept {
    switch (phase) {
        case TurnPhase::Idle:
            return "Idle";
        case TurnPhase::OneSelected:
            return "OneSelected";
        case TurnPhase::PairMatched:
            return "PairMatched";
        case TurnPhase::PairMismatched:
            return "PairMismatched";
    }
    return "Unknown";
}

}  // namespace pairs::core
