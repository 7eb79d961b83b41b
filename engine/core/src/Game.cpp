#include "pairs/core/Game.hpp"

#include <utility>

namespace pairs::core {

namespace {

Board BuildBoard(const GameConfig& config, std::uint32_t seed) {
    config.Validate();
    return NewBoard(config.rows, config.cols, config.identities, seed);
}

}  // namespace

Game::Game(const GameConfig& config, std::uint32_t seed)
    : board_(BuildBoard(config, seed)),
      selection_(board_),
      rollback_delay_ms_(static_cast<TimeMs>(config.rollback_delay_ms)),
      seed_(seed) {}

Game::Game(Board board, TimeMs rollback_delay_ms)
    : board_(std::move(board)), selection_(board_), rollback_delay_ms_(rollback_delay_ms) {}

ClickOutcome Game::Click(const CellTarget& target, TimeMs now_ms) {
    const ClickOutcome outcome = selection_.Click(board_, target, now_ms, rollback_delay_ms_);
    switch (outcome) {
        case ClickOutcome::PairMatched:
            ++attempts_;
            ++pairs_found_;
            break;
        case ClickOutcome::PairMismatched:
            ++attempts_;
            break;
        case ClickOutcome::Ignored:
        case ClickOutcome::FirstRevealed:
            break;
    }
    return outcome;
}

TickOutcome Game::Tick(TimeMs now_ms) {
    return selection_.Tick(board_, now_ms);
}

}  // namespace pairs::core
