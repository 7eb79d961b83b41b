#include <cassert>
#include <iostream>
#include <map>
#include <random>
#include <vector>

#include "pairs/core/Game.hpp"
#include "pairs/core/SelectionState.hpp"

using namespace pairs::core;

namespace {

constexpr TimeMs kDelay = 1000;

const TileIdentity kA = TileIdentity::Glyph("A");
const TileIdentity kB = TileIdentity::Glyph("B");

// Row-major [A, B, B, A]:
//   (row 0) A B
//   (row 1) B A
Board MakeScenarioBoard() {
    return Board(2, 2, {kA, kB, kB, kA});
}

Cell At(int row, int col) {
    return Cell{col, row};
}

void TestInitialStateIsIdle() {
    Game game(MakeScenarioBoard(), kDelay);
    const auto& sel = game.selection();
    assert(sel.phase() == TurnPhase::Idle);
    assert(!sel.pendingFirst());
    assert(!sel.pendingSecond());
    assert(!sel.needsRollback());
    assert(sel.hiddenCount() == 4);
    assert(!game.IsGameOver());
}

void TestMismatchRollsBackAfterDeadline() {
    Game game(MakeScenarioBoard(), kDelay);

    assert(game.Click(At(0, 0), 100) == ClickOutcome::FirstRevealed);
    assert(game.board().tileAt(0, 0).revealed);
    assert(game.selection().phase() == TurnPhase::OneSelected);
    assert(*game.selection().pendingFirst() == At(0, 0));
    assert(game.selection().hiddenCount() == 3);

    assert(game.Click(At(0, 1), 200) == ClickOutcome::PairMismatched);
    assert(game.selection().phase() == TurnPhase::PairMismatched);
    assert(game.selection().needsRollback());
    assert(*game.selection().pendingSecond() == At(0, 1));
    assert(game.selection().hiddenCount() == 2);
    assert(game.selection().revealDeadline() == 200 + kDelay);

    assert(game.Tick(500) == TickOutcome::Waiting);
    assert(game.selection().phase() == TurnPhase::PairMismatched);
    assert(game.board().tileAt(0, 0).revealed);
    assert(game.board().tileAt(0, 1).revealed);
    assert(game.selection().hiddenCount() == 2);

    assert(game.Tick(200 + kDelay) == TickOutcome::RolledBack);
    assert(game.selection().phase() == TurnPhase::Idle);
    assert(!game.board().tileAt(0, 0).revealed);
    assert(!game.board().tileAt(0, 1).revealed);
    assert(game.selection().hiddenCount() == 4);
    assert(!game.selection().needsRollback());
    assert(!game.selection().pendingFirst());
    assert(!game.selection().pendingSecond());
    assert(game.attempts() == 1);
    assert(game.pairsFound() == 0);
}

void TestMatchesSolveTheBoard() {
    Game game(MakeScenarioBoard(), kDelay);

    assert(game.Click(At(0, 0), 0) == ClickOutcome::FirstRevealed);
    assert(game.Click(At(1, 1), 10) == ClickOutcome::PairMatched);
    assert(game.selection().phase() == TurnPhase::PairMatched);
    assert(!game.selection().needsRollback());
    assert(game.selection().hiddenCount() == 2);

    assert(game.Tick(20) == TickOutcome::Cleared);
    assert(game.selection().phase() == TurnPhase::Idle);
    assert(game.selection().hiddenCount() == 2);
    assert(game.board().tileAt(0, 0).revealed);
    assert(game.board().tileAt(1, 1).revealed);

    assert(game.Click(At(0, 1), 30) == ClickOutcome::FirstRevealed);
    assert(game.Click(At(1, 0), 40) == ClickOutcome::PairMatched);
    assert(game.selection().hiddenCount() == 0);
    assert(game.IsGameOver());
    assert(game.attempts() == 2);
    assert(game.pairsFound() == 2);

    // Matched tiles stay up no matter how much time passes.
    assert(game.Tick(100000) == TickOutcome::Cleared);
    assert(game.Tick(200000) == TickOutcome::None);
    assert(game.board().revealedCount() == 4);
    assert(game.IsGameOver());
}

void TestClicksIgnoredWhilePairPending() {
    Game game(MakeScenarioBoard(), kDelay);
    game.Click(At(0, 0), 0);
    game.Click(At(0, 1), 0);

    assert(game.Click(At(1, 0), 10) == ClickOutcome::Ignored);
    assert(!game.board().tileAt(1, 0).revealed);
    assert(game.selection().hiddenCount() == 2);

    assert(game.Tick(kDelay) == TickOutcome::RolledBack);

    Game matched(MakeScenarioBoard(), kDelay);
    matched.Click(At(0, 0), 0);
    matched.Click(At(1, 1), 0);
    assert(matched.Click(At(0, 1), 0) == ClickOutcome::Ignored);
    assert(matched.selection().phase() == TurnPhase::PairMatched);
    assert(!matched.board().tileAt(0, 1).revealed);
}

void TestRevealedTilesCannotBeSelected() {
    Game game(MakeScenarioBoard(), kDelay);
    game.Click(At(0, 0), 0);

    // Same tile twice: the second click is absorbed, so no self-pairing.
    assert(game.Click(At(0, 0), 1) == ClickOutcome::Ignored);
    assert(game.selection().phase() == TurnPhase::OneSelected);
    assert(!game.selection().pendingSecond());
    assert(game.selection().hiddenCount() == 3);

    game.Click(At(1, 1), 2);
    game.Tick(3);
    assert(game.Click(At(1, 1), 4) == ClickOutcome::Ignored);
    assert(game.selection().phase() == TurnPhase::Idle);
}

void TestOffBoardClicksAreNoOps() {
    Game game(MakeScenarioBoard(), kDelay);
    const std::vector<CellTarget> misses = {std::nullopt, Cell{2, 0}, Cell{0, 2}, Cell{-1, 0},
                                            Cell{0, -1}};

    auto check_no_change = [&](TurnPhase expected_phase, int expected_hidden) {
        for (const auto& miss : misses) {
            assert(game.Click(miss, 0) == ClickOutcome::Ignored);
            assert(game.selection().phase() == expected_phase);
            assert(game.selection().hiddenCount() == expected_hidden);
        }
    };

    check_no_change(TurnPhase::Idle, 4);
    game.Click(At(0, 0), 0);
    check_no_change(TurnPhase::OneSelected, 3);
    game.Click(At(0, 1), 0);
    check_no_change(TurnPhase::PairMismatched, 2);
    game.Tick(kDelay);
    game.Click(At(0, 0), 0);
    game.Click(At(1, 1), 0);
    check_no_change(TurnPhase::PairMatched, 2);
}

void TestTickIsIdempotentWhenNothingPending() {
    Game game(MakeScenarioBoard(), kDelay);
    for (TimeMs now = 0; now < 5 * kDelay; now += 250) {
        assert(game.Tick(now) == TickOutcome::None);
        assert(game.selection().phase() == TurnPhase::Idle);
        assert(game.selection().hiddenCount() == 4);
    }
    game.Click(At(1, 0), 0);
    for (TimeMs now = 0; now < 5 * kDelay; now += 250) {
        assert(game.Tick(now) == TickOutcome::None);
        assert(game.selection().phase() == TurnPhase::OneSelected);
        assert(*game.selection().pendingFirst() == At(1, 0));
        assert(game.selection().hiddenCount() == 3);
    }
}

void TestZeroDelayRollsBackOnNextTick() {
    Game game(MakeScenarioBoard(), 0);
    game.Click(At(0, 0), 50);
    game.Click(At(1, 0), 50);
    assert(game.Tick(50) == TickOutcome::RolledBack);
    assert(game.selection().hiddenCount() == 4);
}

// Random legal play on a shuffled board: identities never change, the hidden
// count always agrees with the board, and the round always finishes.
void TestRandomPlayKeepsInvariantsAndTerminates() {
    GameConfig config;
    config.rows = 4;
    config.cols = 5;
    config.identities = DefaultIdentities(10);
    config.rollback_delay_ms = 300;

    Game game(config, /*seed=*/2024);
    const auto initial_counts = IdentityCounts(game.board());

    std::mt19937 rng(99);
    std::uniform_int_distribution<int> pick_row(-1, config.rows);
    std::uniform_int_distribution<int> pick_col(-1, config.cols);

    TimeMs now = 0;
    int previous_hidden = game.selection().hiddenCount();
    for (int step = 0; step < 20000 && !game.IsGameOver(); ++step) {
        now += 40;
        if (step % 3 == 0) {
            game.Tick(now);
        } else {
            game.Click(Cell{pick_col(rng), pick_row(rng)}, now);
        }
        const int hidden = game.selection().hiddenCount();
        const int delta = hidden - previous_hidden;
        assert(delta == 0 || delta == -1 || delta == 2);
        assert(hidden + game.board().revealedCount() == game.board().size());
        if (game.selection().pendingFirst() && game.selection().pendingSecond()) {
            assert(*game.selection().pendingFirst() != *game.selection().pendingSecond());
        }
        previous_hidden = hidden;
    }

    // Finish deterministically by pairing up whatever is still hidden.
    now += config.rollback_delay_ms;
    game.Tick(now);
    if (game.selection().phase() == TurnPhase::OneSelected) {
        const auto& wanted = game.board().tileAt(*game.selection().pendingFirst()).identity;
        for (int row = 0; row < config.rows; ++row) {
            for (int col = 0; col < config.cols; ++col) {
                const auto& tile = game.board().tileAt(row, col);
                if (!tile.revealed && tile.identity == wanted) {
                    assert(game.Click(At(row, col), now) == ClickOutcome::PairMatched);
                }
            }
        }
    }
    game.Tick(now);
    assert(game.selection().phase() == TurnPhase::Idle);
    std::map<TileIdentity, std::vector<Cell>> hidden_by_identity;
    for (int row = 0; row < config.rows; ++row) {
        for (int col = 0; col < config.cols; ++col) {
            if (!game.board().tileAt(row, col).revealed) {
                hidden_by_identity[game.board().tileAt(row, col).identity].push_back(At(row, col));
            }
        }
    }
    for (const auto& entry : hidden_by_identity) {
        assert(entry.second.size() == 2);
        assert(game.Click(entry.second[0], now) == ClickOutcome::FirstRevealed);
        assert(game.Click(entry.second[1], now) == ClickOutcome::PairMatched);
        assert(game.Tick(now) == TickOutcome::Cleared);
    }

    assert(game.IsGameOver());
    assert(game.selection().hiddenCount() == 0);
    assert(game.pairsFound() == game.pairCount());
    assert(IdentityCounts(game.board()) == initial_counts);
}

}  // namespace

int main() {
    TestInitialStateIsIdle();
    TestMismatchRollsBackAfterDeadline();
    TestMatchesSolveTheBoard();
    TestClicksIgnoredWhilePairPending();
    TestRevealedTilesCannotBeSelected();
    TestOffBoardClicksAreNoOps();
    TestTickIsIdempotentWhenNothingPending();
    TestZeroDelayRollsBackOnNextTick();
    TestRandomPlayKeepsInvariantsAndTerminates();
    std::cout << "All selection tests passed.\n";
    return 0;
}
