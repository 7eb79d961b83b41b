#include <cassert>
#include <cstdint>
#include <iostream>
#include <string>

#include "pairs/core/Board.hpp"
#include "pairs/core/Errors.hpp"
#include "pairs/core/Game.hpp"
#include "pairs/core/GameConfig.hpp"

using namespace pairs::core;

namespace {

template <typename Fn>
bool ThrowsConfigurationError(Fn&& fn) {
    try {
        fn();
    } catch (const ConfigurationError&) {
        return true;
    }
    return false;
}

void TestDefaultsAreValid() {
    GameConfig config;
    config.Validate();
    assert(config.rows * config.cols == 16);
    assert(config.identities.size() == 8);
    assert(config.rollback_delay_ms == 1000);
    assert(!config.seed);
}

void TestDeserializeReadsAllFields() {
    const std::string text = R"({
        "rows": 2,
        "cols": 3,
        "identities": ["sun", {"glyph": "moon"}, {"picture": "tiles/star.png"}],
        "rollback_delay_ms": 750,
        "tick_interval_ms": 20,
        "seed": 42,
        "resolution": [1024, 768]
    })";
    auto config = GameConfig::Deserialize(text);
    config.Validate();
    assert(config.rows == 2);
    assert(config.cols == 3);
    assert(config.identities.size() == 3);
    assert(config.identities[0] == TileIdentity::Glyph("sun"));
    assert(config.identities[1] == TileIdentity::Glyph("moon"));
    assert(config.identities[2] == TileIdentity::Picture("tiles/star.png"));
    assert(config.rollback_delay_ms == 750);
    assert(config.tick_interval_ms == 20);
    assert(config.seed && *config.seed == 42u);
    assert(config.resolution[0] == 1024 && config.resolution[1] == 768);

    auto again = GameConfig::Deserialize(config.Serialize());
    assert(again.identities == config.identities);
    assert(again.seed == config.seed);
}

void TestMissingIdentitiesFollowBoardSize() {
    auto config = GameConfig::Deserialize(R"({"rows": 6, "cols": 6})");
    assert(config.identities.size() == 18);
    config.Validate();
}

void TestInvalidConfigsAreRejected() {
    assert(ThrowsConfigurationError([] { GameConfig::Deserialize("{ not json"); }));
    assert(ThrowsConfigurationError([] { GameConfig::Deserialize("[1, 2]"); }));
    assert(ThrowsConfigurationError([] { GameConfig::Deserialize(R"({"identities": 5})"); }));
    assert(ThrowsConfigurationError([] { GameConfig::Deserialize(R"({"identities": [7]})"); }));
    assert(ThrowsConfigurationError([] { GameConfig::Deserialize(R"({"resolution": ["a", "b"]})"); }));

    assert(ThrowsConfigurationError([] {
        GameConfig::Deserialize(R"({"rows": 3, "cols": 3})").Validate();
    }));
    assert(ThrowsConfigurationError([] {
        GameConfig::Deserialize(R"({"rows": 2, "cols": 2, "identities": ["x", "x"]})").Validate();
    }));
    assert(ThrowsConfigurationError([] {
        GameConfig::Deserialize(R"({"rollback_delay_ms": -5})").Validate();
    }));
    assert(ThrowsConfigurationError([] {
        GameConfig::Deserialize(R"({"tick_interval_ms": 0})").Validate();
    }));
}

void TestOversizedBoardsAreRejectedBeforeAllocating() {
    // Without identities the defaults would be sized from these dimensions.
    assert(ThrowsConfigurationError([] { GameConfig::Deserialize(R"({"rows": 40000, "cols": 40000})"); }));
    assert(ThrowsConfigurationError([] { GameConfig::Deserialize(R"({"rows": 65536, "cols": 65536})"); }));
    assert(ThrowsConfigurationError([] { GameConfig::Deserialize(R"({"rows": 4294967298, "cols": 2})"); }));
    assert(ThrowsConfigurationError([] {
        GameConfig::Deserialize(R"({"rows": 65, "cols": 2, "identities": ["a"]})");
    }));

    GameConfig config;
    config.rows = 65536;
    config.cols = 65536;
    assert(config.tileCount() == 4294967296LL);
    assert(ThrowsConfigurationError([&] { config.Validate(); }));

    config.rows = kMaxBoardSide;
    config.cols = kMaxBoardSide;
    config.identities = DefaultIdentities(kMaxBoardSide * kMaxBoardSide / 2);
    config.Validate();
    auto largest = GameConfig::Deserialize(R"({"rows": 64, "cols": 64})");
    assert(static_cast<std::int64_t>(largest.identities.size()) == largest.pairCount());
    largest.Validate();
}

void TestGameRejectsInvalidConfig() {
    GameConfig config;
    config.rows = 3;
    config.cols = 5;
    assert(ThrowsConfigurationError([&] { Game game(config, 1); }));

    config.rows = 2;
    config.identities = DefaultIdentities(4);
    assert(ThrowsConfigurationError([&] { Game game(config, 1); }));
}

void TestGameUsesConfiguredDelay() {
    GameConfig config;
    config.rows = 2;
    config.cols = 2;
    config.identities = {TileIdentity::Glyph("A"), TileIdentity::Glyph("B")};
    config.rollback_delay_ms = 250;
    Game game(config, /*seed=*/5);
    assert(game.rollbackDelayMs() == 250);
    assert(game.seed() == 5u);
    assert(game.pairCount() == 2);
    assert(EveryIdentityPaired(game.board()));
    assert(game.selection().hiddenCount() == 4);
}

}  // namespace

int main() {
    TestDefaultsAreValid();
    TestDeserializeReadsAllFields();
    TestMissingIdentitiesFollowBoardSize();
    TestInvalidConfigsAreRejected();
    TestOversizedBoardsAreRejectedBeforeAllocating();
    TestGameRejectsInvalidConfig();
    TestGameUsesConfiguredDelay();
    std::cout << "All config tests passed.\n";
    return 0;
}
