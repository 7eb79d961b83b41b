#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "pairs/core/Json.hpp"
#include "pairs/core/TileIdentity.hpp"

namespace pairs::core {

struct GameConfig {
    int rows = 4;
    int cols = 4;
    std::vector<TileIdentity> identities = DefaultIdentities(8);
    int rollback_delay_ms = 1000;
    int tick_interval_ms = 50;
    std::optional<std::uint32_t> seed;
    std::array<int, 2> resolution{{1280, 800}};

    std::int64_t tileCount() const noexcept {
        return static_cast<std::int64_t>(rows) * static_cast<std::int64_t>(cols);
    }
    std::int64_t pairCount() const noexcept { return tileCount() / 2; }

    // Throws ConfigurationError when no board can be built from these settings.
    void Validate() const;

    Json ToJson() const;
    static GameConfig FromJson(const Json& json);

    std::string Serialize() const;
    static GameConfig Deserialize(const std::string& json_string);
};

}  // namespace pairs::core
