#include "pairs/core/GameConfig.hpp"

#include <set>
#include <string>

#include "pairs/core/Board.hpp"
#include "pairs/core/Errors.hpp"

namespace pairs::core {

namespace {

// Range-checked before narrowing so oversized values cannot wrap into range.
int ReadBoardSide(const Json& json, const char* key, int fallback) {
    if (!json.contains(key) || !json[key].is_number_integer()) {
        return fallback;
    }
    const auto value = json[key].get<std::int64_t>();
    if (value <= 0 || value > kMaxBoardSide) {
        throw ConfigurationError(std::string(key) + " must be between 1 and " +
                                 std::to_string(kMaxBoardSide) + ", got " + std::to_string(value));
    }
    return static_cast<int>(value);
}

}  // namespace

void GameConfig::Validate() const {
    CheckBoardDimensions(rows, cols);
    const std::set<TileIdentity> distinct(identities.begin(), identities.end());
    if (static_cast<std::int64_t>(distinct.size()) < pairCount()) {
        throw ConfigurationError("need " + std::to_string(pairCount()) +
                                 " distinct identities, got " + std::to_string(distinct.size()));
    }
    if (rollback_delay_ms < 0) {
        throw ConfigurationError("rollback_delay_ms must not be negative");
    }
    if (tick_interval_ms <= 0) {
        throw ConfigurationError("tick_interval_ms must be positive");
    }
}

Json GameConfig::ToJson() const {
    Json json;
    json["rows"] = rows;
    json["cols"] = cols;
    Json list = Json::array();
    for (const auto& identity : identities) {
        list.push_back(identity.ToJson());
    }
    json["identities"] = list;
    json["rollback_delay_ms"] = rollback_delay_ms;
    json["tick_interval_ms"] = tick_interval_ms;
    if (seed) {
        json["seed"] = *seed;
    }
    json["resolution"] = {resolution[0], resolution[1]};
    return json;
}

GameConfig GameConfig::FromJson(const Json& json) {
    GameConfig config;
    config.rows = ReadBoardSide(json, "rows", config.rows);
    config.cols = ReadBoardSide(json, "cols", config.cols);
    if (json.contains("identities")) {
        if (!json["identities"].is_array()) {
            throw ConfigurationError("identities must be an array");
        }
        config.identities.clear();
        for (const auto& entry : json["identities"]) {
            config.identities.push_back(TileIdentity::FromJson(entry));
        }
    } else {
        CheckBoardDimensions(config.rows, config.cols);
        config.identities = DefaultIdentities(static_cast<int>(config.pairCount()));
    }
    if (json.contains("rollback_delay_ms") && json["rollback_delay_ms"].is_number_integer()) {
        config.rollback_delay_ms = json["rollback_delay_ms"].get<int>();
    }
    if (json.contains("tick_interval_ms") && json["tick_interval_ms"].is_number_integer()) {
        config.tick_interval_ms = json["tick_interval_ms"].get<int>();
    }
    if (json.contains("seed") && json["seed"].is_number_unsigned()) {
        config.seed = json["seed"].get<std::uint32_t>();
    }
    if (json.contains("resolution") && json["resolution"].is_array() &&
        json["resolution"].size() == 2) {
        config.resolution[0] = json["resolution"][0].get<int>();
        config.resolution[1] = json["resolution"][1].get<int>();
    }
    return config;
}

std::string GameConfig::Serialize() const {
    return ToJson().dump(2);
}

GameConfig GameConfig::Deserialize(const std::string& json_string) {
    Json json;
    try {
        json = Json::parse(json_string);
    } catch (const Json::parse_error& e) {
        throw ConfigurationError(std::string("config is not valid JSON: ") + e.what());
    }
    if (!json.is_object()) {
        throw ConfigurationError("config must be a JSON object");
    }
    try {
        return FromJson(json);
    } catch (const Json::type_error& e) {
        throw ConfigurationError(std::string("config has a field of the wrong type: ") + e.what());
    }
}

}  // namespace pairs::core
