#include "pairs/core/TileIdentity.hpp"

#include <filesystem>
#include <utility>

#include "pairs/core/Errors.hpp"

namespace pairs::core {

TileIdentity TileIdentity::Glyph(std::string text) {
    TileIdentity identity;
    identity.kind = Kind::Glyph;
    identity.value = std::move(text);
    return identity;
}

TileIdentity TileIdentity::Picture(std::string asset_path) {
    TileIdentity identity;
    identity.kind = Kind::Picture;
    identity.value = std::move(asset_path);
    return identity;
}

std::string TileIdentity::label() const {
    if (kind == Kind::Glyph) {
        return value;
    }
    std::string stem = std::filesystem::path(value).stem().string();
    return stem.empty() ? value : stem;
}

Json TileIdentity::ToJson() const {
    if (kind == Kind::Glyph) {
        return Json(value);
    }
    Json json;
    json["picture"] = value;
    return json;
}

TileIdentity TileIdentity::FromJson(const Json& json) {
    if (json.is_string()) {
        return Glyph(json.get<std::string>());
    }
    if (json.is_object()) {
        if (json.contains("glyph") && json["glyph"].is_string()) {
            return Glyph(json["glyph"].get<std::string>());
        }
        if (json.contains("picture") && json["picture"].is_string()) {
            return Picture(json["picture"].get<std::string>());
        }
    }
    throw ConfigurationError("identity entry must be a string, {\"glyph\": ...} or {\"picture\": ...}: " +
                             json.dump());
}

std::vector<TileIdentity> DefaultIdentities(int count) {
    std::vector<TileIdentity> identities;
    if (count <= 0) {
        return identities;
    }
    identities.reserve(static_cast<std::size_t>(count));
    for (int i = 0; i < count; ++i) {
        std::string text;
        if (i < 26) {
            text.push_back(static_cast<char>('A' + i));
        } else {
            text = std::to_string(i - 25);
        }
        identities.push_back(TileIdentity::Glyph(std::move(text)));
    }
    return identities;
}

}  // namespace pairs::core
