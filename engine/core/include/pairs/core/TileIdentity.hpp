#pragma once

#include <string>
#include <vector>

#include "pairs/core/Json.hpp"

namespace pairs::core {

// What a tile shows when face up. Two identities are equal only when both the
// kind and the payload match.
struct TileIdentity {
    enum class Kind { Glyph, Picture };

    Kind kind = Kind::Glyph;
    std::string value;

    static TileIdentity Glyph(std::string text);
    static TileIdentity Picture(std::string asset_path);

    bool isPicture() const noexcept { return kind == Kind::Picture; }

    // Text used when drawing a glyph, or as fallback for a picture that failed to load.
    std::string label() const;

    bool operator==(const TileIdentity& other) const noexcept {
        return kind == other.kind && value == other.value;
    }

    bool operator!=(const TileIdentity& other) const noexcept {
        return !(*this == other);
    }

    bool operator<(const TileIdentity& other) const noexcept {
        return kind < other.kind || (kind == other.kind && value < other.value);
    }

    Json ToJson() const;
    static TileIdentity FromJson(const Json& json);
};

std::vector<TileIdentity> DefaultIdentities(int count);

}  // namespace pairs::core
