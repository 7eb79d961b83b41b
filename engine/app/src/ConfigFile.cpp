#include "pairs/app/ConfigFile.hpp"

#include <SDL2/SDL.h>

#include <fstream>
#include <sstream>

#include "pairs/app/AssetFS.hpp"
#include "pairs/core/Errors.hpp"

namespace pairs::app {

pairs::core::GameConfig LoadGameConfig(const std::filesystem::path& explicit_path) {
    std::filesystem::path path = explicit_path;
    if (path.empty()) {
        path = AssetPath("pairs.json");
        if (!FileExists(path)) {
            SDL_Log("No pairs.json found, using built-in defaults");
            pairs::core::GameConfig defaults;
            defaults.Validate();
            return defaults;
        }
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw pairs::core::ConfigurationError("cannot open config " + path.string());
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();

    auto config = pairs::core::GameConfig::Deserialize(buffer.str());
    config.Validate();
    SDL_Log("Loaded config %s", path.string().c_str());
    return config;
}

}  // namespace pairs::app
