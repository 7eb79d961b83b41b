#pragma once

#include <filesystem>

#include "pairs/core/GameConfig.hpp"

namespace pairs::app {

// Reads and validates a config file. An empty path searches the asset roots
// for pairs.json; when no file is found the defaults are returned. Throws
// ConfigurationError for an unreadable, malformed or invalid file.
pairs::core::GameConfig LoadGameConfig(const std::filesystem::path& explicit_path);

}  // namespace pairs::app
