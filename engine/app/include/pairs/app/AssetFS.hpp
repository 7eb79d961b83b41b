#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace pairs::app {

bool FileExists(const std::filesystem::path& path);

// Directories searched for assets, nearest first: "assets" folders above the
// working directory, then PAIRS_ASSETS, then the executable's directory.
const std::vector<std::filesystem::path>& AssetRoots();

// First existing root / filename, or filename unchanged when none matches.
std::filesystem::path AssetPath(const std::string& filename);

}  // namespace pairs::app
