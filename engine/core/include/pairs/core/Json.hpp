#pragma once

#include <nlohmann/json.hpp>

namespace pairs::core {

using Json = nlohmann::json;

}  // namespace pairs::core
