#pragma once

#include <stdexcept>
#include <string>

namespace pairs::core {

// Raised while setting up a round; never raised once play has started.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what) : std::runtime_error(what) {}
};

}  // namespace pairs::core
