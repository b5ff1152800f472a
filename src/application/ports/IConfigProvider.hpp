#pragma once
#include <string>
#include "domain/Settings.hpp"

namespace sentinel::discovery::application::ports {

// Source of Settings. A missing or unreadable file is replaced by a default one
// and never surfaces as an error; out-of-range values come back normalized.
struct IConfigProvider {
    virtual ~IConfigProvider() = default;
    virtual sentinel::discovery::domain::Settings load_or_create(const std::string& path) = 0;
};

} // namespace sentinel::discovery::application::ports
