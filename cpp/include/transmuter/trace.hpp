#pragma once

#include <cstdlib>
#include <string>

namespace transmuter {

// TRACE=1 turns on single-line "TRACE <tag> key=value" records on stdout
inline bool trace_enabled() {
    static const bool enabled = (std::getenv("TRACE") && std::string(std::getenv("TRACE")) == "1");
    return enabled;
}

} // namespace transmuter
