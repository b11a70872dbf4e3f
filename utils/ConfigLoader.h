#pragma once
#include "../sim/SimConfig.h"
#include <string>

namespace ConfigLoader {
    // Overlays every recognised key in text onto cfg, then clamps values to
    // their usable ranges. Returns the number of keys applied.
    int parseSimConfig(const std::string& text, SimConfig& cfg);

    // Reads path and parses it. A missing or unreadable file leaves cfg at its
    // current values and returns false.
    bool loadSimConfig(const std::string& path, SimConfig& cfg);

    // Clamps out-of-range values in place, logging each change. Returns the
    // number of values changed.
    int sanitize(SimConfig& cfg);
}
