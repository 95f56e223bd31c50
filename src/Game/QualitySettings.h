#pragma once

// Visual-quality configuration produced by the adaptive quality controller.
// Applied once per change; the core never samples frame rate itself.

namespace Atrium::Game {

struct QualitySettings {
    float pixelDensity = 1.0f;
    bool shadowsEnabled = true;
    bool particlesEnabled = true;
    bool decorationsEnabled = true;

    bool operator==(const QualitySettings& other) const {
        return pixelDensity == other.pixelDensity &&
               shadowsEnabled == other.shadowsEnabled &&
               particlesEnabled == other.particlesEnabled &&
               decorationsEnabled == other.decorationsEnabled;
    }
    bool operator!=(const QualitySettings& other) const { return !(*this == other); }
};

} // namespace Atrium::Game
