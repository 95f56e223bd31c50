#pragma once

#include <cstdint>

namespace Atrium::Animation {

// Easing curves used by scene transitions
enum class Ease : uint8_t {
    Linear,
    Power2In,
    Power2Out,
    Power2InOut,
    SineInOut,
    BackOut      // Overshoot 1.7
};

// Maps normalized time [0,1] to eased progress. Input is clamped.
[[nodiscard]] float ApplyEase(Ease ease, float t);

[[nodiscard]] const char* EaseName(Ease ease);

} // namespace Atrium::Animation
