#include "Easing.h"
#include <algorithm>
#include <cmath>

namespace Atrium::Animation {

namespace {
constexpr float kPi = 3.14159265358979f;
constexpr float kBackOvershoot = 1.7f;
}

float ApplyEase(Ease ease, float t) {
    t = std::clamp(t, 0.0f, 1.0f);

    switch (ease) {
        case Ease::Linear:
            return t;
        case Ease::Power2In:
            return t * t;
        case Ease::Power2Out:
            return 1.0f - (1.0f - t) * (1.0f - t);
        case Ease::Power2InOut:
            if (t < 0.5f) {
                return 2.0f * t * t;
            } else {
                const float u = -2.0f * t + 2.0f;
                return 1.0f - u * u * 0.5f;
            }
        case Ease::SineInOut:
            return -(std::cos(kPi * t) - 1.0f) * 0.5f;
        case Ease::BackOut: {
            const float u = t - 1.0f;
            return 1.0f + (kBackOvershoot + 1.0f) * u * u * u + kBackOvershoot * u * u;
        }
    }

    return t;
}

const char* EaseName(Ease ease) {
    switch (ease) {
        case Ease::Linear: return "linear";
        case Ease::Power2In: return "power2.in";
        case Ease::Power2Out: return "power2.out";
        case Ease::Power2InOut: return "power2.inOut";
        case Ease::SineInOut: return "sine.inOut";
        case Ease::BackOut: return "back.out";
    }
    return "unknown";
}

} // namespace Atrium::Animation
