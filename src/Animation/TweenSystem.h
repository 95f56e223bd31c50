#pragma once

// TweenSystem.h
// Time-driven property interpolation sampled once per frame.
//
// A tween is keyed by the address of the property it writes. Starting a new
// tween on a property cancels whichever tween currently owns it, which is how
// one focus transition pre-empts another without extra bookkeeping.
// Completion callbacks of cancelled tweens never run.

#include "Easing.h"
#include <glm/glm.hpp>
#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

namespace Atrium::Animation {

using TweenHandle = uint64_t;
inline constexpr TweenHandle kInvalidTween = 0;

struct TweenParams {
    double durationMs = 500.0;
    double delayMs = 0.0;
    Ease ease = Ease::Power2InOut;

    // Called after the property was written on each sampled frame
    std::function<void()> onUpdate;
    // Called once after the final write
    std::function<void()> onComplete;
};

class TweenSystem {
public:
    TweenSystem() = default;
    ~TweenSystem() = default;

    TweenSystem(const TweenSystem&) = delete;
    TweenSystem& operator=(const TweenSystem&) = delete;

    // The start value is captured when the tween first samples (after its delay)
    TweenHandle To(float* property, float to, TweenParams params);
    TweenHandle To(glm::vec3* property, const glm::vec3& to, TweenParams params);

    // Explicit start value, applied when the tween first samples
    TweenHandle FromTo(float* property, float from, float to, TweenParams params);

    void Cancel(TweenHandle handle);
    void KillTweensOf(const void* property);

    [[nodiscard]] bool IsActive(TweenHandle handle) const;
    [[nodiscard]] bool IsAnimating(const void* property) const;
    [[nodiscard]] size_t GetActiveCount() const;

    // Advance every tween to `nowMs` (monotonic). Callbacks run after all
    // properties were written, so they may start or cancel tweens freely.
    void Update(double nowMs);

    // Time of the most recent Update; new tweens start from here
    [[nodiscard]] double GetNow() const { return m_nowMs; }

private:
    enum class ValueKind : uint8_t { Scalar, Vector };

    struct Tween {
        TweenHandle handle = kInvalidTween;
        const void* property = nullptr;
        ValueKind kind = ValueKind::Scalar;

        float* scalar = nullptr;
        glm::vec3* vector = nullptr;
        float fromScalar = 0.0f;
        float toScalar = 0.0f;
        glm::vec3 fromVector{0.0f};
        glm::vec3 toVector{0.0f};
        std::optional<float> explicitFrom;

        double startMs = 0.0;
        TweenParams params;
        bool started = false;
        bool finished = false;
        bool cancelled = false;
    };

    TweenHandle Start(Tween tween);
    static void Sample(Tween& tween, float eased);

    std::vector<Tween> m_tweens;
    TweenHandle m_nextHandle = 1;
    double m_nowMs = 0.0;
};

} // namespace Atrium::Animation
