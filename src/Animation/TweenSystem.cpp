#include "TweenSystem.h"
#include <algorithm>
#include <utility>

namespace Atrium::Animation {

TweenHandle TweenSystem::To(float* property, float to, TweenParams params) {
    if (!property) return kInvalidTween;

    Tween tween;
    tween.property = property;
    tween.kind = ValueKind::Scalar;
    tween.scalar = property;
    tween.toScalar = to;
    tween.params = std::move(params);
    return Start(std::move(tween));
}

TweenHandle TweenSystem::To(glm::vec3* property, const glm::vec3& to, TweenParams params) {
    if (!property) return kInvalidTween;

    Tween tween;
    tween.property = property;
    tween.kind = ValueKind::Vector;
    tween.vector = property;
    tween.toVector = to;
    tween.params = std::move(params);
    return Start(std::move(tween));
}

TweenHandle TweenSystem::FromTo(float* property, float from, float to, TweenParams params) {
    if (!property) return kInvalidTween;

    Tween tween;
    tween.property = property;
    tween.kind = ValueKind::Scalar;
    tween.scalar = property;
    tween.explicitFrom = from;
    tween.toScalar = to;
    tween.params = std::move(params);
    return Start(std::move(tween));
}

TweenHandle TweenSystem::Start(Tween tween) {
    // Newest request on a property wins
    for (auto& existing : m_tweens) {
        if (existing.property == tween.property && existing.kind == tween.kind &&
            !existing.finished && !existing.cancelled) {
            existing.cancelled = true;
        }
    }

    tween.handle = m_nextHandle++;
    tween.startMs = m_nowMs;
    const TweenHandle handle = tween.handle;
    m_tweens.push_back(std::move(tween));
    return handle;
}

void TweenSystem::Cancel(TweenHandle handle) {
    if (handle == kInvalidTween) return;

    for (auto& tween : m_tweens) {
        if (tween.handle == handle) {
            tween.cancelled = true;
            return;
        }
    }
}

void TweenSystem::KillTweensOf(const void* property) {
    for (auto& tween : m_tweens) {
        if (tween.property == property) {
            tween.cancelled = true;
        }
    }
}

bool TweenSystem::IsActive(TweenHandle handle) const {
    if (handle == kInvalidTween) return false;

    return std::any_of(m_tweens.begin(), m_tweens.end(), [handle](const Tween& t) {
        return t.handle == handle && !t.cancelled && !t.finished;
    });
}

bool TweenSystem::IsAnimating(const void* property) const {
    return std::any_of(m_tweens.begin(), m_tweens.end(), [property](const Tween& t) {
        return t.property == property && !t.cancelled && !t.finished;
    });
}

size_t TweenSystem::GetActiveCount() const {
    return static_cast<size_t>(std::count_if(m_tweens.begin(), m_tweens.end(), [](const Tween& t) {
        return !t.cancelled && !t.finished;
    }));
}

void TweenSystem::Sample(Tween& tween, float eased) {
    if (tween.kind == ValueKind::Scalar) {
        *tween.scalar = tween.fromScalar + (tween.toScalar - tween.fromScalar) * eased;
    } else {
        *tween.vector = tween.fromVector + (tween.toVector - tween.fromVector) * eased;
    }
}

void TweenSystem::Update(double nowMs) {
    m_nowMs = std::max(m_nowMs, nowMs);

    struct PendingCallback {
        TweenHandle handle;
        bool finished;
        std::function<void()> onUpdate;
        std::function<void()> onComplete;
    };
    std::vector<PendingCallback> pending;

    for (auto& tween : m_tweens) {
        if (tween.cancelled || tween.finished) continue;

        const double elapsed = m_nowMs - tween.startMs - tween.params.delayMs;
        if (elapsed < 0.0) continue;

        if (!tween.started) {
            tween.started = true;
            if (tween.kind == ValueKind::Scalar) {
                tween.fromScalar = tween.explicitFrom.value_or(*tween.scalar);
            } else {
                tween.fromVector = *tween.vector;
            }
        }

        float t = 1.0f;
        if (tween.params.durationMs > 0.0) {
            t = static_cast<float>(std::min(1.0, elapsed / tween.params.durationMs));
        }

        Sample(tween, ApplyEase(tween.params.ease, t));
        if (t >= 1.0f) {
            // Land exactly on the target regardless of the curve's rounding
            if (tween.kind == ValueKind::Scalar) {
                *tween.scalar = tween.toScalar;
            } else {
                *tween.vector = tween.toVector;
            }
            tween.finished = true;
        }

        if (tween.params.onUpdate || (tween.finished && tween.params.onComplete)) {
            pending.push_back({tween.handle, tween.finished, tween.params.onUpdate,
                               tween.finished ? tween.params.onComplete : nullptr});
        }
    }

    m_tweens.erase(std::remove_if(m_tweens.begin(), m_tweens.end(), [](const Tween& t) {
        return t.cancelled || t.finished;
    }), m_tweens.end());

    for (auto& callback : pending) {
        // A callback earlier in this frame may have cancelled a running tween
        if (!callback.finished && !IsActive(callback.handle)) continue;

        if (callback.onUpdate) callback.onUpdate();
        if (callback.onComplete) callback.onComplete();
    }
}

} // namespace Atrium::Animation
