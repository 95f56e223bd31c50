#include "AgentNavigator.h"
#include "Animation/TweenSystem.h"
#include "Scene/ECS_Registry.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>

namespace Atrium::AI {

namespace {

constexpr float kPi = 3.14159265358979f;
constexpr float kTwoPi = 2.0f * kPi;

// One arm swing (there and back) every 2.4 s
constexpr float kWalkCycleRadPerMs = kTwoPi / 2400.0f;

constexpr double kGestureResetMs = 800.0;

// Sampling rounds before giving up on a blocked start point
constexpr int kSpawnRounds = 16;

float WrapAngle(float angle) {
    angle = std::fmod(angle + kPi, kTwoPi);
    if (angle < 0.0f) angle += kTwoPi;
    return angle - kPi;
}

// Exponential step along the shorter arc
float SmoothAngle(float from, float to, float factor) {
    return WrapAngle(from + WrapAngle(to - from) * factor);
}

} // namespace

const char* AgentMotionStateName(AgentMotionState state) {
    switch (state) {
        case AgentMotionState::Idle: return "Idle";
        case AgentMotionState::Moving: return "Moving";
        case AgentMotionState::Suspended: return "Suspended";
    }
    return "Unknown";
}

AgentNavigator::AgentNavigator(const ObstacleMap& obstacles,
                               Animation::TweenSystem& tweens,
                               const NavigatorParams& params)
    : m_obstacles(obstacles)
    , m_tweens(tweens)
    , m_params(params) {
    if (m_params.seed != 0) {
        m_rng.seed(m_params.seed);
    } else {
        std::random_device rd;
        m_rng.seed(rd());
    }
    if (m_params.retargetMaxMs < m_params.retargetMinMs) {
        spdlog::warn("[Navigator] retargetMaxMs {} < retargetMinMs {}; clamping",
                     m_params.retargetMaxMs, m_params.retargetMinMs);
        m_params.retargetMaxMs = m_params.retargetMinMs;
    }
    m_state.moveSpeed = m_params.moveSpeed;
}

void AgentNavigator::BindScene(Scene::ECS_Registry* registry, const Scene::AgentHandles& handles) {
    m_registry = registry;
    m_handles = handles;
    SyncScene();
}

void AgentNavigator::Reset(const glm::vec2& position, double nowMs) {
    m_state.position = position;
    m_state.targetPosition = position;
    m_state.motion = AgentMotionState::Idle;
    m_state.retargetIntervalMs = DrawRetargetInterval();
    m_state.lastRetargetMs = nowMs - m_state.retargetIntervalMs - 1.0;
    m_lastUpdateMs = nowMs;
    SyncScene();
}

void AgentNavigator::Spawn(double nowMs) {
    const glm::vec2 preferred = m_params.start;
    if (!m_obstacles.IsBlocked(preferred.x, preferred.y, m_params.agentRadius)) {
        Reset(preferred, nowMs);
    } else {
        FreePositionResult free;
        for (int round = 0; round < kSpawnRounds && !free.found; ++round) {
            free = m_obstacles.FindFreePosition(preferred.x, preferred.y, m_rng,
                                                m_params.maxAttempts, m_params.agentRadius);
        }
        if (!free.found) {
            spdlog::warn("[Navigator] Start ({:.1f}, {:.1f}) is blocked and {} sampling rounds found no free spawn; "
                         "agent stays in place", preferred.x, preferred.y, kSpawnRounds);
        }
        Reset(free.found ? free.position : preferred, nowMs);
    }
    spdlog::info("[Navigator] Agent spawned at ({:.1f}, {:.1f})", m_state.position.x, m_state.position.y);
}

double AgentNavigator::DrawRetargetInterval() {
    std::uniform_real_distribution<double> dist(m_params.retargetMinMs, m_params.retargetMaxMs);
    return dist(m_rng);
}

void AgentNavigator::Update(double nowMs) {
    const double deltaMs = m_lastUpdateMs < 0.0 ? 0.0 : std::max(0.0, nowMs - m_lastUpdateMs);
    m_lastUpdateMs = nowMs;

    if (m_state.motion == AgentMotionState::Suspended) {
        SyncScene();
        return;
    }

    if (nowMs - m_state.lastRetargetMs > m_state.retargetIntervalMs) {
        Retarget(nowMs);
    }

    if (m_state.motion == AgentMotionState::Moving) {
        StepTowardsTarget(deltaMs);
    }

    SyncScene();
}

void AgentNavigator::Retarget(double nowMs) {
    const auto result = m_obstacles.FindFreePosition(m_state.position.x, m_state.position.y, m_rng,
                                                     m_params.maxAttempts, m_params.agentRadius);
    if (!result.found) {
        spdlog::debug("[Navigator] No free position after {} samples, holding at ({:.1f}, {:.1f})",
                      result.attempts, m_state.position.x, m_state.position.y);
    }

    m_state.targetPosition = result.position;
    m_state.lastRetargetMs = nowMs;
    m_state.retargetIntervalMs = DrawRetargetInterval();
    ++m_state.retargetCount;

    if (m_state.motion != AgentMotionState::Moving) {
        m_state.motion = AgentMotionState::Moving;

        // Gesture parts are driven directly while walking
        if (m_registry) {
            const auto& parts = m_handles.parts;
            for (entt::entity part : {parts.leftArm, parts.rightArm, parts.leftShoulder,
                                      parts.rightShoulder, parts.wheelBase, m_handles.body}) {
                if (auto* transform = m_registry->TryGetComponent<Scene::TransformComponent>(part)) {
                    m_tweens.KillTweensOf(&transform->rotation.x);
                    m_tweens.KillTweensOf(&transform->rotation.y);
                    m_tweens.KillTweensOf(&transform->rotation.z);
                }
            }
        }
    }

    spdlog::debug("[Navigator] Retarget #{} -> ({:.1f}, {:.1f}), next in {:.0f} ms",
                  m_state.retargetCount, m_state.targetPosition.x, m_state.targetPosition.y,
                  m_state.retargetIntervalMs);
}

void AgentNavigator::StepTowardsTarget(double deltaMs) {
    const glm::vec2 toTarget = m_state.targetPosition - m_state.position;
    const float distance = glm::length(toTarget);

    if (distance <= m_params.arrivalDistance) {
        m_state.motion = AgentMotionState::Idle;
        StopLocomotion();
        return;
    }

    const glm::vec2 next = m_state.position + (toTarget / distance) * m_state.moveSpeed;

    if (m_obstacles.IsBlocked(next.x, next.y, m_params.agentRadius)) {
        // Abandon the target; no sliding along the obstacle
        const auto result = m_obstacles.FindFreePosition(m_state.position.x, m_state.position.y, m_rng,
                                                         m_params.maxAttempts, m_params.agentRadius);
        m_state.targetPosition = result.position;
        ++m_state.collisionRetargets;
        return;
    }

    const glm::vec2 previous = m_state.position;
    m_state.position = next;

    // Rolling without slipping
    const float travelled = glm::length(m_state.position - previous);
    m_state.wheelSpin += travelled / m_params.wheelRadius;
    m_state.distanceTravelled += travelled;

    const float desiredHeading = std::atan2(toTarget.x, toTarget.y);
    m_state.heading = SmoothAngle(m_state.heading, desiredHeading, m_params.headingSmoothing);

    m_state.walkPhase = std::fmod(m_state.walkPhase + static_cast<float>(deltaMs) * kWalkCycleRadPerMs, kTwoPi);
    ApplyWalkCycle();
}

void AgentNavigator::ApplyWalkCycle() {
    if (!m_registry) return;

    const auto& parts = m_handles.parts;
    const float phase = m_state.walkPhase;
    const float swing = std::sin(phase);

    if (auto* arm = m_registry->TryGetComponent<Scene::TransformComponent>(parts.leftArm)) {
        arm->rotation.x = 0.3f * swing;
        arm->rotation.z = 0.1f * swing;
    }
    if (auto* arm = m_registry->TryGetComponent<Scene::TransformComponent>(parts.rightArm)) {
        arm->rotation.x = -0.3f * swing;
        arm->rotation.z = -0.1f * swing;
    }

    // Shoulders run on a 3 s cycle against the arms' 2.4 s
    const float shoulder = 0.2f * std::sin(phase * 0.8f);
    if (auto* s = m_registry->TryGetComponent<Scene::TransformComponent>(parts.leftShoulder)) {
        s->rotation.y = shoulder;
    }
    if (auto* s = m_registry->TryGetComponent<Scene::TransformComponent>(parts.rightShoulder)) {
        s->rotation.y = -shoulder;
    }

    if (auto* body = m_registry->TryGetComponent<Scene::TransformComponent>(m_handles.body)) {
        body->rotation.x = 0.025f * (1.0f - std::cos(phase * 1.2f));
    }
    if (auto* base = m_registry->TryGetComponent<Scene::TransformComponent>(parts.wheelBase)) {
        base->rotation.x = 0.01f * (1.0f - std::cos(phase * 2.0f));
    }
}

void AgentNavigator::StopLocomotion() {
    m_state.walkPhase = 0.0f;
    if (!m_registry) return;

    Animation::TweenParams reset;
    reset.durationMs = kGestureResetMs;
    reset.ease = Animation::Ease::BackOut;

    const auto& parts = m_handles.parts;
    auto settle = [&](entt::entity part, const glm::vec3& neutral) {
        auto* transform = m_registry->TryGetComponent<Scene::TransformComponent>(part);
        if (!transform) return;
        m_tweens.To(&transform->rotation.x, neutral.x, reset);
        m_tweens.To(&transform->rotation.z, neutral.z, reset);
        if (part != m_handles.body) {
            m_tweens.To(&transform->rotation.y, neutral.y, reset);
        }
    };

    settle(parts.leftArm, glm::vec3(0.0f));
    settle(parts.rightArm, glm::vec3(0.0f));
    settle(parts.leftShoulder, glm::vec3(0.2f, 0.0f, 0.0f));
    settle(parts.rightShoulder, glm::vec3(-0.2f, 0.0f, 0.0f));
    settle(parts.head, glm::vec3(0.0f));
    settle(parts.wheelBase, glm::vec3(0.0f));
    settle(m_handles.body, glm::vec3(0.0f));
}

void AgentNavigator::Suspend() {
    if (m_state.motion == AgentMotionState::Suspended) return;

    if (m_state.motion == AgentMotionState::Moving) {
        StopLocomotion();
    }
    m_state.motion = AgentMotionState::Suspended;
    m_state.targetPosition = m_state.position;
    spdlog::debug("[Navigator] Suspended at ({:.1f}, {:.1f})", m_state.position.x, m_state.position.y);
}

void AgentNavigator::Resume(double nowMs) {
    if (m_state.motion != AgentMotionState::Suspended) return;

    m_state.motion = AgentMotionState::Idle;
    // Far enough in the past that the next tick retargets
    m_state.lastRetargetMs = nowMs - m_params.retargetMaxMs - 1.0;
    m_state.retargetIntervalMs = m_params.retargetMaxMs;
    spdlog::debug("[Navigator] Resumed");
}

void AgentNavigator::FaceTowards(const glm::vec3& point) {
    if (m_state.motion != AgentMotionState::Suspended) return;

    const float dx = point.x - m_state.position.x;
    const float dz = point.z - m_state.position.y;
    if (dx * dx + dz * dz < 1e-6f) return;

    m_state.heading = SmoothAngle(m_state.heading, std::atan2(dx, dz), m_params.headingSmoothing);
}

glm::vec3 AgentNavigator::GetWorldPosition() const {
    return glm::vec3(m_state.position.x, 0.0f, m_state.position.y);
}

void AgentNavigator::SyncScene() {
    if (!m_registry) return;

    if (auto* body = m_registry->TryGetComponent<Scene::TransformComponent>(m_handles.body)) {
        body->position.x = m_state.position.x;
        body->position.z = m_state.position.y;
        body->rotation.y = m_state.heading;
    }

    const float wheelAngle = std::fmod(m_state.wheelSpin, kTwoPi);
    for (entt::entity wheel : m_handles.parts.wheels) {
        if (auto* transform = m_registry->TryGetComponent<Scene::TransformComponent>(wheel)) {
            transform->rotation.y = wheelAngle;
        }
    }
}

} // namespace Atrium::AI
