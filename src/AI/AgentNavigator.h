#pragma once

// AgentNavigator.h
// Cosmetic wandering for the autonomous agent: timed retargeting by
// rejection sampling, straight-line moves with collision-triggered
// retargets, rolling wheels and a walk gesture cycle. The focus coordinator
// suspends it while the help dialogue is open.

#include "ObstacleMap.h"
#include "Scene/SceneHandles.h"
#include <glm/glm.hpp>
#include <cstdint>
#include <random>

namespace Atrium::Animation {
class TweenSystem;
}

namespace Atrium::Scene {
class ECS_Registry;
}

namespace Atrium::AI {

enum class AgentMotionState : uint8_t {
    Idle,
    Moving,
    Suspended
};

[[nodiscard]] const char* AgentMotionStateName(AgentMotionState state);

struct NavigatorParams {
    float moveSpeed = 0.03f;            // World units per tick
    float agentRadius = ObstacleMap::kDefaultAgentRadius;
    float wheelRadius = 0.4f;
    float arrivalDistance = 1.0f;
    double retargetMinMs = 3000.0;
    double retargetMaxMs = 5000.0;
    float headingSmoothing = 0.1f;      // Fraction of the remaining turn per tick
    uint32_t maxAttempts = ObstacleMap::kDefaultMaxAttempts;
    uint32_t seed = 0;                  // 0 = seed from std::random_device
    glm::vec2 start{-25.0f, 20.0f};     // Preferred spawn (x, z)
};

struct AgentState {
    glm::vec2 position{0.0f};           // (x, z)
    float heading = 0.0f;               // Radians about +Y; 0 faces +Z
    AgentMotionState motion = AgentMotionState::Idle;
    glm::vec2 targetPosition{0.0f};
    float moveSpeed = 0.03f;
    double lastRetargetMs = 0.0;
    double retargetIntervalMs = 0.0;    // Drawn once per retarget cycle

    uint32_t retargetCount = 0;         // Timer retargets
    uint32_t collisionRetargets = 0;
    float wheelSpin = 0.0f;             // Accumulated wheel rotation (radians)
    float distanceTravelled = 0.0f;
    float walkPhase = 0.0f;
};

class AgentNavigator {
public:
    AgentNavigator(const ObstacleMap& obstacles,
                   Animation::TweenSystem& tweens,
                   const NavigatorParams& params);

    // Optional: mirror position/heading/gestures into the scene
    void BindScene(Scene::ECS_Registry* registry, const Scene::AgentHandles& handles);

    // Place the agent and make a retarget due on the next tick
    void Reset(const glm::vec2& position, double nowMs);

    // Start at params.start if it is free, else at a sampled free point
    void Spawn(double nowMs);

    void Update(double nowMs);

    // Freeze retargeting and stop in place (help dialogue open)
    void Suspend();
    // Resume wandering; a new target is chosen on the next tick
    void Resume(double nowMs);

    // Smoothly turn toward a world point. Only honoured while suspended.
    void FaceTowards(const glm::vec3& point);

    [[nodiscard]] const AgentState& GetState() const { return m_state; }
    [[nodiscard]] AgentMotionState GetMotionState() const { return m_state.motion; }
    [[nodiscard]] bool IsSuspended() const { return m_state.motion == AgentMotionState::Suspended; }
    [[nodiscard]] glm::vec3 GetWorldPosition() const;
    [[nodiscard]] const NavigatorParams& GetParams() const { return m_params; }
    [[nodiscard]] const ObstacleMap& GetObstacles() const { return m_obstacles; }

private:
    void Retarget(double nowMs);
    void StepTowardsTarget(double deltaMs);
    void StopLocomotion();
    void ApplyWalkCycle();
    void SyncScene();

    double DrawRetargetInterval();

    const ObstacleMap& m_obstacles;
    Animation::TweenSystem& m_tweens;
    NavigatorParams m_params;
    AgentState m_state;
    std::mt19937 m_rng;

    Scene::ECS_Registry* m_registry = nullptr;
    Scene::AgentHandles m_handles;

    double m_lastUpdateMs = -1.0;
};

} // namespace Atrium::AI
