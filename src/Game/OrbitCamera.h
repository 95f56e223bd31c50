#pragma once

// OrbitCamera.h
// Orbit-style camera rig: a position looking at an orbit target, with
// optional ambient drift around the target's vertical axis. Focus
// transitions tween `position` and `target` directly.

#include <glm/glm.hpp>

namespace Atrium::Game {

struct CameraConfig {
    glm::vec3 homePosition{0.0f, 8.0f, 12.0f};
    glm::vec3 homeTarget{0.0f, 5.0f, -1.5f};
    float autoRotateSpeed = 0.5f;       // 1.0 = one orbit per 60 s
    float minDistance = 5.0f;
    float maxDistance = 50.0f;
    float maxPolarAngle = 2.3561945f;   // 0.75 * pi
    float rotateSensitivity = 0.005f;   // Radians per pixel of drag
    float zoomSensitivity = 0.001f;     // Log-distance per wheel unit
    float panSensitivity = 0.002f;      // Target travel per pixel, per unit of distance
};

class OrbitCamera {
public:
    OrbitCamera();
    explicit OrbitCamera(const CameraConfig& config);
    ~OrbitCamera() = default;

    OrbitCamera(const OrbitCamera&) = delete;
    OrbitCamera& operator=(const OrbitCamera&) = delete;

    void SetPosition(const glm::vec3& pos) { m_position = pos; }
    void SetTarget(const glm::vec3& target) { m_target = target; }

    [[nodiscard]] const glm::vec3& GetPosition() const { return m_position; }
    [[nodiscard]] const glm::vec3& GetTarget() const { return m_target; }
    [[nodiscard]] float GetDistance() const;
    [[nodiscard]] glm::vec3 GetForward() const;
    [[nodiscard]] glm::vec3 GetRight() const;

    // Tween endpoints; addresses stay valid for the rig's lifetime
    glm::vec3* PositionProperty() { return &m_position; }
    glm::vec3* TargetProperty() { return &m_target; }

    // Ambient drift
    void SetAutoRotate(bool enabled) { m_autoRotate = enabled; }
    [[nodiscard]] bool IsAutoRotating() const { return m_autoRotate; }

    // User input. Drags are in pixels; positive wheel deltas move away.
    void Orbit(float deltaXPixels, float deltaYPixels);
    void Pan(float deltaXPixels, float deltaYPixels);
    void Zoom(float wheelDelta);

    // Apply drift
    void Update(float deltaSeconds);

    [[nodiscard]] const CameraConfig& GetConfig() const { return m_config; }

private:
    void RotateAroundTarget(float deltaYaw, float deltaPitch);

    CameraConfig m_config;
    glm::vec3 m_position{0.0f, 8.0f, 12.0f};
    glm::vec3 m_target{0.0f, 5.0f, -1.5f};
    bool m_autoRotate = true;
};

} // namespace Atrium::Game
