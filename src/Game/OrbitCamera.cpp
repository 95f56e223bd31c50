// OrbitCamera.cpp
// Spherical-coordinate orbit around the target, same conventions as the
// agent heading (yaw 0 looks along +Z).

#include "OrbitCamera.h"
#include <algorithm>
#include <cmath>

namespace Atrium::Game {

namespace {
constexpr float kTwoPi = 6.28318530718f;
constexpr float kMinPolar = 0.01f;
}

OrbitCamera::OrbitCamera() : OrbitCamera(CameraConfig{}) {
}

OrbitCamera::OrbitCamera(const CameraConfig& config)
    : m_config(config)
    , m_position(config.homePosition)
    , m_target(config.homeTarget) {
}

float OrbitCamera::GetDistance() const {
    return glm::length(m_position - m_target);
}

glm::vec3 OrbitCamera::GetForward() const {
    const glm::vec3 toTarget = m_target - m_position;
    const float len = glm::length(toTarget);
    return len > 1e-4f ? toTarget / len : glm::vec3(0.0f, 0.0f, -1.0f);
}

glm::vec3 OrbitCamera::GetRight() const {
    const glm::vec3 right = glm::cross(GetForward(), glm::vec3(0.0f, 1.0f, 0.0f));
    const float len = glm::length(right);
    // Looking straight up or down: fall back to world X
    return len > 1e-4f ? right / len : glm::vec3(1.0f, 0.0f, 0.0f);
}

void OrbitCamera::Orbit(float deltaXPixels, float deltaYPixels) {
    RotateAroundTarget(-deltaXPixels * m_config.rotateSensitivity,
                       -deltaYPixels * m_config.rotateSensitivity);
}

void OrbitCamera::Pan(float deltaXPixels, float deltaYPixels) {
    const glm::vec3 right = GetRight();
    const glm::vec3 up = glm::cross(right, GetForward());

    // Grab-the-scene feel: content follows the pointer
    const float scale = m_config.panSensitivity * std::max(GetDistance(), m_config.minDistance);
    const glm::vec3 offset = (-deltaXPixels * right + deltaYPixels * up) * scale;
    m_position += offset;
    m_target += offset;
}

void OrbitCamera::Zoom(float wheelDelta) {
    const float distance = GetDistance();
    if (distance < 1e-4f || wheelDelta == 0.0f) return;

    const float factor = std::exp(wheelDelta * m_config.zoomSensitivity);
    const float newDistance = std::clamp(distance * factor, m_config.minDistance, m_config.maxDistance);
    m_position = m_target + (m_position - m_target) * (newDistance / distance);
}

void OrbitCamera::Update(float deltaSeconds) {
    if (!m_autoRotate || deltaSeconds <= 0.0f) return;

    // Speed 1.0 = one full orbit per minute
    const float deltaYaw = kTwoPi / 60.0f * m_config.autoRotateSpeed * deltaSeconds;
    RotateAroundTarget(deltaYaw, 0.0f);
}

void OrbitCamera::RotateAroundTarget(float deltaYaw, float deltaPitch) {
    const glm::vec3 offset = m_position - m_target;
    const float radius = glm::length(offset);
    if (radius < 1e-4f) return;

    // Polar angle measured from +Y
    float yaw = std::atan2(offset.x, offset.z);
    float polar = std::acos(std::clamp(offset.y / radius, -1.0f, 1.0f));

    yaw += deltaYaw;
    polar = std::clamp(polar + deltaPitch, kMinPolar, m_config.maxPolarAngle);

    m_position = m_target + glm::vec3(
        radius * std::sin(polar) * std::sin(yaw),
        radius * std::cos(polar),
        radius * std::sin(polar) * std::cos(yaw));
}

} // namespace Atrium::Game
