#pragma once

// HologramPanels.h
// The four informational panels around the office. Owns orientation
// (facing the camera or the scene centre), content reveal/hide animations,
// per-panel affordance visibility and the camera-tracking flag.
// Every operation bounds-checks the index and degrades to a no-op.

#include "Scene/SceneHandles.h"
#include <glm/glm.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace Atrium::Animation {
class TweenSystem;
}

namespace Atrium::Scene {
class ECS_Registry;
}

namespace Atrium::Game {

class HologramPanels {
public:
    HologramPanels(Scene::ECS_Registry& registry,
                   const std::array<Scene::PanelHandles, Scene::kPanelCount>& panels,
                   Animation::TweenSystem& tweens);

    [[nodiscard]] bool IsValidIndex(int32_t index) const;
    [[nodiscard]] int32_t GetCount() const { return static_cast<int32_t>(Scene::kPanelCount); }

    // Instant yaw correction toward a world point (XZ only)
    void FaceTowards(int32_t index, const glm::vec3& point);

    // Animate back to facing the scene centre
    void ResetOrientation(int32_t index);

    // Title moves up, subtitle/preview fade and scale in, then back and
    // details buttons pop in, staggered.
    void ShowContent(int32_t index);

    // Faster fade-out; logical visibility flips immediately
    void HideContent(int32_t index);
    void HideAllContent();

    void SetTracking(int32_t index, bool tracking);
    [[nodiscard]] bool IsTracking(int32_t index) const;
    [[nodiscard]] bool IsContentVisible(int32_t index) const;

    // Back/details buttons currently pickable
    [[nodiscard]] std::vector<entt::entity> GetVisibleAffordances(int32_t index) const;

    [[nodiscard]] glm::vec3 GetWorldPosition(int32_t index) const;
    [[nodiscard]] float GetYaw(int32_t index) const;
    [[nodiscard]] float GetRestYaw(int32_t index) const;
    [[nodiscard]] std::string GetSection(int32_t index) const;
    [[nodiscard]] int32_t FindBySection(const std::string& section) const;

    // Camera position `distance` units in front of the panel along its rest
    // facing axis, at panel height
    [[nodiscard]] glm::vec3 GetFrontCameraPosition(int32_t index, float distance) const;

    // Yaw that faces `point` from the panel
    [[nodiscard]] static float YawTowards(const glm::vec3& from, const glm::vec3& point);

private:
    const Scene::PanelHandles* Handles(int32_t index) const;

    Scene::ECS_Registry& m_registry;
    std::array<Scene::PanelHandles, Scene::kPanelCount> m_panels;
    Animation::TweenSystem& m_tweens;
};

} // namespace Atrium::Game
