#pragma once

// SceneHandles.h
// Typed handles the scene builder hands to the core. Everything the focus
// coordinator, navigator and pointer resolver address is listed here, so no
// code has to search the scene graph for tagged children.

#include <entt/entt.hpp>
#include <glm/glm.hpp>
#include <array>
#include <cstddef>
#include <functional>
#include <vector>

namespace Atrium::Scene {

class ECS_Registry;

inline constexpr size_t kPanelCount = 4;
inline constexpr size_t kAgentWheelCount = 3;

// Locomotion and gesture sub-parts of the agent
struct AgentParts {
    std::array<entt::entity, kAgentWheelCount> wheels{entt::null, entt::null, entt::null};
    entt::entity wheelBase = entt::null;
    entt::entity leftArm = entt::null;
    entt::entity rightArm = entt::null;
    entt::entity leftShoulder = entt::null;
    entt::entity rightShoulder = entt::null;
    entt::entity head = entt::null;
};

struct AgentHandles {
    entt::entity body = entt::null;
    AgentParts parts;
    entt::entity confirmButton = entt::null;
    entt::entity dismissButton = entt::null;
};

struct PanelHandles {
    entt::entity root = entt::null;
    entt::entity backButton = entt::null;
    entt::entity detailsButton = entt::null;
};

// Built lazily on the first device focus
struct DeviceOverlayHandles {
    entt::entity root = entt::null;
    entt::entity closeButton = entt::null;
    std::vector<entt::entity> linkButtons;

    [[nodiscard]] bool IsBuilt() const { return root != entt::null; }
};

using DeviceOverlayFactory = std::function<DeviceOverlayHandles(ECS_Registry&)>;

struct SceneHandles {
    AgentHandles agent;
    entt::entity device = entt::null;
    std::array<PanelHandles, kPanelCount> panels;
    DeviceOverlayFactory buildDeviceOverlay;
};

} // namespace Atrium::Scene
