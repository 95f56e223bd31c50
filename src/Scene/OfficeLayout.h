#pragma once

// OfficeLayout.h
// Builds the office scene into the registry and returns typed handles to
// everything the core addresses. Geometry is represented by tagged
// transforms only; meshes and materials belong to the renderer.

#include "SceneHandles.h"
#include <glm/glm.hpp>
#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace Atrium::Scene {

class ECS_Registry;

struct OfficeLinkDesc {
    std::string label;
    std::string url;
};

struct OfficeLayoutDesc {
    glm::vec2 agentStart{-25.0f, 20.0f};           // (x, z)
    glm::vec3 devicePosition{-4.2f, 2.95f, 1.8f};

    std::array<glm::vec3, kPanelCount> panelPositions{
        glm::vec3(-25.0f, 10.0f, 0.0f),
        glm::vec3(0.0f, 10.0f, -30.0f),
        glm::vec3(25.0f, 10.0f, 0.0f),
        glm::vec3(0.0f, 10.0f, 25.0f)};
    std::array<std::string, kPanelCount> panelSections{"about", "projects", "skills", "contact"};

    std::vector<OfficeLinkDesc> overlayLinks;

    uint32_t particleCount = 16;
};

// Panels rest facing the scene centre
[[nodiscard]] float RestYawForPanel(const glm::vec3& panelPosition);

[[nodiscard]] SceneHandles BuildOfficeLayout(ECS_Registry& registry, const OfficeLayoutDesc& desc);

} // namespace Atrium::Scene
