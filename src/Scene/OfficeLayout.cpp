#include "OfficeLayout.h"
#include "ECS_Registry.h"
#include <spdlog/spdlog.h>
#include <cmath>

namespace Atrium::Scene {

namespace {

entt::entity CreateAffordance(ECS_Registry& registry,
                              const std::string& tag,
                              const glm::vec3& localPosition,
                              entt::entity parent,
                              AffordanceKind kind,
                              int32_t panelIndex = -1,
                              const std::string& url = std::string()) {
    entt::entity button = registry.CreateNode(tag, localPosition, parent);

    auto& affordance = registry.AddComponent<AffordanceComponent>(button);
    affordance.kind = kind;
    affordance.panelIndex = panelIndex;
    affordance.url = url;

    auto& visibility = registry.AddComponent<VisibilityComponent>(button);
    visibility.visible = false;
    visibility.revealScale = 0.0f;
    return button;
}

void CreateFurniture(ECS_Registry& registry) {
    registry.CreateNode("floor", glm::vec3(0.0f));
    registry.CreateNode("desk", glm::vec3(0.0f, 0.0f, 0.0f));
    registry.CreateNode("chair", glm::vec3(0.0f, 0.0f, 5.0f));
    registry.CreateNode("desk.secondary", glm::vec3(15.0f, 0.0f, -8.0f));
    registry.CreateNode("cpu_tower", glm::vec3(8.0f, 0.0f, 2.0f));

    const std::array<glm::vec3, 4> projectors{
        glm::vec3(-25.0f, 0.0f, 0.0f), glm::vec3(25.0f, 0.0f, 0.0f),
        glm::vec3(0.0f, 0.0f, -30.0f), glm::vec3(0.0f, 0.0f, 25.0f)};
    for (const auto& p : projectors) {
        registry.CreateNode("projector", p);
    }
}

void CreateQualityLayers(ECS_Registry& registry, uint32_t particleCount) {
    const std::array<glm::vec3, 4> decorations{
        glm::vec3(-6.0f, 4.2f, -1.0f),     // Desk plant
        glm::vec3(-35.0f, 12.0f, -35.0f),  // Neon strips
        glm::vec3(35.0f, 12.0f, -35.0f),
        glm::vec3(0.0f, 18.0f, 0.0f)};     // Ceiling ring
    for (const auto& p : decorations) {
        entt::entity e = registry.CreateNode("decoration", p);
        registry.AddComponent<QualityLayerComponent>(e, QualityLayerComponent{QualityLayer::Decorations});
        registry.AddComponent<VisibilityComponent>(e);
    }

    for (uint32_t i = 0; i < particleCount; ++i) {
        const float angle = static_cast<float>(i) / static_cast<float>(particleCount) * 6.2831853f;
        const glm::vec3 p(std::sin(angle) * 20.0f, 6.0f + static_cast<float>(i % 4), std::cos(angle) * 20.0f);
        entt::entity e = registry.CreateNode("particle", p);
        registry.AddComponent<QualityLayerComponent>(e, QualityLayerComponent{QualityLayer::Particles});
        registry.AddComponent<VisibilityComponent>(e);
    }
}

AgentHandles CreateAgent(ECS_Registry& registry, const glm::vec2& start) {
    AgentHandles agent;
    agent.body = registry.CreateNode("agent", glm::vec3(start.x, 0.0f, start.y));

    auto& parts = agent.parts;
    parts.wheelBase = registry.CreateNode("agent.wheel_base", glm::vec3(0.0f, 0.4f, 0.0f), agent.body);
    for (size_t i = 0; i < parts.wheels.size(); ++i) {
        const float angle = static_cast<float>(i) * 2.0943951f;   // 120 degrees apart
        parts.wheels[i] = registry.CreateNode("agent.wheel",
                                              glm::vec3(std::sin(angle) * 0.8f, 0.0f, std::cos(angle) * 0.8f),
                                              parts.wheelBase);
    }

    parts.leftShoulder = registry.CreateNode("agent.shoulder.left", glm::vec3(-1.1f, 3.2f, 0.0f), agent.body);
    parts.rightShoulder = registry.CreateNode("agent.shoulder.right", glm::vec3(1.1f, 3.2f, 0.0f), agent.body);
    parts.leftArm = registry.CreateNode("agent.arm.left", glm::vec3(0.0f, -0.8f, 0.0f), parts.leftShoulder);
    parts.rightArm = registry.CreateNode("agent.arm.right", glm::vec3(0.0f, -0.8f, 0.0f), parts.rightShoulder);
    parts.head = registry.CreateNode("agent.head", glm::vec3(0.0f, 4.4f, 0.0f), agent.body);

    // Resting shoulder pose matches the gesture-reset neutral
    registry.GetComponent<TransformComponent>(parts.leftShoulder).rotation.x = 0.2f;
    registry.GetComponent<TransformComponent>(parts.rightShoulder).rotation.x = -0.2f;

    entt::entity helpGroup = registry.CreateNode("agent.help", glm::vec3(0.0f, 6.5f, 0.0f), agent.body);
    agent.confirmButton = CreateAffordance(registry, "agent.help.confirm", glm::vec3(-0.8f, -0.6f, 0.0f),
                                           helpGroup, AffordanceKind::HelpConfirm);
    agent.dismissButton = CreateAffordance(registry, "agent.help.dismiss", glm::vec3(0.8f, -0.6f, 0.0f),
                                           helpGroup, AffordanceKind::HelpDismiss);
    return agent;
}

} // namespace

float RestYawForPanel(const glm::vec3& panelPosition) {
    if (std::abs(panelPosition.x) < 1e-4f && std::abs(panelPosition.z) < 1e-4f) {
        return 0.0f;
    }
    return std::atan2(-panelPosition.x, -panelPosition.z);
}

SceneHandles BuildOfficeLayout(ECS_Registry& registry, const OfficeLayoutDesc& desc) {
    SceneHandles handles;

    CreateFurniture(registry);
    CreateQualityLayers(registry, desc.particleCount);

    handles.agent = CreateAgent(registry, desc.agentStart);
    handles.device = registry.CreateNode("device.phone", desc.devicePosition);

    for (size_t i = 0; i < kPanelCount; ++i) {
        auto& panel = handles.panels[i];
        const glm::vec3& position = desc.panelPositions[i];

        panel.root = registry.CreateNode("hologram." + desc.panelSections[i], position);
        auto& state = registry.AddComponent<HologramPanelComponent>(panel.root);
        state.index = static_cast<int32_t>(i);
        state.section = desc.panelSections[i];
        state.restYaw = RestYawForPanel(position);
        registry.GetComponent<TransformComponent>(panel.root).rotation.y = state.restYaw;

        const auto index = static_cast<int32_t>(i);
        panel.backButton = CreateAffordance(registry, "hologram.back", glm::vec3(-2.5f, -4.0f, 0.1f),
                                            panel.root, AffordanceKind::PanelBack, index);
        panel.detailsButton = CreateAffordance(registry, "hologram.details", glm::vec3(2.5f, -4.0f, 0.1f),
                                               panel.root, AffordanceKind::PanelDetails, index);
    }

    // Built on first device focus, above the device
    const glm::vec3 overlayPosition = desc.devicePosition + glm::vec3(0.0f, 1.0f, 0.0f);
    const std::vector<OfficeLinkDesc> links = desc.overlayLinks;
    handles.buildDeviceOverlay = [overlayPosition, links](ECS_Registry& reg) {
        DeviceOverlayHandles overlay;
        overlay.root = reg.CreateNode("device.overlay", overlayPosition);
        auto& rootVisibility = reg.AddComponent<VisibilityComponent>(overlay.root);
        rootVisibility.visible = false;

        overlay.closeButton = CreateAffordance(reg, "device.overlay.close", glm::vec3(0.45f, 0.55f, 0.02f),
                                               overlay.root, AffordanceKind::OverlayClose);
        float y = 0.15f;
        for (const auto& link : links) {
            overlay.linkButtons.push_back(CreateAffordance(reg, "device.overlay.link." + link.label,
                                                           glm::vec3(0.0f, y, 0.02f), overlay.root,
                                                           AffordanceKind::OverlayLink, -1, link.url));
            y -= 0.3f;
        }
        return overlay;
    };

    spdlog::info("Office layout built: agent, device, {} panels, {} overlay links",
                 kPanelCount, desc.overlayLinks.size());
    spdlog::debug("{}", registry.DescribeScene());
    return handles;
}

} // namespace Atrium::Scene
