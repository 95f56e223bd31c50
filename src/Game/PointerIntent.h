#pragma once

// PointerIntent.h
// Classifies a click into at most one intent, using a strict priority order,
// and dispatches it to the focus coordinator. Ray construction and geometry
// tests live behind ScenePicker.

#include "Scene/SceneHandles.h"
#include <glm/glm.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace Atrium::Scene {
class ECS_Registry;
}

namespace Atrium::Game {

class FocusCoordinator;
class HologramPanels;

// Screen-space picking against scene geometry
class ScenePicker {
public:
    virtual ~ScenePicker() = default;

    // True if the ray through `screen` hits the entity or any of its descendants
    [[nodiscard]] virtual bool Hits(const glm::vec2& screen, entt::entity entity) const = 0;
};

enum class PointerIntentKind : uint8_t {
    None,
    DragRejected,
    HelpConfirm,
    HelpDismiss,
    AgentBody,
    Device,
    OverlayClose,
    OverlayLink,
    PanelBack,
    PanelDetails,
    PanelBody
};

[[nodiscard]] const char* PointerIntentKindName(PointerIntentKind kind);

struct PointerIntent {
    PointerIntentKind kind = PointerIntentKind::None;
    int32_t panelIndex = -1;
    std::string url;
};

class PointerIntentResolver {
public:
    PointerIntentResolver(Scene::ECS_Registry& registry,
                          const Scene::SceneHandles& handles,
                          const HologramPanels& panels,
                          FocusCoordinator& coordinator,
                          const ScenePicker& picker,
                          float dragThresholdPx);

    void OnPointerDown(const glm::vec2& screen);

    // Classifies and dispatches the click. A release without a matching
    // press yields None.
    PointerIntent OnPointerUp(const glm::vec2& screen);

    // Priority-ordered classification; `dragDistancePx` is press-to-release travel
    [[nodiscard]] PointerIntent Classify(const glm::vec2& screen, float dragDistancePx) const;

    void Dispatch(const PointerIntent& intent);

    // Whether a click at `screen` would do something (pointer cursor)
    [[nodiscard]] bool IsHoveringInteractive(const glm::vec2& screen) const;

private:
    [[nodiscard]] bool HitsVisible(const glm::vec2& screen, entt::entity entity) const;

    Scene::ECS_Registry& m_registry;
    Scene::SceneHandles m_handles;
    const HologramPanels& m_panels;
    FocusCoordinator& m_coordinator;
    const ScenePicker& m_picker;
    float m_dragThresholdPx = 5.0f;

    std::optional<glm::vec2> m_pressPosition;
};

} // namespace Atrium::Game
