#include "PointerIntent.h"
#include "FocusCoordinator.h"
#include "HologramPanels.h"
#include "Scene/ECS_Registry.h"
#include <spdlog/spdlog.h>

namespace Atrium::Game {

const char* PointerIntentKindName(PointerIntentKind kind) {
    switch (kind) {
        case PointerIntentKind::None: return "None";
        case PointerIntentKind::DragRejected: return "DragRejected";
        case PointerIntentKind::HelpConfirm: return "HelpConfirm";
        case PointerIntentKind::HelpDismiss: return "HelpDismiss";
        case PointerIntentKind::AgentBody: return "AgentBody";
        case PointerIntentKind::Device: return "Device";
        case PointerIntentKind::OverlayClose: return "OverlayClose";
        case PointerIntentKind::OverlayLink: return "OverlayLink";
        case PointerIntentKind::PanelBack: return "PanelBack";
        case PointerIntentKind::PanelDetails: return "PanelDetails";
        case PointerIntentKind::PanelBody: return "PanelBody";
    }
    return "Unknown";
}

PointerIntentResolver::PointerIntentResolver(Scene::ECS_Registry& registry,
                                             const Scene::SceneHandles& handles,
                                             const HologramPanels& panels,
                                             FocusCoordinator& coordinator,
                                             const ScenePicker& picker,
                                             float dragThresholdPx)
    : m_registry(registry)
    , m_handles(handles)
    , m_panels(panels)
    , m_coordinator(coordinator)
    , m_picker(picker)
    , m_dragThresholdPx(dragThresholdPx) {
}

void PointerIntentResolver::OnPointerDown(const glm::vec2& screen) {
    m_pressPosition = screen;
}

PointerIntent PointerIntentResolver::OnPointerUp(const glm::vec2& screen) {
    if (!m_pressPosition) {
        return PointerIntent{};
    }

    const float travelled = glm::distance(*m_pressPosition, screen);
    m_pressPosition.reset();

    PointerIntent intent = Classify(screen, travelled);
    spdlog::debug("[Input] Click at ({:.0f}, {:.0f}) -> {}", screen.x, screen.y,
                  PointerIntentKindName(intent.kind));
    Dispatch(intent);
    return intent;
}

bool PointerIntentResolver::HitsVisible(const glm::vec2& screen, entt::entity entity) const {
    return entity != entt::null && m_registry.IsVisible(entity) && m_picker.Hits(screen, entity);
}

PointerIntent PointerIntentResolver::Classify(const glm::vec2& screen, float dragDistancePx) const {
    PointerIntent intent;

    // Orbit drags must never read as clicks
    if (dragDistancePx > m_dragThresholdPx) {
        intent.kind = PointerIntentKind::DragRejected;
        return intent;
    }

    // Agent and device first; their affordances can overlap panel geometry
    if (m_coordinator.IsInAgentHelp()) {
        if (HitsVisible(screen, m_handles.agent.confirmButton)) {
            intent.kind = PointerIntentKind::HelpConfirm;
            return intent;
        }
        if (HitsVisible(screen, m_handles.agent.dismissButton)) {
            intent.kind = PointerIntentKind::HelpDismiss;
            return intent;
        }
    } else if (HitsVisible(screen, m_handles.agent.body)) {
        intent.kind = PointerIntentKind::AgentBody;
        return intent;
    }

    if (HitsVisible(screen, m_handles.device)) {
        intent.kind = PointerIntentKind::Device;
        return intent;
    }

    if (m_coordinator.IsDeviceOverlayVisible()) {
        const auto& overlay = m_coordinator.GetDeviceOverlay();
        if (HitsVisible(screen, overlay.closeButton)) {
            intent.kind = PointerIntentKind::OverlayClose;
            return intent;
        }
        for (entt::entity link : overlay.linkButtons) {
            if (HitsVisible(screen, link)) {
                intent.kind = PointerIntentKind::OverlayLink;
                if (const auto* affordance = m_registry.TryGetComponent<Scene::AffordanceComponent>(link)) {
                    intent.url = affordance->url;
                }
                return intent;
            }
        }
    }

    for (int32_t i = 0; i < m_panels.GetCount(); ++i) {
        if (!m_panels.IsValidIndex(i)) continue;
        if (HitsVisible(screen, m_handles.panels[static_cast<size_t>(i)].backButton)) {
            intent.kind = PointerIntentKind::PanelBack;
            intent.panelIndex = i;
            return intent;
        }
    }

    for (int32_t i = 0; i < m_panels.GetCount(); ++i) {
        if (!m_panels.IsValidIndex(i)) continue;
        if (HitsVisible(screen, m_handles.panels[static_cast<size_t>(i)].detailsButton)) {
            intent.kind = PointerIntentKind::PanelDetails;
            intent.panelIndex = i;
            return intent;
        }
    }

    for (int32_t i = 0; i < m_panels.GetCount(); ++i) {
        if (!m_panels.IsValidIndex(i)) continue;
        if (HitsVisible(screen, m_handles.panels[static_cast<size_t>(i)].root)) {
            intent.kind = PointerIntentKind::PanelBody;
            intent.panelIndex = i;
            return intent;
        }
    }

    return intent;
}

void PointerIntentResolver::Dispatch(const PointerIntent& intent) {
    switch (intent.kind) {
        case PointerIntentKind::None:
        case PointerIntentKind::DragRejected:
            break;
        case PointerIntentKind::HelpConfirm:
            m_coordinator.RespondToHelp(true);
            break;
        case PointerIntentKind::HelpDismiss:
            m_coordinator.RespondToHelp(false);
            break;
        case PointerIntentKind::AgentBody:
            m_coordinator.EnterAgentHelp();
            break;
        case PointerIntentKind::Device:
            m_coordinator.ToggleDeviceFocus();
            break;
        case PointerIntentKind::OverlayClose:
            m_coordinator.ExitDeviceFocus();
            break;
        case PointerIntentKind::OverlayLink:
            m_coordinator.RequestExternalLink(intent.url);
            break;
        case PointerIntentKind::PanelBack:
            m_coordinator.ReturnToDefault();
            break;
        case PointerIntentKind::PanelDetails:
            m_coordinator.RequestPanelDetails(intent.panelIndex);
            break;
        case PointerIntentKind::PanelBody:
            m_coordinator.FocusHologram(intent.panelIndex);
            break;
    }
}

bool PointerIntentResolver::IsHoveringInteractive(const glm::vec2& screen) const {
    return Classify(screen, 0.0f).kind != PointerIntentKind::None;
}

} // namespace Atrium::Game
