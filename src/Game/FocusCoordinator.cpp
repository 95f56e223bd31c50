#include "FocusCoordinator.h"
#include "AI/AgentNavigator.h"
#include "Animation/TweenSystem.h"
#include "ContentStore.h"
#include "HologramPanels.h"
#include "OrbitCamera.h"
#include "PresentationSink.h"
#include "Scene/ECS_Registry.h"
#include <spdlog/spdlog.h>
#include <cmath>

namespace Atrium::Game {

std::string FocusModeName(const FocusMode& mode) {
    if (const auto* hologram = std::get_if<HologramFocus>(&mode)) {
        return "HologramFocus(" + std::to_string(hologram->panelIndex) + ")";
    }
    if (std::holds_alternative<AgentHelp>(mode)) return "AgentHelp";
    if (std::holds_alternative<DeviceFocus>(mode)) return "DeviceFocus";
    return "Default";
}

FocusCoordinator::FocusCoordinator(const FocusParams& params,
                                   OrbitCamera& camera,
                                   Animation::TweenSystem& tweens,
                                   HologramPanels& panels,
                                   AI::AgentNavigator& navigator,
                                   Scene::ECS_Registry& registry,
                                   const Scene::SceneHandles& handles,
                                   const ContentStore& content,
                                   PresentationSink& sink)
    : m_params(params)
    , m_camera(camera)
    , m_tweens(tweens)
    , m_panels(panels)
    , m_navigator(navigator)
    , m_registry(registry)
    , m_handles(handles)
    , m_content(content)
    , m_sink(sink) {
    SetHelpAffordancesVisible(false);
}

int32_t FocusCoordinator::GetActiveHologram() const {
    if (const auto* hologram = std::get_if<HologramFocus>(&m_mode)) {
        return hologram->panelIndex;
    }
    return -1;
}

bool FocusCoordinator::ShouldAutoExitAgentHelp(double msSinceEntry,
                                               float cameraToAgent,
                                               float targetToAgent,
                                               const FocusParams& params) {
    if (msSinceEntry < params.helpGraceMs) return false;
    return cameraToAgent > params.helpMaxCameraDistance ||
           targetToAgent > params.helpMaxTargetDistance;
}

bool FocusCoordinator::IsTargetOnPanel(const glm::vec3& orbitTarget,
                                       const glm::vec3& panelPosition,
                                       float radius) {
    return glm::distance(orbitTarget, panelPosition) <= radius;
}

// ============================================================================
// Transition plumbing
// ============================================================================

void FocusCoordinator::BeginTransition() {
    ++m_transitionSerial;
    m_driftResumeAtMs.reset();
    m_camera.SetAutoRotate(false);
}

void FocusCoordinator::LeaveCurrentMode() {
    if (const auto* hologram = std::get_if<HologramFocus>(&m_mode)) {
        m_panels.SetTracking(hologram->panelIndex, false);
        m_panels.ResetOrientation(hologram->panelIndex);
        m_panels.HideContent(hologram->panelIndex);
        spdlog::debug("[Focus] Left HologramFocus({})", hologram->panelIndex);
    } else if (std::holds_alternative<AgentHelp>(m_mode)) {
        SetHelpAffordancesVisible(false);
        m_navigator.Resume(m_nowMs);
        spdlog::debug("[Focus] Left AgentHelp");
    } else if (std::holds_alternative<DeviceFocus>(m_mode)) {
        HideDeviceOverlay();
        spdlog::debug("[Focus] Left DeviceFocus");
    }
    m_mode = DefaultMode{};
}

void FocusCoordinator::SnapshotSessionIfDefault() {
    if (!IsDefault(m_mode) && m_session) return;

    SessionContext session;
    session.savedCameraPosition = m_camera.GetPosition();
    session.savedCameraTarget = m_camera.GetTarget();
    m_session = session;
}

void FocusCoordinator::AnimateCamera(const glm::vec3& position, const glm::vec3& target, double durationMs,
                                     std::function<void()> onPositionUpdate,
                                     std::function<void()> onComplete) {
    Animation::TweenParams positionParams;
    positionParams.durationMs = durationMs;
    positionParams.ease = Animation::Ease::Power2InOut;
    positionParams.onUpdate = std::move(onPositionUpdate);
    m_tweens.To(m_camera.PositionProperty(), position, std::move(positionParams));

    Animation::TweenParams targetParams;
    targetParams.durationMs = durationMs;
    targetParams.ease = Animation::Ease::Power2InOut;
    targetParams.onComplete = std::move(onComplete);
    m_tweens.To(m_camera.TargetProperty(), target, std::move(targetParams));
}

void FocusCoordinator::SetHelpAffordancesVisible(bool visible) {
    for (entt::entity button : {m_handles.agent.confirmButton, m_handles.agent.dismissButton}) {
        if (button != entt::null) {
            m_registry.SetVisible(button, visible);
        }
    }
}

void FocusCoordinator::ShowDeviceOverlay() {
    if (!m_overlay.IsBuilt()) {
        if (!m_handles.buildDeviceOverlay) {
            spdlog::warn("[Focus] No device overlay factory; overlay stays hidden");
            return;
        }
        m_overlay = m_handles.buildDeviceOverlay(m_registry);
        if (!m_overlay.IsBuilt()) {
            spdlog::warn("[Focus] Device overlay factory returned no root");
            return;
        }
        spdlog::info("[Focus] Device overlay built ({} links)", m_overlay.linkButtons.size());
    }

    m_registry.SetVisible(m_overlay.root, true);
    if (m_overlay.closeButton != entt::null) m_registry.SetVisible(m_overlay.closeButton, true);
    for (entt::entity link : m_overlay.linkButtons) {
        m_registry.SetVisible(link, true);
    }
    m_overlayVisible = true;
    UpdateDeviceOverlay();
}

void FocusCoordinator::HideDeviceOverlay() {
    m_overlayVisible = false;
    if (!m_overlay.IsBuilt()) return;

    m_registry.SetVisible(m_overlay.root, false);
    if (m_overlay.closeButton != entt::null) m_registry.SetVisible(m_overlay.closeButton, false);
    for (entt::entity link : m_overlay.linkButtons) {
        m_registry.SetVisible(link, false);
    }
}

// ============================================================================
// Transitions
// ============================================================================

void FocusCoordinator::FocusHologram(int32_t panelIndex) {
    if (!m_panels.IsValidIndex(panelIndex)) {
        spdlog::debug("[Focus] Ignoring focus request for invalid panel {}", panelIndex);
        return;
    }
    if (GetActiveHologram() == panelIndex) {
        return;
    }

    const std::string previous = GetModeName();
    BeginTransition();
    SnapshotSessionIfDefault();
    LeaveCurrentMode();
    m_mode = HologramFocus{panelIndex};

    // Avoid a visible pop while the camera swings round
    m_panels.FaceTowards(panelIndex, m_camera.GetPosition());

    const uint64_t serial = m_transitionSerial;
    const glm::vec3 frontPosition = m_panels.GetFrontCameraPosition(panelIndex, m_params.panelFrontDistance);
    const glm::vec3 panelPosition = m_panels.GetWorldPosition(panelIndex);

    auto onPositionUpdate = [this, serial, panelIndex]() {
        if (serial != m_transitionSerial) return;
        m_panels.FaceTowards(panelIndex, m_camera.GetPosition());
    };

    auto onComplete = [this, serial, panelIndex]() {
        if (serial != m_transitionSerial) return;
        m_panels.SetTracking(panelIndex, true);
        m_panels.ShowContent(panelIndex);
        m_driftResumeAtMs = m_tweens.GetNow() + m_params.driftResumeDelayMs;
        spdlog::info("[Focus] HologramFocus({}) settled, tracking camera", panelIndex);
    };

    AnimateCamera(frontPosition, panelPosition, m_params.focusDurationMs,
                  std::move(onPositionUpdate), std::move(onComplete));

    spdlog::info("[Focus] {} -> {}", previous, GetModeName());
    m_sink.OnHologramFocused(panelIndex);
    m_sink.OnActiveSectionChanged(m_panels.GetSection(panelIndex));
}

void FocusCoordinator::ReturnToDefault() {
    if (IsDefault(m_mode)) {
        return;
    }

    const std::string previous = GetModeName();
    const double durationMs = IsInDeviceFocus() ? m_params.deviceDurationMs : m_params.focusDurationMs;

    BeginTransition();
    LeaveCurrentMode();
    m_panels.HideAllContent();

    glm::vec3 position = m_camera.GetConfig().homePosition;
    glm::vec3 target = m_camera.GetConfig().homeTarget;
    if (m_session) {
        position = m_session->savedCameraPosition;
        target = m_session->savedCameraTarget;
    }
    m_session.reset();

    const uint64_t serial = m_transitionSerial;
    AnimateCamera(position, target, durationMs, nullptr, [this, serial]() {
        if (serial != m_transitionSerial) return;
        m_camera.SetAutoRotate(true);
        spdlog::debug("[Focus] Camera restored, drift resumed");
    });

    spdlog::info("[Focus] {} -> Default", previous);
    m_sink.OnActiveSectionChanged(kHomeSection);
}

void FocusCoordinator::EnterAgentHelp() {
    if (IsInAgentHelp()) {
        return;
    }

    const std::string previous = GetModeName();
    BeginTransition();
    SnapshotSessionIfDefault();
    LeaveCurrentMode();
    m_mode = AgentHelp{};
    m_helpEnteredMs = m_nowMs;

    m_navigator.Suspend();
    SetHelpAffordancesVisible(true);

    const glm::vec3 agent = m_navigator.GetWorldPosition();
    AnimateCamera(agent + m_params.helpCameraOffset, agent + m_params.helpTargetOffset,
                  m_params.focusDurationMs, nullptr, nullptr);

    spdlog::info("[Focus] {} -> AgentHelp", previous);
}

void FocusCoordinator::RespondToHelp(bool confirmed) {
    if (!IsInAgentHelp()) {
        spdlog::debug("[Focus] Ignoring help response outside AgentHelp");
        return;
    }

    ReturnToDefault();
    if (confirmed) {
        m_sink.OnInformationalDialogueRequested(m_params.helpDialogueBody);
    }
}

void FocusCoordinator::ToggleDeviceFocus() {
    if (IsInDeviceFocus()) {
        ExitDeviceFocus();
    } else {
        EnterDeviceFocus();
    }
}

void FocusCoordinator::EnterDeviceFocus() {
    if (IsInDeviceFocus()) {
        return;
    }
    if (m_handles.device == entt::null) {
        spdlog::warn("[Focus] No device in scene; ignoring device focus");
        return;
    }

    const std::string previous = GetModeName();
    BeginTransition();
    SnapshotSessionIfDefault();
    LeaveCurrentMode();
    m_mode = DeviceFocus{};

    const glm::vec3 device = m_registry.GetWorldPosition(m_handles.device);
    const uint64_t serial = m_transitionSerial;
    AnimateCamera(device + m_params.deviceCameraOffset, device + m_params.deviceTargetOffset,
                  m_params.deviceDurationMs, nullptr, [this, serial]() {
        if (serial != m_transitionSerial) return;
        ShowDeviceOverlay();
    });

    spdlog::info("[Focus] {} -> DeviceFocus", previous);
}

void FocusCoordinator::ExitDeviceFocus() {
    if (!IsInDeviceFocus()) {
        return;
    }
    ReturnToDefault();
}

void FocusCoordinator::ReleaseHologram(int32_t panelIndex) {
    ++m_transitionSerial;
    LeaveCurrentMode();
    m_session.reset();
    spdlog::info("[Focus] Orbit target left panel {}; released to Default", panelIndex);
    m_sink.OnActiveSectionChanged(kHomeSection);
}

// ============================================================================
// Requests
// ============================================================================

void FocusCoordinator::RequestPanelDetails(int32_t panelIndex) {
    if (!m_panels.IsValidIndex(panelIndex)) {
        spdlog::debug("[Focus] Ignoring details request for invalid panel {}", panelIndex);
        return;
    }

    const std::string key = m_panels.GetSection(panelIndex);
    auto record = m_content.Get(key);
    if (record.IsErr()) {
        spdlog::warn("[Content] {}", record.Error());
        m_sink.OnContentUnavailable(key);
        return;
    }

    spdlog::info("[Content] Showing '{}' details", key);
    m_sink.OnPanelContentRequested(key, record.Value());
}

void FocusCoordinator::RequestExternalLink(const std::string& url) {
    if (url.empty()) {
        spdlog::debug("[Focus] Ignoring empty external link");
        return;
    }
    spdlog::info("[Focus] Opening external link {}", url);
    m_sink.OnExternalLinkRequested(url);
}

void FocusCoordinator::NavigateToSection(const std::string& section) {
    if (section == kHomeSection) {
        ReturnToDefault();
        return;
    }

    const int32_t panelIndex = m_panels.FindBySection(section);
    if (panelIndex < 0) {
        spdlog::warn("[Focus] Unknown section '{}'", section);
        return;
    }
    FocusHologram(panelIndex);
}

void FocusCoordinator::OnKeyDown(const std::string& key) {
    if (key == "Escape") {
        ReturnToDefault();
    }
}

// ============================================================================
// Per-tick
// ============================================================================

void FocusCoordinator::Update(double nowMs) {
    m_nowMs = nowMs;

    if (m_driftResumeAtMs && nowMs >= *m_driftResumeAtMs) {
        m_driftResumeAtMs.reset();
        m_camera.SetAutoRotate(true);
        spdlog::debug("[Focus] Ambient drift resumed");
    }

    if (const auto* hologram = std::get_if<HologramFocus>(&m_mode)) {
        UpdateHologramTracking(hologram->panelIndex);
    } else if (IsInAgentHelp()) {
        UpdateAgentHelp();
    } else if (IsInDeviceFocus()) {
        UpdateDeviceOverlay();
    }
}

void FocusCoordinator::UpdateHologramTracking(int32_t panelIndex) {
    // The entry tween drives facing until it completes
    if (!m_panels.IsTracking(panelIndex)) return;

    if (!IsTargetOnPanel(m_camera.GetTarget(), m_panels.GetWorldPosition(panelIndex), m_params.panelTrackRadius)) {
        ReleaseHologram(panelIndex);
        return;
    }
    m_panels.FaceTowards(panelIndex, m_camera.GetPosition());
}

void FocusCoordinator::UpdateAgentHelp() {
    m_navigator.FaceTowards(m_camera.GetPosition());

    const glm::vec3 agent = m_navigator.GetWorldPosition();
    const float cameraToAgent = glm::distance(m_camera.GetPosition(), agent);
    const float targetToAgent = glm::distance(m_camera.GetTarget(), agent);

    if (ShouldAutoExitAgentHelp(m_nowMs - m_helpEnteredMs, cameraToAgent, targetToAgent, m_params)) {
        spdlog::info("[Focus] Camera left the agent (camera {:.1f}, target {:.1f}); auto-exiting help",
                     cameraToAgent, targetToAgent);
        ReturnToDefault();
    }
}

void FocusCoordinator::UpdateDeviceOverlay() {
    if (!m_overlayVisible || !m_overlay.IsBuilt()) return;

    auto* transform = m_registry.TryGetComponent<Scene::TransformComponent>(m_overlay.root);
    if (!transform) return;

    const glm::vec3 origin = m_registry.GetWorldPosition(m_overlay.root);
    const glm::vec3 camera = m_camera.GetPosition();
    const float dx = camera.x - origin.x;
    const float dz = camera.z - origin.z;
    if (dx * dx + dz * dz < 1e-6f) return;
    transform->rotation.y = std::atan2(dx, dz);
}

} // namespace Atrium::Game
