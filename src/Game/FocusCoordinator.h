#pragma once

// FocusCoordinator.h
// The focus-mode state machine. Owns the current mode and the session camera
// pose, choreographs camera/target tweens for entering and leaving each mode,
// and evaluates the per-tick policies (help auto-exit, panel tracking,
// overlay billboarding, drift resume).
//
// Every transition updates logical state (mode, visibility flags, tracking)
// synchronously before starting any tween. Tween completion callbacks are
// tagged with a transition serial and ignored once a newer transition has
// started.

#include "FocusMode.h"
#include "Scene/SceneHandles.h"
#include <glm/glm.hpp>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace Atrium::AI {
class AgentNavigator;
}

namespace Atrium::Animation {
class TweenSystem;
}

namespace Atrium::Scene {
class ECS_Registry;
}

namespace Atrium::Game {

class OrbitCamera;
class HologramPanels;
class ContentStore;
class PresentationSink;

class FocusCoordinator {
public:
    FocusCoordinator(const FocusParams& params,
                     OrbitCamera& camera,
                     Animation::TweenSystem& tweens,
                     HologramPanels& panels,
                     AI::AgentNavigator& navigator,
                     Scene::ECS_Registry& registry,
                     const Scene::SceneHandles& handles,
                     const ContentStore& content,
                     PresentationSink& sink);

    FocusCoordinator(const FocusCoordinator&) = delete;
    FocusCoordinator& operator=(const FocusCoordinator&) = delete;

    // Mode transitions. Requests that do not apply to the current mode are
    // logged no-ops.
    void FocusHologram(int32_t panelIndex);
    void ReturnToDefault();
    void EnterAgentHelp();
    void RespondToHelp(bool confirmed);
    void ToggleDeviceFocus();
    void EnterDeviceFocus();
    void ExitDeviceFocus();

    // Requests that never change the mode
    void RequestPanelDetails(int32_t panelIndex);
    void RequestExternalLink(const std::string& url);

    // Navigation bar: "home" or a panel section name
    void NavigateToSection(const std::string& section);

    void OnKeyDown(const std::string& key);

    // Per-tick policies; call after the navigator has updated
    void Update(double nowMs);

    [[nodiscard]] const FocusMode& GetMode() const { return m_mode; }
    [[nodiscard]] std::string GetModeName() const { return FocusModeName(m_mode); }
    [[nodiscard]] bool IsInAgentHelp() const { return std::holds_alternative<AgentHelp>(m_mode); }
    [[nodiscard]] bool IsInDeviceFocus() const { return std::holds_alternative<DeviceFocus>(m_mode); }
    // Focused panel index, or -1
    [[nodiscard]] int32_t GetActiveHologram() const;
    [[nodiscard]] const std::optional<SessionContext>& GetSession() const { return m_session; }

    [[nodiscard]] bool IsDeviceOverlayVisible() const { return m_overlayVisible; }
    [[nodiscard]] const Scene::DeviceOverlayHandles& GetDeviceOverlay() const { return m_overlay; }
    [[nodiscard]] const FocusParams& GetParams() const { return m_params; }

    // Auto-exit policy for AgentHelp; never fires inside the grace period
    [[nodiscard]] static bool ShouldAutoExitAgentHelp(double msSinceEntry,
                                                      float cameraToAgent,
                                                      float targetToAgent,
                                                      const FocusParams& params);

    // Whether the orbit target still sits on a panel
    [[nodiscard]] static bool IsTargetOnPanel(const glm::vec3& orbitTarget,
                                              const glm::vec3& panelPosition,
                                              float radius);

private:
    // Starts a new transition: invalidates pending callbacks and stops drift
    void BeginTransition();

    // Logical teardown of the active mode, without camera animation
    void LeaveCurrentMode();

    void SnapshotSessionIfDefault();
    void AnimateCamera(const glm::vec3& position, const glm::vec3& target, double durationMs,
                       std::function<void()> onPositionUpdate,
                       std::function<void()> onComplete);

    void SetHelpAffordancesVisible(bool visible);
    void ShowDeviceOverlay();
    void HideDeviceOverlay();

    void UpdateHologramTracking(int32_t panelIndex);
    void UpdateAgentHelp();
    void UpdateDeviceOverlay();

    // Target lost while tracking: back to Default without moving the camera
    void ReleaseHologram(int32_t panelIndex);

    FocusParams m_params;
    OrbitCamera& m_camera;
    Animation::TweenSystem& m_tweens;
    HologramPanels& m_panels;
    AI::AgentNavigator& m_navigator;
    Scene::ECS_Registry& m_registry;
    Scene::SceneHandles m_handles;
    const ContentStore& m_content;
    PresentationSink& m_sink;

    FocusMode m_mode = DefaultMode{};
    std::optional<SessionContext> m_session;
    uint64_t m_transitionSerial = 0;

    double m_nowMs = 0.0;
    double m_helpEnteredMs = 0.0;
    std::optional<double> m_driftResumeAtMs;

    Scene::DeviceOverlayHandles m_overlay;
    bool m_overlayVisible = false;
};

} // namespace Atrium::Game
