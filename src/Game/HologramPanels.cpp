#include "HologramPanels.h"
#include "Animation/TweenSystem.h"
#include "Scene/ECS_Registry.h"
#include <spdlog/spdlog.h>
#include <cmath>

namespace Atrium::Game {

namespace {

constexpr float kPi = 3.14159265358979f;
constexpr float kTwoPi = 2.0f * kPi;

// Content reveal choreography (ms)
constexpr double kRevealMs = 500.0;
constexpr double kSubtitleDelayMs = 200.0;
constexpr double kPreviewDelayMs = 400.0;
constexpr double kBackButtonDelayMs = 600.0;
constexpr double kDetailsButtonDelayMs = 800.0;
constexpr double kHideMs = 300.0;
constexpr double kButtonHideMs = 200.0;
constexpr double kOrientationResetMs = 300.0;

constexpr float kTitleRaisedOffset = 1.5f;
constexpr float kSubtitleOpacity = 0.8f;
constexpr float kPreviewOpacity = 0.9f;
constexpr float kCollapsedScale = 0.8f;

float WrapAngle(float angle) {
    angle = std::fmod(angle + kPi, kTwoPi);
    if (angle < 0.0f) angle += kTwoPi;
    return angle - kPi;
}

Animation::TweenParams MakeParams(double durationMs, double delayMs, Animation::Ease ease) {
    Animation::TweenParams params;
    params.durationMs = durationMs;
    params.delayMs = delayMs;
    params.ease = ease;
    return params;
}

} // namespace

HologramPanels::HologramPanels(Scene::ECS_Registry& registry,
                               const std::array<Scene::PanelHandles, Scene::kPanelCount>& panels,
                               Animation::TweenSystem& tweens)
    : m_registry(registry)
    , m_panels(panels)
    , m_tweens(tweens) {
    for (size_t i = 0; i < m_panels.size(); ++i) {
        if (!m_registry.HasComponent<Scene::HologramPanelComponent>(m_panels[i].root)) {
            spdlog::warn("[Focus] Panel {} has no HologramPanelComponent; it will be ignored", i);
        }
    }
}

bool HologramPanels::IsValidIndex(int32_t index) const {
    return Handles(index) != nullptr;
}

const Scene::PanelHandles* HologramPanels::Handles(int32_t index) const {
    if (index < 0 || index >= GetCount()) return nullptr;
    const auto& handles = m_panels[static_cast<size_t>(index)];
    if (!m_registry.HasComponent<Scene::HologramPanelComponent>(handles.root) ||
        !m_registry.HasComponent<Scene::TransformComponent>(handles.root)) {
        return nullptr;
    }
    return &handles;
}

float HologramPanels::YawTowards(const glm::vec3& from, const glm::vec3& point) {
    return std::atan2(point.x - from.x, point.z - from.z);
}

void HologramPanels::FaceTowards(int32_t index, const glm::vec3& point) {
    const auto* handles = Handles(index);
    if (!handles) return;

    const glm::vec3 origin = m_registry.GetWorldPosition(handles->root);
    const float dx = point.x - origin.x;
    const float dz = point.z - origin.z;
    if (dx * dx + dz * dz < 1e-6f) return;

    auto& transform = m_registry.GetComponent<Scene::TransformComponent>(handles->root);
    // A pending reset would fight the correction
    m_tweens.KillTweensOf(&transform.rotation.y);
    transform.rotation.y = YawTowards(origin, point);
}

void HologramPanels::ResetOrientation(int32_t index) {
    const auto* handles = Handles(index);
    if (!handles) return;

    auto& transform = m_registry.GetComponent<Scene::TransformComponent>(handles->root);
    const float restYaw = m_registry.GetComponent<Scene::HologramPanelComponent>(handles->root).restYaw;

    float* yaw = &transform.rotation.y;
    auto params = MakeParams(kOrientationResetMs, 0.0, Animation::Ease::Power2Out);
    params.onComplete = [yaw, restYaw]() { *yaw = restYaw; };
    m_tweens.To(yaw, *yaw + WrapAngle(restYaw - *yaw), std::move(params));
}

void HologramPanels::ShowContent(int32_t index) {
    const auto* handles = Handles(index);
    if (!handles) return;

    auto& panel = m_registry.GetComponent<Scene::HologramPanelComponent>(handles->root);
    panel.contentVisible = true;

    using Animation::Ease;
    m_tweens.To(&panel.titleOffset, kTitleRaisedOffset, MakeParams(kRevealMs, 0.0, Ease::Power2Out));
    m_tweens.FromTo(&panel.subtitleOpacity, 0.0f, kSubtitleOpacity,
                    MakeParams(kRevealMs, kSubtitleDelayMs, Ease::Power2Out));
    m_tweens.FromTo(&panel.subtitleScale, kCollapsedScale, 1.0f,
                    MakeParams(kRevealMs, kSubtitleDelayMs, Ease::BackOut));
    m_tweens.FromTo(&panel.previewOpacity, 0.0f, kPreviewOpacity,
                    MakeParams(kRevealMs, kPreviewDelayMs, Ease::Power2Out));
    m_tweens.FromTo(&panel.previewScale, kCollapsedScale, 1.0f,
                    MakeParams(kRevealMs, kPreviewDelayMs, Ease::BackOut));

    auto popIn = [&](entt::entity button, double delayMs) {
        if (button == entt::null) return;
        m_registry.SetVisible(button, true);
        if (auto* visibility = m_registry.TryGetComponent<Scene::VisibilityComponent>(button)) {
            m_tweens.FromTo(&visibility->revealScale, 0.0f, 1.0f, MakeParams(kRevealMs, delayMs, Ease::BackOut));
        }
    };
    popIn(handles->backButton, kBackButtonDelayMs);
    popIn(handles->detailsButton, kDetailsButtonDelayMs);

    spdlog::debug("[Focus] Panel {} content shown", index);
}

void HologramPanels::HideContent(int32_t index) {
    const auto* handles = Handles(index);
    if (!handles) return;

    auto& panel = m_registry.GetComponent<Scene::HologramPanelComponent>(handles->root);
    if (!panel.contentVisible) return;
    panel.contentVisible = false;

    using Animation::Ease;
    m_tweens.To(&panel.titleOffset, 0.0f, MakeParams(kHideMs, 0.0, Ease::Power2Out));
    m_tweens.To(&panel.subtitleOpacity, 0.0f, MakeParams(kHideMs, 0.0, Ease::Power2Out));
    m_tweens.To(&panel.subtitleScale, kCollapsedScale, MakeParams(kHideMs, 0.0, Ease::Power2Out));
    m_tweens.To(&panel.previewOpacity, 0.0f, MakeParams(kHideMs, 0.0, Ease::Power2Out));
    m_tweens.To(&panel.previewScale, kCollapsedScale, MakeParams(kHideMs, 0.0, Ease::Power2Out));

    for (entt::entity button : {handles->backButton, handles->detailsButton}) {
        if (button == entt::null) continue;
        m_registry.SetVisible(button, false);
        if (auto* visibility = m_registry.TryGetComponent<Scene::VisibilityComponent>(button)) {
            m_tweens.To(&visibility->revealScale, 0.0f, MakeParams(kButtonHideMs, 0.0, Ease::Power2In));
        }
    }

    spdlog::debug("[Focus] Panel {} content hidden", index);
}

void HologramPanels::HideAllContent() {
    for (int32_t i = 0; i < GetCount(); ++i) {
        HideContent(i);
    }
}

void HologramPanels::SetTracking(int32_t index, bool tracking) {
    const auto* handles = Handles(index);
    if (!handles) return;
    m_registry.GetComponent<Scene::HologramPanelComponent>(handles->root).trackingCamera = tracking;
}

bool HologramPanels::IsTracking(int32_t index) const {
    const auto* handles = Handles(index);
    return handles && m_registry.GetComponent<Scene::HologramPanelComponent>(handles->root).trackingCamera;
}

bool HologramPanels::IsContentVisible(int32_t index) const {
    const auto* handles = Handles(index);
    return handles && m_registry.GetComponent<Scene::HologramPanelComponent>(handles->root).contentVisible;
}

std::vector<entt::entity> HologramPanels::GetVisibleAffordances(int32_t index) const {
    std::vector<entt::entity> result;
    const auto* handles = Handles(index);
    if (!handles) return result;

    for (entt::entity button : {handles->backButton, handles->detailsButton}) {
        if (button != entt::null && m_registry.IsVisible(button)) {
            result.push_back(button);
        }
    }
    return result;
}

glm::vec3 HologramPanels::GetWorldPosition(int32_t index) const {
    const auto* handles = Handles(index);
    return handles ? m_registry.GetWorldPosition(handles->root) : glm::vec3(0.0f);
}

float HologramPanels::GetYaw(int32_t index) const {
    const auto* handles = Handles(index);
    return handles ? m_registry.GetComponent<Scene::TransformComponent>(handles->root).rotation.y : 0.0f;
}

float HologramPanels::GetRestYaw(int32_t index) const {
    const auto* handles = Handles(index);
    return handles ? m_registry.GetComponent<Scene::HologramPanelComponent>(handles->root).restYaw : 0.0f;
}

std::string HologramPanels::GetSection(int32_t index) const {
    const auto* handles = Handles(index);
    return handles ? m_registry.GetComponent<Scene::HologramPanelComponent>(handles->root).section : std::string();
}

int32_t HologramPanels::FindBySection(const std::string& section) const {
    for (int32_t i = 0; i < GetCount(); ++i) {
        if (IsValidIndex(i) && GetSection(i) == section) return i;
    }
    return -1;
}

glm::vec3 HologramPanels::GetFrontCameraPosition(int32_t index, float distance) const {
    const auto* handles = Handles(index);
    if (!handles) return glm::vec3(0.0f);

    const glm::vec3 origin = m_registry.GetWorldPosition(handles->root);
    const float restYaw = GetRestYaw(index);
    return origin + glm::vec3(std::sin(restYaw), 0.0f, std::cos(restYaw)) * distance;
}

} // namespace Atrium::Game
