#include "TickDriver.h"
#include "Game/ContentStore.h"
#include "Game/PresentationSink.h"
#include "Scene/ECS_Registry.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <exception>

namespace Atrium::Core {

TickDriver::TickDriver(const Utils::AtriumConfig& config,
                       Scene::ECS_Registry& registry,
                       const Scene::SceneHandles& handles,
                       const Game::ContentStore& content,
                       const Game::ScenePicker& picker,
                       Game::PresentationSink& sink)
    : m_registry(registry)
    , m_sink(sink)
    , m_obstacles(config.obstacles, config.boundary, config.sampleHalfExtent)
    , m_camera(config.camera)
    , m_navigator(m_obstacles, m_tweens, config.navigator)
    , m_panels(registry, handles.panels, m_tweens)
    , m_coordinator(config.focus, m_camera, m_tweens, m_panels, m_navigator,
                    registry, handles, content, sink)
    , m_pointer(registry, handles, m_panels, m_coordinator, picker, config.focus.dragThresholdPx)
    , m_quality(config.quality) {
    m_navigator.BindScene(&m_registry, handles.agent);
}

void TickDriver::Start(double nowMs) {
    m_tweens.Update(nowMs);
    m_navigator.Spawn(nowMs);
    m_coordinator.Update(nowMs);
    ApplyQualitySettings(m_quality);
    m_lastTickMs = nowMs;
    spdlog::info("[Tick] Started at {:.0f} ms with {} obstacles", nowMs, m_obstacles.GetObstacles().size());
}

void TickDriver::Tick(double nowMs) {
    const double deltaMs = m_lastTickMs ? std::max(0.0, nowMs - *m_lastTickMs) : 0.0;
    m_lastTickMs = nowMs;
    ++m_frameCount;

    // A broken frame must not stop the render loop
    try {
        m_tweens.Update(nowMs);
        m_camera.Update(static_cast<float>(deltaMs / 1000.0));
        m_navigator.Update(nowMs);
        m_coordinator.Update(nowMs);
    } catch (const std::exception& e) {
        spdlog::error("[Tick] Frame {} failed: {}", m_frameCount, e.what());
    }
}

void TickDriver::OnPointerDown(float x, float y, PointerButton button) {
    m_dragAnchor = glm::vec2(x, y);
    m_dragButton = button;
    if (button == PointerButton::Primary) {
        m_pointer.OnPointerDown(glm::vec2(x, y));
    }
}

Game::PointerIntent TickDriver::OnPointerUp(float x, float y) {
    const bool panning = m_dragAnchor && m_dragButton == PointerButton::Secondary;
    m_dragAnchor.reset();
    if (panning) {
        return Game::PointerIntent{};
    }
    return m_pointer.OnPointerUp(glm::vec2(x, y));
}

void TickDriver::OnPointerMove(float x, float y) {
    const glm::vec2 screen(x, y);

    if (m_dragAnchor) {
        const glm::vec2 delta = screen - *m_dragAnchor;
        if (m_dragButton == PointerButton::Secondary) {
            m_camera.Pan(delta.x, delta.y);
        } else {
            m_camera.Orbit(delta.x, delta.y);
        }
        m_dragAnchor = screen;
    }

    const bool hovering = m_pointer.IsHoveringInteractive(screen);
    if (hovering != m_hovering) {
        m_hovering = hovering;
        m_sink.OnCursorChanged(hovering);
    }
}

void TickDriver::OnWheel(float deltaY) {
    m_camera.Zoom(deltaY);
}

void TickDriver::OnKeyDown(const std::string& key) {
    spdlog::debug("[Input] Key {}", key);
    m_coordinator.OnKeyDown(key);
}

void TickDriver::ApplyQualitySettings(const Game::QualitySettings& settings) {
    if (m_qualityApplied && settings == m_quality) {
        return;
    }
    m_quality = settings;
    m_qualityApplied = true;

    uint32_t particles = 0;
    uint32_t decorations = 0;
    auto view = m_registry.View<Scene::QualityLayerComponent, Scene::VisibilityComponent>();
    for (auto entity : view) {
        const auto& layer = view.get<Scene::QualityLayerComponent>(entity);
        auto& visibility = view.get<Scene::VisibilityComponent>(entity);
        if (layer.layer == Scene::QualityLayer::Particles) {
            visibility.visible = settings.particlesEnabled;
            ++particles;
        } else {
            visibility.visible = settings.decorationsEnabled;
            ++decorations;
        }
    }

    spdlog::info("[Quality] pixelDensity={:.2f} shadows={} particles={} ({}) decorations={} ({})",
                 settings.pixelDensity, settings.shadowsEnabled,
                 settings.particlesEnabled, particles, settings.decorationsEnabled, decorations);
    m_sink.OnQualityChanged(settings);
}

} // namespace Atrium::Core
