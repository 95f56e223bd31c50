#pragma once

// TickDriver.h
// Per-frame entry point. Owns the core subsystems and advances them in a
// fixed order: tweens, camera drift, agent navigator, focus coordinator.
// Input events are forwarded between ticks.

#include "AI/AgentNavigator.h"
#include "AI/ObstacleMap.h"
#include "Animation/TweenSystem.h"
#include "Game/FocusCoordinator.h"
#include "Game/HologramPanels.h"
#include "Game/OrbitCamera.h"
#include "Game/PointerIntent.h"
#include "Game/QualitySettings.h"
#include "Scene/SceneHandles.h"
#include "Utils/ConfigLoader.h"
#include <glm/glm.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace Atrium::Game {
class ContentStore;
class PresentationSink;
}

namespace Atrium::Core {

// Primary drags orbit and may click; secondary drags pan and never click
enum class PointerButton : uint8_t {
    Primary,
    Secondary
};

class TickDriver {
public:
    TickDriver(const Utils::AtriumConfig& config,
               Scene::ECS_Registry& registry,
               const Scene::SceneHandles& handles,
               const Game::ContentStore& content,
               const Game::ScenePicker& picker,
               Game::PresentationSink& sink);

    TickDriver(const TickDriver&) = delete;
    TickDriver& operator=(const TickDriver&) = delete;

    // Spawn the agent and apply the initial quality settings
    void Start(double nowMs);

    // One frame. Never throws.
    void Tick(double nowMs);

    // Input (screen pixels)
    void OnPointerDown(float x, float y, PointerButton button = PointerButton::Primary);
    Game::PointerIntent OnPointerUp(float x, float y);
    void OnPointerMove(float x, float y);
    void OnWheel(float deltaY);
    void OnKeyDown(const std::string& key);

    // Called by the adaptive quality controller once per change
    void ApplyQualitySettings(const Game::QualitySettings& settings);

    [[nodiscard]] Game::FocusCoordinator& GetCoordinator() { return m_coordinator; }
    [[nodiscard]] const Game::FocusCoordinator& GetCoordinator() const { return m_coordinator; }
    [[nodiscard]] AI::AgentNavigator& GetNavigator() { return m_navigator; }
    [[nodiscard]] const AI::AgentNavigator& GetNavigator() const { return m_navigator; }
    [[nodiscard]] Game::OrbitCamera& GetCamera() { return m_camera; }
    [[nodiscard]] const Game::HologramPanels& GetPanels() const { return m_panels; }
    [[nodiscard]] Animation::TweenSystem& GetTweens() { return m_tweens; }
    [[nodiscard]] const AI::ObstacleMap& GetObstacles() const { return m_obstacles; }
    [[nodiscard]] const Game::QualitySettings& GetQuality() const { return m_quality; }
    [[nodiscard]] uint64_t GetFrameCount() const { return m_frameCount; }
    [[nodiscard]] bool IsHoveringInteractive() const { return m_hovering; }

private:
    Scene::ECS_Registry& m_registry;
    Game::PresentationSink& m_sink;

    AI::ObstacleMap m_obstacles;
    Animation::TweenSystem m_tweens;
    Game::OrbitCamera m_camera;
    AI::AgentNavigator m_navigator;
    Game::HologramPanels m_panels;
    Game::FocusCoordinator m_coordinator;
    Game::PointerIntentResolver m_pointer;

    Game::QualitySettings m_quality;
    bool m_qualityApplied = false;

    std::optional<double> m_lastTickMs;
    uint64_t m_frameCount = 0;

    std::optional<glm::vec2> m_dragAnchor;
    PointerButton m_dragButton = PointerButton::Primary;
    bool m_hovering = false;
};

} // namespace Atrium::Core
