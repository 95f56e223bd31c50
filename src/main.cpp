// atrium_sim
// Headless driver for the Atrium core: builds the office layout, runs the
// tick driver at 60 Hz of simulated time and replays a scripted sequence of
// clicks, keys and quality changes, logging every transition.
//
//   atrium_sim [--config <path>] [--seconds <N>] [--verbose]

#include "Core/TickDriver.h"
#include "Game/ContentStore.h"
#include "Game/PresentationSink.h"
#include "Scene/ECS_Registry.h"
#include "Scene/OfficeLayout.h"
#include "Utils/ConfigLoader.h"
#include <glm/gtc/matrix_transform.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace Atrium;

namespace {

constexpr double kFrameMs = 1000.0 / 60.0;
constexpr float kViewportWidth = 1280.0f;
constexpr float kViewportHeight = 720.0f;
constexpr float kPickRadiusPx = 40.0f;

void ConfigureLogging(bool verbose) {
    std::error_code ec;
    std::filesystem::create_directories("logs", ec);

    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    std::vector<spdlog::sink_ptr> sinks{consoleSink};
    if (!ec) {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>("logs/atrium_last_run.txt", true));
    }

    auto logger = std::make_shared<spdlog::logger>("atrium", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);

    // Info by default; retargets and per-click classification are debug
    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    spdlog::flush_on(spdlog::level::warn);
}

// Projects entity positions through a pinhole camera matching the orbit rig
class ProjectionPicker : public Game::ScenePicker {
public:
    explicit ProjectionPicker(const Scene::ECS_Registry& registry) : m_registry(registry) {}

    void SetCamera(const Game::OrbitCamera* camera) { m_camera = camera; }

    [[nodiscard]] std::optional<glm::vec2> Project(const glm::vec3& world) const {
        if (!m_camera) return std::nullopt;

        const glm::mat4 view = glm::lookAt(m_camera->GetPosition(), m_camera->GetTarget(), glm::vec3(0.0f, 1.0f, 0.0f));
        const glm::mat4 proj = glm::perspective(glm::radians(60.0f), kViewportWidth / kViewportHeight, 0.1f, 500.0f);
        const glm::vec4 clip = proj * view * glm::vec4(world, 1.0f);
        if (clip.w <= 0.0f) return std::nullopt;

        const glm::vec3 ndc = glm::vec3(clip) / clip.w;
        return glm::vec2((ndc.x * 0.5f + 0.5f) * kViewportWidth, (1.0f - (ndc.y * 0.5f + 0.5f)) * kViewportHeight);
    }

    bool Hits(const glm::vec2& screen, entt::entity entity) const override {
        if (entity == entt::null) return false;

        if (auto projected = Project(m_registry.GetWorldPosition(entity))) {
            if (glm::distance(*projected, screen) <= kPickRadiusPx) return true;
        }
        for (entt::entity child : m_registry.GetChildren(entity)) {
            if (m_registry.IsVisible(child) && Hits(screen, child)) return true;
        }
        return false;
    }

private:
    const Scene::ECS_Registry& m_registry;
    const Game::OrbitCamera* m_camera = nullptr;
};

class LoggingPresentationSink : public Game::PresentationSink {
public:
    void OnPanelContentRequested(const std::string& key, const Game::ContentRecord& record) override {
        spdlog::info("[Present] Modal '{}': {} ({} technologies)", key, record.title, record.technologies.size());
    }
    void OnContentUnavailable(const std::string& key) override {
        spdlog::warn("[Present] Content unavailable for '{}'", key);
    }
    void OnExternalLinkRequested(const std::string& url) override {
        spdlog::info("[Present] Open link {}", url);
    }
    void OnInformationalDialogueRequested(const std::string& body) override {
        spdlog::info("[Present] Dialogue: {}", body);
    }
    void OnActiveSectionChanged(const std::string& section) override {
        spdlog::info("[Present] Navigation bar -> {}", section);
    }
    void OnCursorChanged(bool interactive) override {
        spdlog::debug("[Present] Cursor {}", interactive ? "pointer" : "default");
    }
};

struct ScriptStep {
    double atMs;
    std::string description;
    std::function<void()> action;
};

} // namespace

int main(int argc, char* argv[]) {
    std::string configPath = "assets/config/atrium.json";
    double seconds = 40.0;
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg.rfind("--config=", 0) == 0) {
            configPath = arg.substr(std::string("--config=").size());
        } else if (arg == "--seconds" && i + 1 < argc) {
            seconds = std::atof(argv[++i]);
        } else if (arg.rfind("--seconds=", 0) == 0) {
            seconds = std::atof(arg.substr(std::string("--seconds=").size()).c_str());
        } else if (arg == "--verbose") {
            verbose = true;
        } else {
            std::fprintf(stderr, "usage: atrium_sim [--config <path>] [--seconds <N>] [--verbose]\n");
            return 2;
        }
    }

    ConfigureLogging(verbose);
    spdlog::info("===================================");
    spdlog::info("  Atrium: focus & agent simulation");
    spdlog::info("===================================");

    try {
        auto configResult = Utils::ConfigLoader::LoadAtriumConfig(configPath);
        if (configResult.IsErr()) {
            spdlog::critical("Invalid configuration: {}", configResult.Error());
            return 1;
        }
        const Utils::AtriumConfig& config = configResult.Value();

        auto contentResult = Game::ContentStore::LoadFromFile(config.contentPath);
        Game::ContentStore content;
        if (contentResult.IsErr()) {
            spdlog::warn("[Content] {}; details requests will report unavailable content", contentResult.Error());
        } else {
            content = std::move(contentResult).Value();
        }

        Scene::ECS_Registry registry;
        Scene::OfficeLayoutDesc layout;
        layout.agentStart = config.navigator.start;
        for (const auto& link : config.overlayLinks) {
            layout.overlayLinks.push_back({link.label, link.url});
        }
        const Scene::SceneHandles handles = Scene::BuildOfficeLayout(registry, layout);

        ProjectionPicker picker(registry);
        LoggingPresentationSink sink;
        Core::TickDriver driver(config, registry, handles, content, picker, sink);
        picker.SetCamera(&driver.GetCamera());

        auto clickEntity = [&](entt::entity entity, const char* what) {
            auto screen = picker.Project(registry.GetWorldPosition(entity));
            if (!screen) {
                spdlog::info("[Script] {} is behind the camera; click skipped", what);
                return;
            }
            driver.OnPointerMove(screen->x, screen->y);
            driver.OnPointerDown(screen->x, screen->y);
            const auto intent = driver.OnPointerUp(screen->x, screen->y);
            spdlog::info("[Script] Click {} -> {}", what, Game::PointerIntentKindName(intent.kind));
        };

        std::vector<ScriptStep> script = {
            {2000.0, "focus ABOUT", [&] { clickEntity(handles.panels[0].root, "ABOUT panel"); }},
            {5000.0, "ABOUT details", [&] { clickEntity(handles.panels[0].detailsButton, "ABOUT details"); }},
            {6000.0, "switch to PROJECTS", [&] { driver.GetCoordinator().FocusHologram(1); }},
            {10000.0, "PROJECTS back", [&] { clickEntity(handles.panels[1].backButton, "PROJECTS back"); }},
            {13000.0, "agent help", [&] { driver.GetCoordinator().EnterAgentHelp(); }},
            {17000.0, "confirm help", [&] { clickEntity(handles.agent.confirmButton, "help confirm"); }},
            {19000.0, "lower quality", [&] {
                Game::QualitySettings low = driver.GetQuality();
                low.pixelDensity = 0.75f;
                low.particlesEnabled = false;
                driver.ApplyQualitySettings(low);
            }},
            {21000.0, "device focus", [&] { clickEntity(handles.device, "device"); }},
            {24000.0, "overlay link", [&] {
                const auto& overlay = driver.GetCoordinator().GetDeviceOverlay();
                if (!overlay.linkButtons.empty()) clickEntity(overlay.linkButtons.front(), "overlay link");
            }},
            {25000.0, "overlay close", [&] {
                const auto& overlay = driver.GetCoordinator().GetDeviceOverlay();
                if (overlay.IsBuilt()) clickEntity(overlay.closeButton, "overlay close");
            }},
            {28000.0, "nav skills", [&] { driver.GetCoordinator().NavigateToSection("skills"); }},
            {32000.0, "escape", [&] { driver.OnKeyDown("Escape"); }},
            {34000.0, "agent help again", [&] { driver.GetCoordinator().EnterAgentHelp(); }},
            {38000.0, "wheel away from the agent", [&] {
                for (int notch = 0; notch < 20; ++notch) driver.OnWheel(100.0f);
            }},
        };

        driver.Start(0.0);
        size_t nextStep = 0;
        const double endMs = seconds * 1000.0;
        double lastReportMs = 0.0;

        for (double now = kFrameMs; now <= endMs; now += kFrameMs) {
            driver.Tick(now);

            while (nextStep < script.size() && script[nextStep].atMs <= now) {
                spdlog::info("[Script] t={:.1f}s {}", now / 1000.0, script[nextStep].description);
                script[nextStep].action();
                ++nextStep;
            }

            if (now - lastReportMs >= 5000.0) {
                lastReportMs = now;
                const auto& agent = driver.GetNavigator().GetState();
                spdlog::info("[Sim] t={:.0f}s mode={} agent=({:.1f}, {:.1f}) {} retargets={} collisions={}",
                             now / 1000.0, driver.GetCoordinator().GetModeName(),
                             agent.position.x, agent.position.y, AI::AgentMotionStateName(agent.motion),
                             agent.retargetCount, agent.collisionRetargets);
            }
        }

        const auto& agent = driver.GetNavigator().GetState();
        spdlog::info("Simulation finished: {} frames, agent travelled {:.1f} units, final mode {}",
                     driver.GetFrameCount(), agent.distanceTravelled, driver.GetCoordinator().GetModeName());
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }

    spdlog::shutdown();
    return 0;
}
