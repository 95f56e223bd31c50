// test_config_content.cpp
// Configuration parsing, content store lookups and quality-setting
// application.

#include "TestScene.h"
#include "Game/ContentStore.h"
#include "Utils/ConfigLoader.h"
#include <filesystem>
#include <fstream>
#include <iostream>

using namespace Atrium;
using AtriumTest::TestScene;

// ============================================================================
// Test Framework (minimal)
// ============================================================================

static int g_testsPassed = 0;
static int g_testsFailed = 0;

#define TEST_ASSERT(condition, message) \
    do { \
        if (!(condition)) { \
            std::cerr << "[FAIL] " << __FUNCTION__ << ": " << message << std::endl; \
            g_testsFailed++; \
            return false; \
        } \
    } while(0)

#define TEST_PASS() \
    do { \
        std::cout << "[PASS] " << __FUNCTION__ << std::endl; \
        g_testsPassed++; \
        return true; \
    } while(0)

// ============================================================================
// Config
// ============================================================================

bool test_empty_document_gives_defaults() {
    auto result = Utils::ConfigLoader::ParseAtriumConfig(nlohmann::json::object());
    TEST_ASSERT(result.IsOk(), "Empty object is valid");

    const auto& config = result.Value();
    TEST_ASSERT(config.navigator.retargetMinMs == 3000.0 && config.navigator.retargetMaxMs == 5000.0,
                "Default retarget window");
    TEST_ASSERT(config.boundary == 40.0f, "Default boundary");
    TEST_ASSERT(config.obstacles.size() == AI::ObstacleMap::DefaultOfficeObstacles().size(), "Default office obstacles");
    TEST_ASSERT(config.focus.helpGraceMs == 3000.0, "Default grace period");
    TEST_ASSERT(config.focus.panelTrackRadius == 8.0f, "Default tracking radius");
    TEST_ASSERT(!config.overlayLinks.empty(), "Default overlay links");
    TEST_PASS();
}

bool test_overrides_applied() {
    const nlohmann::json doc = {
        {"navigator", {{"moveSpeed", 0.1}, {"seed", 42}, {"startX", 3.0}, {"startZ", -4.0}}},
        {"obstacles", nlohmann::json::array({
            {{"x", 1.0}, {"z", 2.0}, {"width", 3.0}, {"depth", 4.0}},
            {{"x", 9.0}, {"z", 9.0}, {"width", 0.0}, {"depth", 4.0}},
        })},
        {"focus", {{"helpGraceMs", 1500}, {"dragThresholdPx", 8.0}}},
        {"camera", {{"homePosition", nlohmann::json::array({1.0, 2.0, 3.0})}}},
        {"quality", {{"particlesEnabled", false}}},
        {"overlayLinks", nlohmann::json::array({
            {{"label", "Site"}, {"url", "https://example.org"}},
            {{"label", "Broken"}},
        })},
    };

    auto result = Utils::ConfigLoader::ParseAtriumConfig(doc);
    TEST_ASSERT(result.IsOk(), "Valid document");
    const auto& config = result.Value();

    TEST_ASSERT(config.navigator.moveSpeed == 0.1f, "moveSpeed override");
    TEST_ASSERT(config.navigator.seed == 42u, "seed override");
    TEST_ASSERT(config.navigator.start == glm::vec2(3.0f, -4.0f), "start override");
    TEST_ASSERT(config.navigator.retargetMaxMs == 5000.0, "Untouched keys keep defaults");

    TEST_ASSERT(config.obstacles.size() == 1, "Obstacles replaced; empty footprint skipped");
    TEST_ASSERT(config.obstacles[0].centerZ == 2.0f && config.obstacles[0].depth == 4.0f, "Obstacle fields");

    TEST_ASSERT(config.focus.helpGraceMs == 1500.0, "Grace override");
    TEST_ASSERT(config.focus.dragThresholdPx == 8.0f, "Drag threshold override");
    TEST_ASSERT(config.camera.homePosition == glm::vec3(1.0f, 2.0f, 3.0f), "Camera home override");
    TEST_ASSERT(config.camera.homeTarget == Game::CameraConfig{}.homeTarget, "Missing vector keeps default");
    TEST_ASSERT(!config.quality.particlesEnabled && config.quality.decorationsEnabled, "Quality override");

    TEST_ASSERT(config.overlayLinks.size() == 1 && config.overlayLinks[0].label == "Site", "Link without url skipped");
    TEST_PASS();
}

bool test_wrong_types_fall_back() {
    const nlohmann::json doc = {
        {"navigator", {{"moveSpeed", "fast"}}},
        {"camera", {{"homePosition", nlohmann::json::array({1.0, 2.0})}}},
        {"obstacles", "none"},
    };
    auto result = Utils::ConfigLoader::ParseAtriumConfig(doc);
    TEST_ASSERT(result.IsOk(), "Bad values are not fatal");
    TEST_ASSERT(result.Value().navigator.moveSpeed == AI::NavigatorParams{}.moveSpeed, "Bad scalar keeps default");
    TEST_ASSERT(result.Value().camera.homePosition == Game::CameraConfig{}.homePosition, "Short array keeps default");
    TEST_ASSERT(!result.Value().obstacles.empty(), "Non-array obstacles keep the office layout");
    TEST_PASS();
}

bool test_invalid_navigator_values_rejected() {
    const nlohmann::json doc = {
        {"navigator", {{"wheelRadius", 0.0}, {"retargetMinMs", 6000}, {"retargetMaxMs", 2000}}},
    };
    auto result = Utils::ConfigLoader::ParseAtriumConfig(doc);
    TEST_ASSERT(result.IsOk(), "Bad values are not fatal");
    const AI::NavigatorParams defaults;
    TEST_ASSERT(result.Value().navigator.wheelRadius == defaults.wheelRadius, "Zero wheel radius replaced");
    TEST_ASSERT(result.Value().navigator.retargetMinMs == defaults.retargetMinMs &&
                result.Value().navigator.retargetMaxMs == defaults.retargetMaxMs, "Inverted window replaced");

    auto negative = Utils::ConfigLoader::ParseAtriumConfig(nlohmann::json{{"navigator", {{"wheelRadius", -0.4}}}});
    TEST_ASSERT(negative.Value().navigator.wheelRadius == defaults.wheelRadius, "Negative wheel radius replaced");
    TEST_PASS();
}

bool test_config_file_with_comments() {
    const std::filesystem::path path = std::filesystem::temp_directory_path() / "atrium_config_comments.json";
    {
        std::ofstream out(path);
        out << "{\n"
               "  // tuned for the demo booth\n"
               "  \"navigator\": { \"moveSpeed\": 0.05 },\n"
               "  /* camera input */\n"
               "  \"camera\": { \"zoomSensitivity\": 0.002, \"panSensitivity\": 0.004 }\n"
               "}\n";
    }

    auto result = Utils::ConfigLoader::LoadAtriumConfig(path.string());
    std::filesystem::remove(path);
    TEST_ASSERT(result.IsOk(), "Commented file loads");
    TEST_ASSERT(result.Value().navigator.moveSpeed == 0.05f, "Value after a line comment");
    TEST_ASSERT(result.Value().camera.zoomSensitivity == 0.002f, "Value after a block comment");
    TEST_ASSERT(result.Value().camera.panSensitivity == 0.004f, "Pan sensitivity read");

    auto missing = Utils::ConfigLoader::ReadJsonFile("does/not/exist.json", "content");
    TEST_ASSERT(missing.IsErr() && missing.Error().find("content") != std::string::npos,
                "Error names the kind of file");
    TEST_PASS();
}

bool test_non_object_root_rejected() {
    auto result = Utils::ConfigLoader::ParseAtriumConfig(nlohmann::json::array({1, 2, 3}));
    TEST_ASSERT(result.IsErr(), "Array root is an error");
    TEST_PASS();
}

bool test_missing_file_gives_defaults() {
    auto result = Utils::ConfigLoader::LoadAtriumConfig("does/not/exist.json");
    TEST_ASSERT(result.IsOk(), "Missing file falls back to defaults");
    TEST_ASSERT(result.Value().contentPath == "assets/content/portfolio.json", "Default content path");
    TEST_PASS();
}

// ============================================================================
// Content
// ============================================================================

bool test_content_lookup() {
    auto result = Game::ContentStore::FromJson(nlohmann::json{
        {"about", {{"title", "About"}, {"description", "Hi."}, {"technologies", nlohmann::json::array({"C++", "glm"})},
                   {"location", "Remote"}}},
        {"broken", 12},
    });
    TEST_ASSERT(result.IsOk(), "Store built");

    const auto& store = result.Value();
    TEST_ASSERT(store.Size() == 1, "Non-object record skipped");
    TEST_ASSERT(store.Contains("about") && !store.Contains("broken"), "Contains");

    auto about = store.Get("about");
    TEST_ASSERT(about.IsOk(), "Hit");
    TEST_ASSERT(about.Value().technologies.size() == 2, "Technologies parsed");
    TEST_ASSERT(about.Value().extra.value("location", std::string()) == "Remote", "Unknown fields kept as extra");

    auto miss = store.Get("contact");
    TEST_ASSERT(miss.IsErr(), "Miss is an error");
    TEST_ASSERT(miss.Error().find("contact") != std::string::npos, "Error names the key");
    TEST_PASS();
}

bool test_malformed_content_rejected() {
    auto bad = Game::ContentStore::FromJson(nlohmann::json{
        {"about", {{"technologies", "C++"}}},
    });
    TEST_ASSERT(bad.IsErr(), "Technologies must be a list of strings");

    auto notObject = Game::ContentStore::FromJson(nlohmann::json::array());
    TEST_ASSERT(notObject.IsErr(), "Root must be an object");

    auto missing = Game::ContentStore::LoadFromFile("does/not/exist.json");
    TEST_ASSERT(missing.IsErr(), "Missing file is an error");
    TEST_PASS();
}

// ============================================================================
// Quality
// ============================================================================

bool test_quality_toggles_layers() {
    TestScene scene;
    TEST_ASSERT(scene.sink.qualityChanges.size() == 1, "Initial settings applied on start");

    size_t particles = 0;
    size_t decorations = 0;
    auto countVisible = [&]() {
        particles = 0;
        decorations = 0;
        auto view = scene.registry.View<Scene::QualityLayerComponent, Scene::VisibilityComponent>();
        for (auto entity : view) {
            if (!view.get<Scene::VisibilityComponent>(entity).visible) continue;
            if (view.get<Scene::QualityLayerComponent>(entity).layer == Scene::QualityLayer::Particles) {
                ++particles;
            } else {
                ++decorations;
            }
        }
    };

    countVisible();
    TEST_ASSERT(particles > 0 && decorations > 0, "Everything on by default");

    Game::QualitySettings low = scene.driver->GetQuality();
    low.particlesEnabled = false;
    low.pixelDensity = 0.75f;
    scene.driver->ApplyQualitySettings(low);
    countVisible();
    TEST_ASSERT(particles == 0 && decorations > 0, "Particles hidden, decorations kept");
    TEST_ASSERT(scene.sink.qualityChanges.size() == 2, "Change reported once");

    scene.driver->ApplyQualitySettings(low);
    TEST_ASSERT(scene.sink.qualityChanges.size() == 2, "Identical settings are not re-applied");
    TEST_PASS();
}

int main() {
    std::cout << "================================================" << std::endl;
    std::cout << "Config, Content & Quality Tests" << std::endl;
    std::cout << "================================================" << std::endl;

    test_empty_document_gives_defaults();
    test_overrides_applied();
    test_wrong_types_fall_back();
    test_invalid_navigator_values_rejected();
    test_config_file_with_comments();
    test_non_object_root_rejected();
    test_missing_file_gives_defaults();

    std::cout << "\n--- Content ---" << std::endl;
    test_content_lookup();
    test_malformed_content_rejected();

    std::cout << "\n--- Quality ---" << std::endl;
    test_quality_toggles_layers();

    std::cout << "\n================================================" << std::endl;
    std::cout << "Results: " << g_testsPassed << " passed, " << g_testsFailed << " failed" << std::endl;
    std::cout << "================================================" << std::endl;

    return g_testsFailed > 0 ? 1 : 0;
}
