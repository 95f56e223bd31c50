#pragma once

// ConfigLoader.h
// Loads the Atrium JSON configuration (navigator, obstacles, focus timings,
// camera, quality, content path). Missing files and keys fall back to the
// built-in defaults.

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "AI/AgentNavigator.h"
#include "AI/ObstacleMap.h"
#include "Game/FocusMode.h"
#include "Game/OrbitCamera.h"
#include "Game/QualitySettings.h"
#include "Utils/Result.h"

namespace Atrium::Utils {

// External link shown on the device overlay
struct OverlayLink {
    std::string label;
    std::string url;
};

struct AtriumConfig {
    AI::NavigatorParams navigator;

    std::vector<AI::Obstacle> obstacles = AI::ObstacleMap::DefaultOfficeObstacles();
    float boundary = AI::ObstacleMap::kDefaultBoundary;
    float sampleHalfExtent = AI::ObstacleMap::kDefaultSampleHalfExtent;

    Game::FocusParams focus;
    Game::CameraConfig camera;
    Game::QualitySettings quality;

    std::string contentPath = "assets/content/portfolio.json";

    std::vector<OverlayLink> overlayLinks = {
        {"Message", "https://wa.me/15555550100"},
        {"Email", "mailto:hello@example.com"},
    };
};

class ConfigLoader {
public:
    // Defaults (with a warning) when the file is missing or unparsable
    static Result<AtriumConfig> LoadAtriumConfig(const std::string& path = "assets/config/atrium.json");

    // Overlay a parsed document onto the defaults. Fails only on a
    // structurally wrong document (root not an object).
    static Result<AtriumConfig> ParseAtriumConfig(const nlohmann::json& j);

    // Parse a JSON file; `kind` names the file in error messages
    static Result<nlohmann::json> ReadJsonFile(const std::string& path, const std::string& kind);

private:

    static glm::vec3 GetVec3Or(const nlohmann::json& j, const std::string& key, const glm::vec3& defaultValue);

    // Parse helpers with defaults
    template<typename T>
    static T GetOr(const nlohmann::json& j, const std::string& key, T defaultValue) {
        if (j.contains(key)) {
            try {
                return j[key].get<T>();
            } catch (const nlohmann::json::exception&) {
                return defaultValue;
            }
        }
        return defaultValue;
    }
};

} // namespace Atrium::Utils
