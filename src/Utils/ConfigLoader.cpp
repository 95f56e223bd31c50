// ConfigLoader.cpp
// JSON configuration loading for the Atrium core.

#include "ConfigLoader.h"
#include <fstream>
#include <spdlog/spdlog.h>

namespace Atrium::Utils {

Result<nlohmann::json> ConfigLoader::ReadJsonFile(const std::string& path, const std::string& kind) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Result<nlohmann::json>::Err("Failed to open " + kind + " file: " + path);
    }

    // Hand-edited files may carry // and /* */ comments
    auto j = nlohmann::json::parse(file, nullptr, false, true);
    if (j.is_discarded()) {
        return Result<nlohmann::json>::Err("Malformed JSON in " + kind + " file: " + path);
    }
    return Result<nlohmann::json>::Ok(std::move(j));
}

glm::vec3 ConfigLoader::GetVec3Or(const nlohmann::json& j, const std::string& key, const glm::vec3& defaultValue) {
    if (!j.contains(key)) {
        return defaultValue;
    }
    const auto& v = j[key];
    if (!v.is_array() || v.size() != 3) {
        spdlog::warn("[Config] '{}' must be a 3-element array; using default", key);
        return defaultValue;
    }
    try {
        return glm::vec3(v[0].get<float>(), v[1].get<float>(), v[2].get<float>());
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("[Config] '{}' is not numeric ({}); using default", key, e.what());
        return defaultValue;
    }
}

Result<AtriumConfig> ConfigLoader::LoadAtriumConfig(const std::string& path) {
    auto jsonResult = ReadJsonFile(path, "config");

    // If file doesn't exist or can't be parsed, return defaults
    if (jsonResult.IsErr()) {
        spdlog::warn("[Config] Could not load {}: {}. Using defaults.", path, jsonResult.Error());
        return Result<AtriumConfig>::Ok(AtriumConfig{});
    }

    auto config = ParseAtriumConfig(jsonResult.Value());
    if (config.IsOk()) {
        spdlog::info("[Config] Loaded {}", path);
    }
    return config;
}

Result<AtriumConfig> ConfigLoader::ParseAtriumConfig(const nlohmann::json& j) {
    if (!j.is_object()) {
        return Result<AtriumConfig>::Err("Config root must be a JSON object");
    }

    AtriumConfig config;

    // Navigator
    if (j.contains("navigator")) {
        const auto& n = j["navigator"];
        auto& nav = config.navigator;
        nav.moveSpeed = GetOr(n, "moveSpeed", nav.moveSpeed);
        nav.agentRadius = GetOr(n, "agentRadius", nav.agentRadius);
        nav.wheelRadius = GetOr(n, "wheelRadius", nav.wheelRadius);
        nav.arrivalDistance = GetOr(n, "arrivalDistance", nav.arrivalDistance);
        nav.retargetMinMs = GetOr(n, "retargetMinMs", nav.retargetMinMs);
        nav.retargetMaxMs = GetOr(n, "retargetMaxMs", nav.retargetMaxMs);
        nav.headingSmoothing = GetOr(n, "headingSmoothing", nav.headingSmoothing);
        nav.maxAttempts = GetOr(n, "maxAttempts", nav.maxAttempts);
        nav.seed = GetOr(n, "seed", nav.seed);
        nav.start.x = GetOr(n, "startX", nav.start.x);
        nav.start.y = GetOr(n, "startZ", nav.start.y);
        config.sampleHalfExtent = GetOr(n, "sampleHalfExtent", config.sampleHalfExtent);

        const AI::NavigatorParams defaults;
        if (nav.wheelRadius <= 0.0f) {
            spdlog::warn("[Config] navigator.wheelRadius must be positive (got {}); using {}",
                         nav.wheelRadius, defaults.wheelRadius);
            nav.wheelRadius = defaults.wheelRadius;
        }
        if (nav.retargetMinMs < 0.0 || nav.retargetMaxMs < nav.retargetMinMs) {
            spdlog::warn("[Config] navigator retarget window [{}, {}] is invalid; using [{}, {}]",
                         nav.retargetMinMs, nav.retargetMaxMs, defaults.retargetMinMs, defaults.retargetMaxMs);
            nav.retargetMinMs = defaults.retargetMinMs;
            nav.retargetMaxMs = defaults.retargetMaxMs;
        }
    }

    // Obstacles replace the default office layout entirely
    if (j.contains("obstacles")) {
        const auto& list = j["obstacles"];
        if (list.is_array()) {
            config.obstacles.clear();
            for (const auto& o : list) {
                AI::Obstacle obstacle;
                obstacle.centerX = GetOr(o, "x", 0.0f);
                obstacle.centerZ = GetOr(o, "z", 0.0f);
                obstacle.width = GetOr(o, "width", 0.0f);
                obstacle.depth = GetOr(o, "depth", 0.0f);
                if (obstacle.width <= 0.0f || obstacle.depth <= 0.0f) {
                    spdlog::warn("[Config] Skipping obstacle at ({}, {}) with empty footprint",
                                 obstacle.centerX, obstacle.centerZ);
                    continue;
                }
                config.obstacles.push_back(obstacle);
            }
        } else {
            spdlog::warn("[Config] 'obstacles' must be an array; keeping the default layout");
        }
    }
    config.boundary = GetOr(j, "boundary", config.boundary);

    // Focus timings and thresholds
    if (j.contains("focus")) {
        const auto& f = j["focus"];
        auto& focus = config.focus;
        focus.focusDurationMs = GetOr(f, "focusDurationMs", focus.focusDurationMs);
        focus.deviceDurationMs = GetOr(f, "deviceDurationMs", focus.deviceDurationMs);
        focus.driftResumeDelayMs = GetOr(f, "driftResumeDelayMs", focus.driftResumeDelayMs);
        focus.helpGraceMs = GetOr(f, "helpGraceMs", focus.helpGraceMs);
        focus.helpMaxCameraDistance = GetOr(f, "helpMaxCameraDistance", focus.helpMaxCameraDistance);
        focus.helpMaxTargetDistance = GetOr(f, "helpMaxTargetDistance", focus.helpMaxTargetDistance);
        focus.panelTrackRadius = GetOr(f, "panelTrackRadius", focus.panelTrackRadius);
        focus.panelFrontDistance = GetOr(f, "panelFrontDistance", focus.panelFrontDistance);
        focus.dragThresholdPx = GetOr(f, "dragThresholdPx", focus.dragThresholdPx);
        focus.helpDialogueBody = GetOr(f, "helpDialogueBody", focus.helpDialogueBody);
    }

    // Camera
    if (j.contains("camera")) {
        const auto& c = j["camera"];
        auto& camera = config.camera;
        camera.homePosition = GetVec3Or(c, "homePosition", camera.homePosition);
        camera.homeTarget = GetVec3Or(c, "homeTarget", camera.homeTarget);
        camera.autoRotateSpeed = GetOr(c, "autoRotateSpeed", camera.autoRotateSpeed);
        camera.minDistance = GetOr(c, "minDistance", camera.minDistance);
        camera.maxDistance = GetOr(c, "maxDistance", camera.maxDistance);
        camera.rotateSensitivity = GetOr(c, "rotateSensitivity", camera.rotateSensitivity);
        camera.zoomSensitivity = GetOr(c, "zoomSensitivity", camera.zoomSensitivity);
        camera.panSensitivity = GetOr(c, "panSensitivity", camera.panSensitivity);
    }

    // Initial quality
    if (j.contains("quality")) {
        const auto& q = j["quality"];
        auto& quality = config.quality;
        quality.pixelDensity = GetOr(q, "pixelDensity", quality.pixelDensity);
        quality.shadowsEnabled = GetOr(q, "shadowsEnabled", quality.shadowsEnabled);
        quality.particlesEnabled = GetOr(q, "particlesEnabled", quality.particlesEnabled);
        quality.decorationsEnabled = GetOr(q, "decorationsEnabled", quality.decorationsEnabled);
    }

    config.contentPath = GetOr(j, "contentPath", config.contentPath);

    if (j.contains("overlayLinks") && j["overlayLinks"].is_array()) {
        config.overlayLinks.clear();
        for (const auto& link : j["overlayLinks"]) {
            OverlayLink entry;
            entry.label = GetOr(link, "label", std::string("Link"));
            entry.url = GetOr(link, "url", std::string());
            if (entry.url.empty()) {
                spdlog::warn("[Config] Skipping overlay link '{}' without url", entry.label);
                continue;
            }
            config.overlayLinks.push_back(std::move(entry));
        }
    }

    return Result<AtriumConfig>::Ok(std::move(config));
}

} // namespace Atrium::Utils
