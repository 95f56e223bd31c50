#pragma once

// FocusMode.h
// The closed set of mutually exclusive interaction modes, the camera pose
// saved for one mode session, and the coordinator's tunables.

#include <glm/glm.hpp>
#include <array>
#include <cstdint>
#include <string>
#include <variant>

namespace Atrium::Game {

struct DefaultMode {};

struct HologramFocus {
    int32_t panelIndex = 0;
};

struct AgentHelp {};

struct DeviceFocus {};

using FocusMode = std::variant<DefaultMode, HologramFocus, AgentHelp, DeviceFocus>;

[[nodiscard]] inline bool IsDefault(const FocusMode& mode) {
    return std::holds_alternative<DefaultMode>(mode);
}

// "Default", "HologramFocus(2)", ...
[[nodiscard]] std::string FocusModeName(const FocusMode& mode);

// Camera pose captured when a non-Default mode is entered from Default
struct SessionContext {
    glm::vec3 savedCameraPosition{0.0f};
    glm::vec3 savedCameraTarget{0.0f};
};

struct FocusParams {
    double focusDurationMs = 2000.0;
    double deviceDurationMs = 1500.0;
    double driftResumeDelayMs = 1000.0;

    double helpGraceMs = 3000.0;
    float helpMaxCameraDistance = 25.0f;
    float helpMaxTargetDistance = 20.0f;
    glm::vec3 helpCameraOffset{8.0f, 5.0f, 8.0f};   // From the agent's base
    glm::vec3 helpTargetOffset{0.0f, 5.0f, 0.0f};   // Upper body

    float panelTrackRadius = 8.0f;
    float panelFrontDistance = 12.0f;

    glm::vec3 deviceCameraOffset{-1.8f, 1.3f, 1.5f};
    glm::vec3 deviceTargetOffset{0.0f, 1.0f, 0.0f};

    float dragThresholdPx = 5.0f;

    std::string helpDialogueBody =
        "How to use this office: drag to orbit, scroll to zoom. Click a hologram "
        "(About, Projects, Skills, Contact) to focus it, then Details for more or "
        "Back to return. Click the robot any time for help, or the phone to get in touch.";
};

// Navigation-bar section names; "home" means Default
inline constexpr const char* kHomeSection = "home";

} // namespace Atrium::Game
