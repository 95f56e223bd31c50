#pragma once

#include <glm/glm.hpp>
#include <cstdint>
#include <string>
#include <utility>
#include <entt/entt.hpp>

namespace Atrium::Scene {

// Local transform relative to parent (or world if parent == null).
// Tweens hold raw addresses into this pool, so deletions must not relocate
// live components.
struct TransformComponent {
    static constexpr auto in_place_delete = true;

    glm::vec3 position = glm::vec3(0.0f);
    glm::vec3 rotation = glm::vec3(0.0f);   // Euler XYZ, radians; rotation.y is heading
    glm::vec3 scale    = glm::vec3(1.0f);

    entt::entity parent = entt::null;

    // Local matrix (T * Ry * Rx * Rz * S)
    [[nodiscard]] glm::mat4 GetLocalMatrix() const;
};

// Semantic label, used for scene descriptions and logs
struct TagComponent {
    std::string tag;

    TagComponent() = default;
    explicit TagComponent(std::string t) : tag(std::move(t)) {}
};

// Logical visibility plus the visual reveal channels the tweens drive.
// `visible` is what picking and the coordinator read; opacity/scale only
// matter to the renderer.
struct VisibilityComponent {
    static constexpr auto in_place_delete = true;

    bool visible = true;
    float opacity = 1.0f;
    float revealScale = 1.0f;
};

// Interactive child geometry (buttons) attached to the agent, panels or the
// device overlay.
enum class AffordanceKind : uint8_t {
    HelpConfirm,
    HelpDismiss,
    PanelBack,
    PanelDetails,
    OverlayClose,
    OverlayLink
};

struct AffordanceComponent {
    AffordanceKind kind = AffordanceKind::PanelBack;
    int32_t panelIndex = -1;     // Panel affordances only
    std::string url;             // OverlayLink only
};

// Per-panel presentation state. The fields below `trackingCamera` are
// animated by HologramPanels::ShowContent / HideContent.
struct HologramPanelComponent {
    static constexpr auto in_place_delete = true;

    int32_t index = -1;
    std::string section;         // Content store key ("about", ...)
    float restYaw = 0.0f;        // Faces the scene centre

    bool contentVisible = false;
    bool trackingCamera = false;

    float titleOffset = 0.0f;
    float subtitleOpacity = 0.0f;
    float subtitleScale = 0.8f;
    float previewOpacity = 0.0f;
    float previewScale = 0.8f;
};

// Marks entities the quality controller may hide
enum class QualityLayer : uint8_t {
    Particles,
    Decorations
};

struct QualityLayerComponent {
    QualityLayer layer = QualityLayer::Decorations;
};

} // namespace Atrium::Scene
