#include "ECS_Registry.h"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace Atrium::Scene {

entt::entity ECS_Registry::CreateEntity() {
    entt::entity entity = m_registry.create();
    spdlog::debug("Entity created: {}", static_cast<uint32_t>(entity));
    return entity;
}

entt::entity ECS_Registry::CreateNode(const std::string& tag,
                                      const glm::vec3& position,
                                      entt::entity parent) {
    entt::entity entity = CreateEntity();

    auto& transform = AddComponent<TransformComponent>(entity);
    transform.position = position;
    AddComponent<TagComponent>(entity, tag);

    if (parent != entt::null) {
        SetParent(entity, parent);
    }
    return entity;
}

bool ECS_Registry::IsVisible(entt::entity entity) const {
    const auto* visibility = TryGetComponent<VisibilityComponent>(entity);
    return visibility == nullptr || visibility->visible;
}

void ECS_Registry::SetVisible(entt::entity entity, bool visible) {
    if (entity == entt::null || !m_registry.valid(entity)) {
        return;
    }
    m_registry.get_or_emplace<VisibilityComponent>(entity).visible = visible;
}

void ECS_Registry::SetParent(entt::entity child, entt::entity parent) {
    if (!m_registry.all_of<TransformComponent>(child)) {
        return;
    }

    auto& childTransform = m_registry.get<TransformComponent>(child);

    if (childTransform.parent != entt::null) {
        auto it = m_childrenOf.find(childTransform.parent);
        if (it != m_childrenOf.end()) {
            auto& children = it->second;
            children.erase(std::remove(children.begin(), children.end(), child), children.end());
            if (children.empty()) {
                m_childrenOf.erase(it);
            }
        }
    }

    childTransform.parent = parent;

    if (parent != entt::null) {
        m_childrenOf[parent].push_back(child);
    }
}

entt::entity ECS_Registry::GetParent(entt::entity child) const {
    const auto* transform = TryGetComponent<TransformComponent>(child);
    return transform ? transform->parent : entt::null;
}

std::vector<entt::entity> ECS_Registry::GetChildren(entt::entity parent) const {
    auto it = m_childrenOf.find(parent);
    if (it != m_childrenOf.end()) {
        return it->second;
    }
    return {};
}

glm::mat4 ECS_Registry::GetWorldMatrix(entt::entity entity) const {
    glm::mat4 world(1.0f);
    // Walk towards the root; hierarchies here are a few levels deep at most
    for (entt::entity current = entity; current != entt::null;) {
        const auto* transform = TryGetComponent<TransformComponent>(current);
        if (!transform) {
            break;
        }
        world = transform->GetLocalMatrix() * world;
        current = transform->parent;
    }
    return world;
}

glm::vec3 ECS_Registry::GetWorldPosition(entt::entity entity) const {
    return glm::vec3(GetWorldMatrix(entity)[3]);
}

std::string ECS_Registry::DescribeScene() const {
    std::string description = "Scene contains:\n";

    auto view = m_registry.view<const TagComponent, const TransformComponent>();
    for (auto entity : view) {
        const auto& tag = view.get<const TagComponent>(entity);
        if (GetParent(entity) != entt::null) {
            continue;  // roots only
        }
        const glm::vec3 p = GetWorldPosition(entity);
        description += "  - " + tag.tag + " at (" +
                       std::to_string(p.x) + ", " +
                       std::to_string(p.y) + ", " +
                       std::to_string(p.z) + ")\n";
    }

    return description;
}

} // namespace Atrium::Scene
