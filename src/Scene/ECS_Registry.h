#pragma once

#include <entt/entt.hpp>
#include <glm/glm.hpp>
#include <string>
#include <unordered_map>
#include <vector>
#include "Components.h"

namespace Atrium::Scene {

// Wrapper around the EnTT registry. The scene builder populates it once at
// load; the core only mutates transforms and visibility afterwards.
class ECS_Registry {
public:
    ECS_Registry() = default;
    ~ECS_Registry() = default;

    ECS_Registry(const ECS_Registry&) = delete;
    ECS_Registry& operator=(const ECS_Registry&) = delete;

    entt::entity CreateEntity();

    // Entity with Transform + Tag (+ optional parent)
    entt::entity CreateNode(const std::string& tag,
                            const glm::vec3& position,
                            entt::entity parent = entt::null);

    template<typename Component, typename... Args>
    Component& AddComponent(entt::entity entity, Args&&... args) {
        return m_registry.emplace<Component>(entity, std::forward<Args>(args)...);
    }

    template<typename Component>
    Component& GetComponent(entt::entity entity) {
        return m_registry.get<Component>(entity);
    }

    template<typename Component>
    const Component& GetComponent(entt::entity entity) const {
        return m_registry.get<Component>(entity);
    }

    template<typename Component>
    Component* TryGetComponent(entt::entity entity) {
        if (entity == entt::null || !m_registry.valid(entity)) return nullptr;
        return m_registry.try_get<Component>(entity);
    }

    template<typename Component>
    const Component* TryGetComponent(entt::entity entity) const {
        if (entity == entt::null || !m_registry.valid(entity)) return nullptr;
        return m_registry.try_get<Component>(entity);
    }

    template<typename Component>
    bool HasComponent(entt::entity entity) const {
        return entity != entt::null && m_registry.valid(entity) &&
               m_registry.all_of<Component>(entity);
    }

    template<typename... Components>
    auto View() {
        return m_registry.view<Components...>();
    }

    entt::registry& GetRegistry() { return m_registry; }
    const entt::registry& GetRegistry() const { return m_registry; }

    // Logical visibility; entities without a VisibilityComponent count as visible
    [[nodiscard]] bool IsVisible(entt::entity entity) const;
    void SetVisible(entt::entity entity, bool visible);

    // Scene graph
    void SetParent(entt::entity child, entt::entity parent);
    [[nodiscard]] entt::entity GetParent(entt::entity child) const;
    [[nodiscard]] std::vector<entt::entity> GetChildren(entt::entity parent) const;

    // World matrix composed through the parent chain
    [[nodiscard]] glm::mat4 GetWorldMatrix(entt::entity entity) const;
    [[nodiscard]] glm::vec3 GetWorldPosition(entt::entity entity) const;

    // One line per tagged entity, for logs
    [[nodiscard]] std::string DescribeScene() const;

private:
    entt::registry m_registry;

    // parent -> direct children
    std::unordered_map<entt::entity, std::vector<entt::entity>> m_childrenOf;
};

} // namespace Atrium::Scene
