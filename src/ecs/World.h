#pragma once

#include <entt/entt.hpp>
#include <glm/glm.hpp>
#include <string>
#include <vector>

#include "Components.h"
#include "Links.h"
#include "Resources.h"

namespace ecs {

// Entity store for a mission: the registry plus the lookups scripts need
class World {
public:
    World() {
        registry_.ctx().emplace<PlayerInfo>();
        registry_.ctx().emplace<GameTime>();
        registry_.ctx().emplace<DebugOptions>();
    }
    ~World() = default;

    // Non-copyable, movable
    World(const World&) = delete;
    World& operator=(const World&) = delete;
    World(World&&) = default;
    World& operator=(World&&) = default;

    entt::registry& registry() { return registry_; }
    const entt::registry& registry() const { return registry_; }

    EntityId createEntity() {
        return registry_.create();
    }

    // No-op for stale ids
    void destroyEntity(EntityId entity) {
        if (registry_.valid(entity)) {
            registry_.destroy(entity);
        }
    }

    bool valid(EntityId entity) const {
        return registry_.valid(entity);
    }

    size_t entityCount() const {
        size_t count = 0;
        for (auto entity : registry_.view<entt::entity>()) {
            (void)entity;
            ++count;
        }
        return count;
    }

    template<typename T>
    T* tryGet(EntityId entity) {
        return registry_.valid(entity) ? registry_.try_get<T>(entity) : nullptr;
    }

    template<typename T>
    const T* tryGet(EntityId entity) const {
        return registry_.valid(entity) ? registry_.try_get<T>(entity) : nullptr;
    }

    template<typename T>
    T& set(EntityId entity, T value) {
        return registry_.emplace_or_replace<T>(entity, std::move(value));
    }

    PlayerInfo& player() { return registry_.ctx().get<PlayerInfo>(); }
    const PlayerInfo& player() const { return registry_.ctx().get<PlayerInfo>(); }

    GameTime& time() { return registry_.ctx().get<GameTime>(); }
    const GameTime& time() const { return registry_.ctx().get<GameTime>(); }

    DebugOptions& debugOptions() { return registry_.ctx().get<DebugOptions>(); }
    const DebugOptions& debugOptions() const { return registry_.ctx().get<DebugOptions>(); }

    std::vector<Link> linksOf(EntityId entity, LinkKind kind) const;

    // Live entities targeted by `entity`'s SwitchLinks
    std::vector<EntityId> switchLinkTargets(EntityId entity) const;

    // Case-insensitive SymName match
    std::vector<EntityId> entitiesByName(const std::string& name) const;

    std::vector<EntityId> entitiesWithTemplate(int32_t templateId) const;

    // Removes every Contains link that points at `entity`
    void detachFromContainers(EntityId entity);

private:
    entt::registry registry_;
};

} // namespace ecs
