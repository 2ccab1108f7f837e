#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "GlobalContext.h"
#include "World.h"

class PhysicsWorld;
class ScriptWorld;

// Initial velocities above this (asset units/sec) are simulated by ray-casting
constexpr float FAST_PROJECTILE_SPEED = 80.0f;

// Physics gets a slightly faster launch than the authored value
constexpr float INITIAL_VELOCITY_BOOST = 1.5f;

// Instantiates templates into the entity store: properties, links, scripts and
// the physics body. Models, animation and hit-boxes are attached by the mission.
class EntityCreator {
public:
    EntityCreator(ecs::World& world, PhysicsWorld& physics, ScriptWorld& scripts, const GlobalContext& global)
        : world_(world), physics_(physics), scripts_(scripts), global_(global) {}

    // Final transform is rootTransform * T(position) * R(orientation). `overrides` are
    // applied after the template's inherited properties.
    std::optional<EntityId> create(int32_t templateId,
                                   const glm::vec3& position,
                                   const glm::quat& orientation,
                                   const glm::mat4& rootTransform = glm::mat4(1.0f),
                                   const nlohmann::json& overrides = nlohmann::json::object());

    // Template names are matched case-insensitively
    std::optional<EntityId> createByName(const std::string& templateName,
                                         const glm::vec3& position,
                                         const glm::quat& orientation);

    // Body from PhysDimensions; false when the entity has none or is a fast projectile
    bool registerPhysics(EntityId entity, const glm::vec3& initialVelocity = glm::vec3(0.0f));

    // Projectiles leave along the creation root's +Z at the authored speed; the
    // authored direction and the entity's own orientation do not matter.
    static glm::vec3 launchVelocity(const glm::vec3& authored, const glm::mat4& rootTransform);

    static bool isFastProjectile(const glm::vec3& initialVelocity) {
        return glm::length(initialVelocity) > FAST_PROJECTILE_SPEED;
    }

private:
    void resolveLinks(EntityId entity, int32_t templateId);

    ecs::World& world_;
    PhysicsWorld& physics_;
    ScriptWorld& scripts_;
    const GlobalContext& global_;
};
