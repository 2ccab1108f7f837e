#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "Effect.h"
#include "Script.h"

// Queries and effect builders shared by the AI scripts
namespace AIUtil {

    // In [-1, 1], values near zero most likely
    float randomBinomial();

    // World position and +Z forward of the entity's runtime transform
    std::pair<glm::vec3, glm::vec3> positionAndForward(const ecs::World& world, EntityId entity);

    float currentYaw(const ecs::World& world, EntityId entity);

    bool isKilled(const ecs::World& world, EntityId entity);

    // AIRangedWeapon (turret style) or AIProjectile (creature style)
    bool hasRangedWeapon(const ecs::World& world, EntityId entity);

    std::optional<Link> firstLink(const ecs::World& world, EntityId entity, LinkKind kind);
    std::optional<EntityId> findFirstEntityByTemplate(const ecs::World& world, int32_t templateId);

    // Line of sight only. The ray is blocked by level geometry, never by entities.
    bool isPlayerVisible(const ScriptContext& ctx, EntityId entity);

    // Line of sight plus a horizontal cone around rotation * yaw(-heading)
    bool isPlayerVisibleInFov(const ScriptContext& ctx, EntityId entity, float heading, float fovHalfAngle);

    bool playerWithinRadius(const ecs::World& world, EntityId target, float radius);

    // Environmental sound query made of `tags` plus the entity's class tags
    Effect playPositionalSound(const ecs::World& world, EntityId entity, std::optional<glm::vec3> position,
                               const std::vector<std::pair<std::string, std::string>>& tags);

    // Speech through the entity's voice; NoEffect when it has none
    Effect playSpeech(const ScriptContext& ctx, EntityId entity, const std::string& speechConcept,
                      std::vector<std::pair<std::string, std::string>> tags = {});

    // Turret firing through the AIRangedWeapon proxy entity. The proxy is spawned on first use.
    Effect fireRangedWeapon(const ScriptContext& ctx, EntityId entity, const glm::quat& rotation);

    // Creature firing from the joint named by its AIProjectile link
    Effect fireRangedProjectile(const ScriptContext& ctx, EntityId entity);

    Effect sendToAllSwitchLinks(const ecs::World& world, EntityId entity, const MessagePayloadVariant& payload);

}
