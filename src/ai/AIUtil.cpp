#include "AIUtil.h"
#include "DarkConstants.h"
#include "GlobalContext.h"
#include "PhysicsWorld.h"
#include "Random.h"
#include "RotationUtils.h"
#include "SpeechVoiceRegistry.h"
#include "StringUtils.h"

#include <SDL3/SDL_log.h>
#include <cmath>

namespace AIUtil {

using RotationUtils::transformPoint;
using RotationUtils::transformVector;

float randomBinomial() {
    return Random::unit() - Random::unit();
}

std::pair<glm::vec3, glm::vec3> positionAndForward(const ecs::World& world, EntityId entity) {
    if (const auto* transform = world.tryGet<RuntimeTransform>(entity)) {
        glm::vec3 position = transformPoint(transform->matrix, glm::vec3(0.0f));
        glm::vec3 forward = transformVector(transform->matrix, glm::vec3(0.0f, 0.0f, 1.0f));
        if (glm::length(forward) > 1e-6f) {
            forward = glm::normalize(forward);
        }
        return {position, forward};
    }
    if (const auto* pose = world.tryGet<Position>(entity)) {
        return {pose->position, pose->rotation * glm::vec3(0.0f, 0.0f, 1.0f)};
    }
    return {glm::vec3(0.0f), glm::vec3(0.0f, 0.0f, 1.0f)};
}

float currentYaw(const ecs::World& world, EntityId entity) {
    auto [position, forward] = positionAndForward(world, entity);
    return RotationUtils::yawBetween(position, position + forward);
}

bool isKilled(const ecs::World& world, EntityId entity) {
    const auto* hp = world.tryGet<HitPoints>(entity);
    return hp && hp->hitPoints <= 0;
}

bool hasRangedWeapon(const ecs::World& world, EntityId entity) {
    return firstLink(world, entity, LinkKind::AIRangedWeapon).has_value() ||
           firstLink(world, entity, LinkKind::AIProjectile).has_value();
}

std::optional<Link> firstLink(const ecs::World& world, EntityId entity, LinkKind kind) {
    auto links = world.linksOf(entity, kind);
    if (links.empty()) return std::nullopt;
    return links.front();
}

std::optional<EntityId> findFirstEntityByTemplate(const ecs::World& world, int32_t templateId) {
    auto entities = world.entitiesWithTemplate(templateId);
    if (entities.empty()) return std::nullopt;
    return entities.front();
}

bool isPlayerVisible(const ScriptContext& ctx, EntityId entity) {
    const auto* pose = ctx.world.tryGet<Position>(entity);
    if (!pose) {
        return false;
    }
    glm::vec3 delta = ctx.world.player().position - pose->position;
    float distance = glm::length(delta);
    if (distance < 1e-6f) {
        return true;
    }
    auto hit = ctx.physics.rayCast(pose->position, delta / distance, distance, CollisionGroup::WORLD,
                                   entity, true);
    return !hit.has_value();
}

bool isPlayerVisibleInFov(const ScriptContext& ctx, EntityId entity, float heading, float fovHalfAngle) {
    const auto* pose = ctx.world.tryGet<Position>(entity);
    if (!pose) {
        return false;
    }

    glm::vec3 toPlayer = ctx.world.player().position - pose->position;
    glm::vec3 toPlayer2d(toPlayer.x, 0.0f, toPlayer.z);
    if (glm::dot(toPlayer2d, toPlayer2d) < 1e-6f) {
        // Directly above or below
        return isPlayerVisible(ctx, entity);
    }
    toPlayer2d = glm::normalize(toPlayer2d);

    glm::quat orientation = pose->rotation * RotationUtils::fromAngleY(-heading);
    glm::vec3 forward3d = orientation * glm::vec3(0.0f, 0.0f, 1.0f);
    glm::vec3 forward(forward3d.x, 0.0f, forward3d.z);
    if (glm::dot(forward, forward) < 1e-6f) {
        return false;
    }
    forward = glm::normalize(forward);

    float cosAngle = glm::clamp(glm::dot(forward, toPlayer2d), -1.0f, 1.0f);
    if (glm::degrees(std::acos(cosAngle)) > fovHalfAngle) {
        return false;
    }
    return isPlayerVisible(ctx, entity);
}

bool playerWithinRadius(const ecs::World& world, EntityId target, float radius) {
    const auto* pose = world.tryGet<Position>(target);
    if (!pose) {
        return false;
    }
    return glm::distance(pose->position, world.player().position) <= radius;
}

Effect playPositionalSound(const ecs::World& world, EntityId entity, std::optional<glm::vec3> position,
                           const std::vector<std::pair<std::string, std::string>>& tags) {
    TagQuery query = tagQueryFromPairs(tags);
    if (const auto* classTags = world.tryGet<ClassTags>(entity)) {
        for (const auto& [key, value] : classTags->tags) {
            query.push_back({StringUtils::toLower(key), StringUtils::toLower(value), true});
        }
    }

    glm::vec3 at = glm::vec3(0.0f);
    if (position) {
        at = *position;
    } else if (const auto* pose = world.tryGet<Position>(entity)) {
        at = pose->position;
    }
    return Effects::PlayEnvironmentalSound{AudioHandle::next(), std::move(query), at};
}

Effect playSpeech(const ScriptContext& ctx, EntityId entity, const std::string& speechConcept,
                  std::vector<std::pair<std::string, std::string>> tags) {
    if (!ctx.global.voices) {
        return {};
    }
    auto voiceIndex = resolveEntityVoiceIndex(ctx.world, *ctx.global.voices, entity);
    if (!voiceIndex) {
        SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "AIUtil: entity %u has no voice for '%s'",
                     entityToInt(entity), speechConcept.c_str());
        return {};
    }
    return Effects::PlaySpeech{entity, *voiceIndex, speechConcept, std::move(tags)};
}

Effect fireRangedWeapon(const ScriptContext& ctx, EntityId entity, const glm::quat& rotation) {
    auto rangedWeapon = firstLink(ctx.world, entity, LinkKind::AIRangedWeapon);
    if (!rangedWeapon) {
        return {};
    }
    const auto* root = ctx.world.tryGet<RuntimeTransform>(entity);
    glm::mat4 rootTransform = root ? root->matrix : glm::mat4(1.0f);

    constexpr float forwardOffset = 3.0f / SCALE_FACTOR;
    constexpr float upOffset = 0.5f / SCALE_FACTOR;
    constexpr float rightOffset = 0.5f / SCALE_FACTOR;
    const glm::vec3 forward(rightOffset, upOffset, forwardOffset);
    // The muzzle sits one offset beyond the transformed mount point
    const glm::vec3 position = transformPoint(rootTransform, forward) + forward;

    auto weaponEntity = findFirstEntityByTemplate(ctx.world, rangedWeapon->toTemplateId);
    if (!weaponEntity) {
        // Proxy for the weapon; it fires from the next shot on
        return Effects::CreateEntity{rangedWeapon->toTemplateId, position, rotation, rootTransform};
    }

    std::vector<Effect> effects;
    glm::vec3 aimed = transformVector(rootTransform, forward);
    effects.push_back(Effects::DrawDebugLines{{
        {position, position + aimed * 10.0f + glm::vec3(0.0f, -0.25f, 0.0f), glm::vec4(0.0f, 1.0f, 1.0f, 1.0f)}}});

    const glm::mat4 launchRoot = rootTransform * glm::mat4_cast(rotation);
    const glm::quat launchOrientation = RotationUtils::fromAngleY(90.0f);

    if (auto projectile = firstLink(ctx.world, *weaponEntity, LinkKind::Projectile)) {
        effects.push_back(Effects::CreateEntity{projectile->toTemplateId, forward, launchOrientation, launchRoot});
        effects.push_back(playPositionalSound(ctx.world, *weaponEntity, position, {{"event", "shoot"}}));
    }
    if (auto flash = firstLink(ctx.world, *weaponEntity, LinkKind::GunFlash)) {
        effects.push_back(Effects::CreateEntity{flash->toTemplateId, forward, launchOrientation, launchRoot});
    }
    return Effect::combine(std::move(effects));
}

Effect fireRangedProjectile(const ScriptContext& ctx, EntityId entity) {
    auto projectile = firstLink(ctx.world, entity, LinkKind::AIProjectile);
    if (!projectile) {
        return {};
    }

    JointId joint = 0;
    if (const auto* creature = ctx.world.tryGet<Creature>(entity)) {
        if (const auto* def = ctx.global.creatureDefinition(creature->type)) {
            joint = def->mappedJoint(projectile->joint).value_or(0);
        }
    }

    glm::mat4 jointTransform(1.0f);
    if (const auto* joints = ctx.world.tryGet<RuntimeJointTransforms>(entity); joints && joint < joints->transforms.size()) {
        jointTransform = joints->transforms[joint];
    }
    const auto* root = ctx.world.tryGet<RuntimeTransform>(entity);

    glm::vec3 position = transformPoint(jointTransform, glm::vec3(0.0f)) + glm::vec3(0.0f, 0.0f, 1.0f);
    return Effects::CreateEntity{projectile->toTemplateId, position, RotationUtils::fromAngleY(90.0f),
                                 root ? root->matrix : glm::mat4(1.0f)};
}

Effect sendToAllSwitchLinks(const ecs::World& world, EntityId entity, const MessagePayloadVariant& payload) {
    std::vector<Effect> effects;
    for (EntityId target : world.switchLinkTargets(entity)) {
        effects.push_back(Effects::Send{Message{target, payload}});
    }
    return Effect::combine(std::move(effects));
}

}  // namespace AIUtil
