#include "FastProjectile.h"
#include "PhysicsWorld.h"

#include <SDL3/SDL_log.h>

Effect FastProjectile::update(EntityId entity, ScriptContext& ctx) {
    const auto* pose = ctx.world.tryGet<Position>(entity);
    if (!pose) {
        return Effects::DestroyEntity{entity};
    }

    const float deltaTime = ctx.deltaTime();
    age_ += deltaTime;
    const float speed = glm::length(velocity_);
    if (age_ > MAX_LIFETIME || speed <= 0.0f) {
        return Effects::DestroyEntity{entity};
    }

    const float travel = speed * deltaTime;
    const glm::vec3 direction = velocity_ / speed;
    auto hit = ctx.physics.rayCast(pose->position, direction, travel, CollisionGroup::ALL_COLLIDABLE, entity, false);
    if (!hit) {
        return Effects::SetPosition{entity, pose->position + direction * travel};
    }

    // Hit-boxes forward damage to the creature that owns them
    EntityId target = hit->entity;
    if (const auto* hitBox = ctx.world.tryGet<HitBoxOf>(target)) {
        target = hitBox->owner;
    }
    SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "FastProjectile: %u hit %u", entityToInt(entity), entityToInt(target));
    return Effect::combine({Effects::Send{Message{target, MessagePayload::Damage{damage_}}},
                            Effects::DestroyEntity{entity}});
}
