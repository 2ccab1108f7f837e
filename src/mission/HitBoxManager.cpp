#include "HitBoxManager.h"
#include "DarkConstants.h"
#include "PhysicsWorld.h"

#include <SDL3/SDL_log.h>

void HitBoxManager::spawn(EntityId owner, const CreatureDefinition& definition) {
    if (hitBoxes_.count(owner) > 0 || definition.hitBoxes.empty()) {
        return;
    }
    const auto* pose = world_.tryGet<Position>(owner);
    const glm::vec3 origin = pose ? pose->position : glm::vec3(0.0f);

    std::vector<EntityId> created;
    for (const auto& spec : definition.hitBoxes) {
        if (spec.joint >= MAX_JOINTS) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "HitBoxManager: joint %u of creature '%s' is out of range",
                        spec.joint, definition.name.c_str());
            continue;
        }
        EntityId hitBox = world_.createEntity();
        world_.set(hitBox, HitBoxOf{owner, spec.joint});
        world_.set(hitBox, Position{origin, glm::quat(1.0f, 0.0f, 0.0f, 0.0f), 0});

        BodyDesc desc;
        desc.shape = BodyShape::Box;
        desc.halfExtents = spec.halfExtents / SCALE_FACTOR;
        desc.position = origin;
        desc.motion = BodyMotion::Kinematic;
        desc.group = CollisionGroup::HITBOX;
        desc.gravityScale = 0.0f;
        physics_.addBody(hitBox, desc);
        created.push_back(hitBox);
    }
    hitBoxes_[owner] = std::move(created);
}

void HitBoxManager::update(EntityId owner, const glm::mat4& ownerTransform, const JointTransforms& joints) {
    auto it = hitBoxes_.find(owner);
    if (it == hitBoxes_.end()) {
        return;
    }
    for (EntityId hitBox : it->second) {
        const auto* info = world_.tryGet<HitBoxOf>(hitBox);
        if (!info) {
            continue;
        }
        const glm::mat4 world = ownerTransform * joints[info->joint];
        const glm::vec3 position(world[3]);
        const glm::quat rotation = glm::normalize(glm::quat_cast(glm::mat3(world)));
        physics_.setPositionRotation(hitBox, position, rotation);
        world_.set(hitBox, Position{position, rotation, 0});
    }
}

void HitBoxManager::remove(EntityId owner) {
    auto it = hitBoxes_.find(owner);
    if (it == hitBoxes_.end()) {
        return;
    }
    for (EntityId hitBox : it->second) {
        physics_.removeBody(hitBox);
        world_.destroyEntity(hitBox);
    }
    hitBoxes_.erase(it);
}

const std::vector<EntityId>* HitBoxManager::hitBoxes(EntityId owner) const {
    auto it = hitBoxes_.find(owner);
    return it == hitBoxes_.end() ? nullptr : &it->second;
}
