#pragma once

#include <map>
#include <vector>

#include "CreatureDefinitions.h"
#include "World.h"

class PhysicsWorld;

// Kinematic hit-box bodies that track the joints of animated creatures.
// Each hit-box is its own entity carrying HitBoxOf.
class HitBoxManager {
public:
    HitBoxManager(ecs::World& world, PhysicsWorld& physics) : world_(world), physics_(physics) {}

    // Idempotent per owner
    void spawn(EntityId owner, const CreatureDefinition& definition);

    // Moves every hit-box of `owner` to its joint, given the owner's world transform
    void update(EntityId owner, const glm::mat4& ownerTransform, const JointTransforms& joints);

    // Removes the bodies and hit-box entities of `owner`; no-op when it has none
    void remove(EntityId owner);

    const std::vector<EntityId>* hitBoxes(EntityId owner) const;
    bool isHitBox(EntityId entity) const { return world_.tryGet<HitBoxOf>(entity) != nullptr; }
    size_t ownerCount() const { return hitBoxes_.size(); }

private:
    ecs::World& world_;
    PhysicsWorld& physics_;
    std::map<EntityId, std::vector<EntityId>> hitBoxes_;
};
