#pragma once

#include <glm/glm.hpp>
#include <cstdint>
#include <memory>

namespace JPH {
    class CharacterVirtual;
    class PhysicsSystem;
    class TempAllocator;
}

// The player's body: a CharacterVirtual capsule driven straight from stick
// input. Vertical input moves the capsule up and down, so there is no
// gravity on it. The inner rigid body is what trigger volumes and
// projectiles see.
class PlayerCapsule {
public:
    struct Dimensions {
        float height;
        float radius;
    };

    PlayerCapsule(JPH::PhysicsSystem& system, const glm::vec3& spawnFeet, Dimensions dimensions, uint64_t userData);
    ~PlayerCapsule();

    PlayerCapsule(const PlayerCapsule&) = delete;
    PlayerCapsule& operator=(const PlayerCapsule&) = delete;

    void advance(float deltaTime, JPH::TempAllocator& allocator);

    void setDesiredVelocity(const glm::vec3& velocity) { desiredVelocity_ = velocity; }
    void teleport(const glm::vec3& target);

    glm::vec3 feet() const;
    uint32_t innerBodyId() const;

private:
    std::unique_ptr<JPH::CharacterVirtual> character_;
    float halfHeight_;
    glm::vec3 desiredVelocity_{0.0f};
};
