#pragma once

#include <glm/glm.hpp>

#include "Script.h"

// Bullets and lasers too fast for the physics step. No body is registered for
// them; each tick they ray-cast the distance they would travel instead.
class FastProjectile final : public Script {
public:
    static constexpr float DEFAULT_DAMAGE = 10.0f;
    static constexpr float MAX_LIFETIME = 5.0f;

    explicit FastProjectile(const glm::vec3& velocity, float damage = DEFAULT_DAMAGE)
        : velocity_(velocity), damage_(damage) {}

    Effect update(EntityId entity, ScriptContext& ctx) override;

    const glm::vec3& velocity() const { return velocity_; }

private:
    glm::vec3 velocity_;   // world units per second
    float damage_;
    float age_ = 0.0f;
};
