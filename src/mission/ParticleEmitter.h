#pragma once

#include <glm/glm.hpp>
#include <cstddef>
#include <vector>

#include "Components.h"

struct Particle {
    glm::vec3 position{0.0f};   // world units, entity frame
    glm::vec3 velocity{0.0f};
    float age = 0.0f;
    float lifetime = 1.0f;
    bool alive = false;
};

// CPU simulation of one ParticleGroup. Particles are released over the group's
// launch time, then relaunched from the launch box whenever they expire.
class ParticleEmitter {
public:
    ParticleEmitter(const ParticleGroup& group, const ParticleLaunchInfo& launch);

    void update(float deltaTime, const glm::mat4& transform);

    const std::vector<Particle>& particles() const { return particles_; }
    size_t aliveCount() const;

    // Points of the live particles in world space, as of the last update
    const std::vector<glm::vec3>& worldPositions() const { return worldPositions_; }

    float alphaFor(const Particle& particle) const;
    float particleSize() const { return size_; }

private:
    void launch(Particle& particle);

    std::vector<Particle> particles_;
    std::vector<glm::vec3> worldPositions_;
    ParticleLaunchInfo launch_;     // converted to world units
    glm::vec3 acceleration_{0.0f};
    float size_ = 0.0f;
    float launchTime_ = 0.0f;
    float fadeTime_ = 0.0f;
    float alpha_ = 1.0f;
    float elapsed_ = 0.0f;
};
