#include "ParticleEmitter.h"
#include "DarkConstants.h"
#include "Random.h"

#include <algorithm>

namespace {

float lerpRange(float a, float b) {
    return a + (b - a) * Random::unit();
}

glm::vec3 lerpBox(const glm::vec3& a, const glm::vec3& b) {
    return glm::vec3(lerpRange(a.x, b.x), lerpRange(a.y, b.y), lerpRange(a.z, b.z));
}

}  // namespace

ParticleEmitter::ParticleEmitter(const ParticleGroup& group, const ParticleLaunchInfo& launch)
    : particles_(group.count),
      launch_(launch),
      acceleration_(group.gravity / SCALE_FACTOR),
      size_(2.0f * group.size / SCALE_FACTOR),
      launchTime_(std::max(group.launchTime, 0.0f)),
      fadeTime_(std::max(group.fadeTime, 0.0f)),
      alpha_(static_cast<float>(group.alpha) / 255.0f) {
    launch_.locMin /= SCALE_FACTOR;
    launch_.locMax /= SCALE_FACTOR;
    launch_.velMin /= SCALE_FACTOR;
    launch_.velMax /= SCALE_FACTOR;
    worldPositions_.reserve(particles_.size());
}

void ParticleEmitter::launch(Particle& particle) {
    particle.position = lerpBox(launch_.locMin, launch_.locMax);
    particle.velocity = lerpBox(launch_.velMin, launch_.velMax);
    particle.lifetime = std::max(lerpRange(launch_.minTime, launch_.maxTime), 0.001f);
    particle.age = 0.0f;
    particle.alive = true;
}

void ParticleEmitter::update(float deltaTime, const glm::mat4& transform) {
    elapsed_ += deltaTime;

    // Staggered initial release: particle i becomes live at i/count of the launch time
    const size_t count = particles_.size();
    for (size_t i = 0; i < count; ++i) {
        Particle& p = particles_[i];
        if (!p.alive) {
            float releaseAt = count > 0 ? launchTime_ * static_cast<float>(i) / static_cast<float>(count) : 0.0f;
            if (elapsed_ >= releaseAt) {
                launch(p);
            }
            continue;
        }

        p.age += deltaTime;
        if (p.age >= p.lifetime) {
            launch(p);
            continue;
        }
        p.velocity += acceleration_ * deltaTime;
        p.position += p.velocity * deltaTime;
    }

    worldPositions_.clear();
    for (const auto& p : particles_) {
        if (p.alive) {
            worldPositions_.push_back(glm::vec3(transform * glm::vec4(p.position, 1.0f)));
        }
    }
}

size_t ParticleEmitter::aliveCount() const {
    return static_cast<size_t>(std::count_if(particles_.begin(), particles_.end(),
                                             [](const Particle& p) { return p.alive; }));
}

float ParticleEmitter::alphaFor(const Particle& particle) const {
    if (fadeTime_ <= 0.0f) {
        return alpha_;
    }
    float remaining = particle.lifetime - particle.age;
    return alpha_ * std::clamp(remaining / fadeTime_, 0.0f, 1.0f);
}
