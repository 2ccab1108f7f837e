#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>
#include <cstdint>
#include <optional>
#include <vector>

#include "EntityId.h"

// Collision groups used for ray masks
namespace CollisionGroup {
    constexpr uint32_t WORLD = 1u << 0;
    constexpr uint32_t ENTITY = 1u << 1;
    constexpr uint32_t HITBOX = 1u << 2;
    constexpr uint32_t SENSOR = 1u << 3;
    constexpr uint32_t PLAYER = 1u << 4;
    constexpr uint32_t ALL_COLLIDABLE = WORLD | ENTITY | HITBOX | PLAYER;
}

enum class BodyShape : uint8_t {
    Box,
    Sphere,
    Capsule
};

enum class BodyMotion : uint8_t {
    Static,
    Dynamic,
    Kinematic
};

// World-space description of one body; sizes are already scaled to world units
struct BodyDesc {
    BodyShape shape = BodyShape::Box;
    glm::vec3 halfExtents{0.5f};
    float radius = 0.5f;            // sphere and capsule
    glm::vec3 position{0.0f};
    glm::quat rotation{1.0f, 0.0f, 0.0f, 0.0f};
    BodyMotion motion = BodyMotion::Dynamic;
    bool isSensor = false;
    uint32_t group = CollisionGroup::ENTITY;
    float mass = 1.0f;
    float gravityScale = 1.0f;
};

struct RayHit {
    EntityId entity;
    glm::vec3 point{0.0f};
    glm::vec3 normal{0.0f, 1.0f, 0.0f};
    float distance = 0.0f;
    bool isSensor = false;
};

struct CollisionEvent {
    enum class Type : uint8_t { SensorBegin, SensorEnd, Collision };

    Type type = Type::Collision;
    EntityId a;     // the sensor for SensorBegin/SensorEnd
    EntityId b;
};

// Physics collaborator of the mission. At most one body per entity; hit-box
// bodies are registered under their own entities.
class PhysicsWorld {
public:
    virtual ~PhysicsWorld() = default;

    virtual bool addBody(EntityId entity, const BodyDesc& desc) = 0;
    virtual void removeBody(EntityId entity) = 0;
    virtual bool hasBody(EntityId entity) const = 0;
    virtual size_t bodyCount() const = 0;

    virtual std::optional<glm::vec3> getPosition(EntityId entity) const = 0;
    virtual std::optional<glm::quat> getRotation(EntityId entity) const = 0;
    virtual std::optional<glm::vec3> getVelocity(EntityId entity) const = 0;

    // All setters are no-ops for entities without a body
    virtual void setPosition(EntityId entity, const glm::vec3& position) = 0;
    virtual void setRotation(EntityId entity, const glm::quat& rotation) = 0;
    virtual void setPositionRotation(EntityId entity, const glm::vec3& position, const glm::quat& rotation) = 0;
    virtual void setVelocity(EntityId entity, const glm::vec3& velocity) = 0;
    virtual void setGravityScale(EntityId entity, float scale) = 0;

    // Closest hit along `direction` (normalized) within maxDistance
    virtual std::optional<RayHit> rayCast(const glm::vec3& origin, const glm::vec3& direction,
                                          float maxDistance, uint32_t groupMask,
                                          std::optional<EntityId> exclude,
                                          bool includeSensors) const = 0;

    // Advances the simulation and returns the contact events seen during the step
    virtual std::vector<CollisionEvent> step(float deltaTime) = 0;

    // Kinematic player character; position is at the feet. Its inner body is
    // reported as `player` in collision and sensor events.
    virtual void createCharacter(EntityId player, const glm::vec3& position) = 0;
    virtual void setCharacterPosition(const glm::vec3& position) = 0;
    virtual void moveCharacter(const glm::vec3& desiredVelocity) = 0;
    virtual glm::vec3 characterPosition() const = 0;
};
