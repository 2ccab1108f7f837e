#pragma once

#include <memory>
#include <unordered_map>

#include "PlayerCapsule.h"
#include "DarkConstants.h"
#include "PhysicsWorld.h"

namespace JPH {
    class PhysicsSystem;
    class TempAllocatorImpl;
    class JobSystemThreadPool;
}

namespace JoltSetup { class RuntimeLease; }
class JoltContactBuffer;

// PhysicsWorld on Jolt: fixed 1/60 s steps, entity <-> body bookkeeping,
// and a buffered contact listener for sensor events.
class JoltPhysicsWorld final : public PhysicsWorld {
public:
    // Returns nullptr on failure
    static std::unique_ptr<JoltPhysicsWorld> create();

    ~JoltPhysicsWorld() override;

    JoltPhysicsWorld(const JoltPhysicsWorld&) = delete;
    JoltPhysicsWorld& operator=(const JoltPhysicsWorld&) = delete;

    bool addBody(EntityId entity, const BodyDesc& desc) override;
    void removeBody(EntityId entity) override;
    bool hasBody(EntityId entity) const override;
    size_t bodyCount() const override { return bodies_.size(); }

    std::optional<glm::vec3> getPosition(EntityId entity) const override;
    std::optional<glm::quat> getRotation(EntityId entity) const override;
    std::optional<glm::vec3> getVelocity(EntityId entity) const override;

    void setPosition(EntityId entity, const glm::vec3& position) override;
    void setRotation(EntityId entity, const glm::quat& rotation) override;
    void setPositionRotation(EntityId entity, const glm::vec3& position, const glm::quat& rotation) override;
    void setVelocity(EntityId entity, const glm::vec3& velocity) override;
    void setGravityScale(EntityId entity, float scale) override;

    std::optional<RayHit> rayCast(const glm::vec3& origin, const glm::vec3& direction,
                                  float maxDistance, uint32_t groupMask,
                                  std::optional<EntityId> exclude,
                                  bool includeSensors) const override;

    std::vector<CollisionEvent> step(float deltaTime) override;

    void createCharacter(EntityId player, const glm::vec3& position) override;
    void setCharacterPosition(const glm::vec3& position) override;
    void moveCharacter(const glm::vec3& desiredVelocity) override;
    glm::vec3 characterPosition() const override;

private:
    JoltPhysicsWorld();
    bool initInternal();

    struct BodyRecord {
        uint32_t bodyId = 0;
        uint32_t group = 0;
        bool isSensor = false;
    };

    const BodyRecord* findBody(EntityId entity) const;
    std::optional<EntityId> entityForBody(uint32_t bodyId) const;
    bool isSensorBody(uint32_t bodyId) const;

    std::shared_ptr<JoltSetup::RuntimeLease> joltLease_;

    std::unique_ptr<JPH::TempAllocatorImpl> tempAllocator_;
    std::unique_ptr<JPH::JobSystemThreadPool> jobSystem_;
    std::unique_ptr<JPH::PhysicsSystem> physicsSystem_;
    std::unique_ptr<JoltContactBuffer> contacts_;

    std::unordered_map<EntityId, BodyRecord> bodies_;
    std::unordered_map<uint32_t, EntityId> entityByBody_;

    std::unique_ptr<PlayerCapsule> player_;
    std::optional<EntityId> playerEntity_;

    float accumulatedTime_ = 0.0f;
    static constexpr float FIXED_TIMESTEP = 1.0f / 60.0f;
    static constexpr int MAX_SUBSTEPS = 4;
    // Player capsule in asset units
    static constexpr float CHARACTER_HEIGHT = 6.0f / SCALE_FACTOR;
    static constexpr float CHARACTER_RADIUS = 1.2f / SCALE_FACTOR;
};
