#include "JoltPhysicsWorld.h"
#include "JoltSetup.h"
#include "Profiling.h"

#include <Jolt/Jolt.h>
#include <Jolt/Core/TempAllocator.h>
#include <Jolt/Core/JobSystemThreadPool.h>
#include <Jolt/Physics/PhysicsSettings.h>
#include <Jolt/Physics/PhysicsSystem.h>
#include <Jolt/Physics/Collision/Shape/BoxShape.h>
#include <Jolt/Physics/Collision/Shape/SphereShape.h>
#include <Jolt/Physics/Collision/Shape/CapsuleShape.h>
#include <Jolt/Physics/Body/BodyCreationSettings.h>
#include <Jolt/Physics/Body/BodyLock.h>
#include <Jolt/Physics/Collision/RayCast.h>
#include <Jolt/Physics/Collision/CastResult.h>
#include <Jolt/Physics/Collision/CollisionCollectorImpl.h>
#include <Jolt/Physics/Collision/ContactListener.h>

#include <SDL3/SDL_log.h>
#include <algorithm>
#include <mutex>
#include <thread>

JPH_SUPPRESS_WARNINGS

using namespace JoltSetup;

// Contact callbacks arrive on Jolt worker threads; they are recorded here and
// resolved to entities on the simulation thread once the step is done.
class JoltContactBuffer final : public JPH::ContactListener {
public:
    struct RawContact {
        uint32_t bodyA = 0;
        uint32_t bodyB = 0;
        bool added = true;
    };

    void OnContactAdded(const JPH::Body& inBody1, const JPH::Body& inBody2,
                        const JPH::ContactManifold& inManifold,
                        JPH::ContactSettings& ioSettings) override {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.push_back({inBody1.GetID().GetIndexAndSequenceNumber(),
                            inBody2.GetID().GetIndexAndSequenceNumber(), true});
    }

    void OnContactRemoved(const JPH::SubShapeIDPair& inSubShapePair) override {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.push_back({inSubShapePair.GetBody1ID().GetIndexAndSequenceNumber(),
                            inSubShapePair.GetBody2ID().GetIndexAndSequenceNumber(), false});
    }

    std::vector<RawContact> drain() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<RawContact> out;
        out.swap(pending_);
        return out;
    }

private:
    std::mutex mutex_;
    std::vector<RawContact> pending_;
};

namespace {

JPH::ObjectLayer layerFor(const BodyDesc& desc) {
    if (desc.isSensor) return ObjectLayers::TRIGGER;
    if (desc.group & CollisionGroup::HITBOX) return ObjectLayers::HITBOX;
    if (desc.motion == BodyMotion::Static) return ObjectLayers::WORLD;
    return ObjectLayers::PROP;
}

JPH::EMotionType motionFor(BodyMotion motion) {
    switch (motion) {
        case BodyMotion::Static: return JPH::EMotionType::Static;
        case BodyMotion::Kinematic: return JPH::EMotionType::Kinematic;
        case BodyMotion::Dynamic: return JPH::EMotionType::Dynamic;
    }
    return JPH::EMotionType::Dynamic;
}

JPH::ShapeSettings::ShapeResult createShape(const BodyDesc& desc) {
    switch (desc.shape) {
        case BodyShape::Sphere: {
            JPH::SphereShapeSettings settings(std::max(desc.radius, 0.01f));
            return settings.Create();
        }
        case BodyShape::Capsule: {
            float halfHeight = std::max(desc.halfExtents.y - desc.radius, 0.01f);
            JPH::CapsuleShapeSettings settings(halfHeight, std::max(desc.radius, 0.01f));
            return settings.Create();
        }
        case BodyShape::Box:
            break;
    }
    // Jolt rejects boxes thinner than the convex radius
    glm::vec3 extents = glm::max(desc.halfExtents, glm::vec3(0.06f));
    JPH::BoxShapeSettings settings(toJolt(extents));
    return settings.Create();
}

} // anonymous namespace

JoltPhysicsWorld::JoltPhysicsWorld() = default;

JoltPhysicsWorld::~JoltPhysicsWorld() {
    if (physicsSystem_) {
        JPH::BodyInterface& bodyInterface = physicsSystem_->GetBodyInterface();
        for (const auto& [entity, record] : bodies_) {
            JPH::BodyID joltID(record.bodyId);
            if (bodyInterface.IsAdded(joltID)) {
                bodyInterface.RemoveBody(joltID);
            }
            bodyInterface.DestroyBody(joltID);
        }
    }
    bodies_.clear();
    entityByBody_.clear();

    // Character and bodies reference the system; release in reverse order of creation
    player_.reset();
    physicsSystem_.reset();
    contacts_.reset();
    jobSystem_.reset();
    tempAllocator_.reset();
    joltLease_.reset();

    SDL_Log("JoltPhysicsWorld: shutdown");
}

std::unique_ptr<JoltPhysicsWorld> JoltPhysicsWorld::create() {
    std::unique_ptr<JoltPhysicsWorld> world(new JoltPhysicsWorld());
    if (!world->initInternal()) {
        return nullptr;
    }
    return world;
}

bool JoltPhysicsWorld::initInternal() {
    joltLease_ = RuntimeLease::acquire();

    tempAllocator_ = std::make_unique<JPH::TempAllocatorImpl>(10 * 1024 * 1024);

    int numThreads = std::max(1, static_cast<int>(std::thread::hardware_concurrency()) - 1);
    jobSystem_ = std::make_unique<JPH::JobSystemThreadPool>(
        JPH::cMaxPhysicsJobs,
        JPH::cMaxPhysicsBarriers,
        numThreads
    );

    const uint32_t maxBodies = 4096;
    const uint32_t numBodyMutexes = 0;
    const uint32_t maxBodyPairs = 4096;
    const uint32_t maxContactConstraints = 2048;

    physicsSystem_ = std::make_unique<JPH::PhysicsSystem>();
    physicsSystem_->Init(
        maxBodies,
        numBodyMutexes,
        maxBodyPairs,
        maxContactConstraints,
        layerInterface(),
        layerVsTreeFilter(),
        layerPairFilter()
    );
    physicsSystem_->SetGravity(JPH::Vec3(0.0f, -9.81f, 0.0f));

    contacts_ = std::make_unique<JoltContactBuffer>();
    physicsSystem_->SetContactListener(contacts_.get());

    SDL_Log("JoltPhysicsWorld: initialized with %d worker threads", numThreads);
    return true;
}

const JoltPhysicsWorld::BodyRecord* JoltPhysicsWorld::findBody(EntityId entity) const {
    auto it = bodies_.find(entity);
    return it != bodies_.end() ? &it->second : nullptr;
}

std::optional<EntityId> JoltPhysicsWorld::entityForBody(uint32_t bodyId) const {
    auto it = entityByBody_.find(bodyId);
    if (it == entityByBody_.end()) return std::nullopt;
    return it->second;
}

bool JoltPhysicsWorld::isSensorBody(uint32_t bodyId) const {
    auto entity = entityForBody(bodyId);
    if (!entity) return false;
    const BodyRecord* record = findBody(*entity);
    return record && record->bodyId == bodyId && record->isSensor;
}

bool JoltPhysicsWorld::addBody(EntityId entity, const BodyDesc& desc) {
    if (bodies_.count(entity) > 0) {
        removeBody(entity);
    }

    JPH::ShapeSettings::ShapeResult shapeResult = createShape(desc);
    if (!shapeResult.IsValid()) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "JoltPhysicsWorld: failed to create shape for entity %u: %s",
                    entityToInt(entity), shapeResult.GetError().c_str());
        return false;
    }

    JPH::BodyCreationSettings bodySettings(
        shapeResult.Get(),
        toJoltR(desc.position),
        toJolt(desc.rotation),
        motionFor(desc.motion),
        layerFor(desc)
    );
    bodySettings.mIsSensor = desc.isSensor;
    bodySettings.mGravityFactor = desc.gravityScale;
    bodySettings.mUserData = entityToInt(entity);
    if (desc.isSensor) {
        // Static sensors still need to see the kinematic player body
        bodySettings.mCollideKinematicVsNonDynamic = true;
    }
    if (desc.motion == BodyMotion::Dynamic) {
        bodySettings.mOverrideMassProperties = JPH::EOverrideMassProperties::CalculateInertia;
        bodySettings.mMassPropertiesOverride.mMass = desc.mass;
        bodySettings.mLinearDamping = 0.05f;
        bodySettings.mAngularDamping = 0.05f;
        // Creatures steer by rotation; keep them upright
        bodySettings.mAllowedDOFs = JPH::EAllowedDOFs::TranslationX | JPH::EAllowedDOFs::TranslationY |
                                    JPH::EAllowedDOFs::TranslationZ | JPH::EAllowedDOFs::RotationY;
    }

    JPH::BodyInterface& bodyInterface = physicsSystem_->GetBodyInterface();
    JPH::Body* body = bodyInterface.CreateBody(bodySettings);
    if (!body) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "JoltPhysicsWorld: body limit reached for entity %u",
                    entityToInt(entity));
        return false;
    }

    JPH::EActivation activation = desc.motion == BodyMotion::Static
        ? JPH::EActivation::DontActivate : JPH::EActivation::Activate;
    bodyInterface.AddBody(body->GetID(), activation);

    uint32_t bodyId = body->GetID().GetIndexAndSequenceNumber();
    bodies_[entity] = BodyRecord{bodyId, desc.group, desc.isSensor};
    entityByBody_[bodyId] = entity;
    return true;
}

void JoltPhysicsWorld::removeBody(EntityId entity) {
    auto it = bodies_.find(entity);
    if (it == bodies_.end()) return;

    JPH::BodyID joltID(it->second.bodyId);
    JPH::BodyInterface& bodyInterface = physicsSystem_->GetBodyInterface();
    if (bodyInterface.IsAdded(joltID)) {
        bodyInterface.RemoveBody(joltID);
    }
    bodyInterface.DestroyBody(joltID);

    entityByBody_.erase(it->second.bodyId);
    bodies_.erase(it);
}

bool JoltPhysicsWorld::hasBody(EntityId entity) const {
    return findBody(entity) != nullptr;
}

std::optional<glm::vec3> JoltPhysicsWorld::getPosition(EntityId entity) const {
    const BodyRecord* record = findBody(entity);
    if (!record) return std::nullopt;
    const JPH::BodyInterface& bodyInterface = physicsSystem_->GetBodyInterface();
    return toGLM(bodyInterface.GetPosition(JPH::BodyID(record->bodyId)));
}

std::optional<glm::quat> JoltPhysicsWorld::getRotation(EntityId entity) const {
    const BodyRecord* record = findBody(entity);
    if (!record) return std::nullopt;
    const JPH::BodyInterface& bodyInterface = physicsSystem_->GetBodyInterface();
    return toGLM(bodyInterface.GetRotation(JPH::BodyID(record->bodyId)));
}

std::optional<glm::vec3> JoltPhysicsWorld::getVelocity(EntityId entity) const {
    const BodyRecord* record = findBody(entity);
    if (!record) return std::nullopt;
    const JPH::BodyInterface& bodyInterface = physicsSystem_->GetBodyInterface();
    return toGLM(bodyInterface.GetLinearVelocity(JPH::BodyID(record->bodyId)));
}

void JoltPhysicsWorld::setPosition(EntityId entity, const glm::vec3& position) {
    const BodyRecord* record = findBody(entity);
    if (!record) return;
    physicsSystem_->GetBodyInterface().SetPosition(JPH::BodyID(record->bodyId), toJoltR(position),
                                                   JPH::EActivation::Activate);
}

void JoltPhysicsWorld::setRotation(EntityId entity, const glm::quat& rotation) {
    const BodyRecord* record = findBody(entity);
    if (!record) return;
    physicsSystem_->GetBodyInterface().SetRotation(JPH::BodyID(record->bodyId),
                                                   toJolt(glm::normalize(rotation)),
                                                   JPH::EActivation::Activate);
}

void JoltPhysicsWorld::setPositionRotation(EntityId entity, const glm::vec3& position, const glm::quat& rotation) {
    const BodyRecord* record = findBody(entity);
    if (!record) return;
    physicsSystem_->GetBodyInterface().SetPositionAndRotation(JPH::BodyID(record->bodyId), toJoltR(position),
                                                              toJolt(glm::normalize(rotation)),
                                                              JPH::EActivation::Activate);
}

void JoltPhysicsWorld::setVelocity(EntityId entity, const glm::vec3& velocity) {
    const BodyRecord* record = findBody(entity);
    if (!record) return;
    physicsSystem_->GetBodyInterface().SetLinearVelocity(JPH::BodyID(record->bodyId), toJolt(velocity));
}

void JoltPhysicsWorld::setGravityScale(EntityId entity, float scale) {
    const BodyRecord* record = findBody(entity);
    if (!record) return;
    JPH::BodyInterface& bodyInterface = physicsSystem_->GetBodyInterface();
    bodyInterface.SetGravityFactor(JPH::BodyID(record->bodyId), scale);
    bodyInterface.ActivateBody(JPH::BodyID(record->bodyId));
}

std::optional<RayHit> JoltPhysicsWorld::rayCast(const glm::vec3& origin, const glm::vec3& direction,
                                                float maxDistance, uint32_t groupMask,
                                                std::optional<EntityId> exclude,
                                                bool includeSensors) const {
    float length = glm::length(direction);
    if (length < 0.0001f || maxDistance <= 0.0f) return std::nullopt;
    glm::vec3 dir = direction / length;

    JPH::RRayCast ray;
    ray.mOrigin = toJoltR(origin);
    ray.mDirection = toJolt(dir * maxDistance);

    JPH::AllHitCollisionCollector<JPH::CastRayCollector> collector;
    JPH::RayCastSettings settings;
    physicsSystem_->GetNarrowPhaseQuery().CastRay(ray, settings, collector);
    collector.Sort();

    for (const auto& hit : collector.mHits) {
        uint32_t bodyId = hit.mBodyID.GetIndexAndSequenceNumber();
        auto entity = entityForBody(bodyId);
        if (!entity) continue;
        if (exclude && *exclude == *entity) continue;

        uint32_t group = CollisionGroup::PLAYER;
        bool sensor = false;
        if (const BodyRecord* record = findBody(*entity); record && record->bodyId == bodyId) {
            group = record->group;
            sensor = record->isSensor;
        }
        if (sensor && !includeSensors) continue;
        if (!sensor && (group & groupMask) == 0) continue;

        RayHit result;
        result.entity = *entity;
        result.distance = hit.mFraction * maxDistance;
        result.point = origin + dir * result.distance;
        result.isSensor = sensor;

        JPH::BodyLockRead lock(physicsSystem_->GetBodyLockInterface(), hit.mBodyID);
        if (lock.Succeeded()) {
            result.normal = toGLM(lock.GetBody().GetWorldSpaceSurfaceNormal(hit.mSubShapeID2,
                                                                           toJoltR(result.point)));
        }
        return result;
    }
    return std::nullopt;
}

std::vector<CollisionEvent> JoltPhysicsWorld::step(float deltaTime) {
    DARKCORE_ZONE_SCOPED_N("Physics::step");
    accumulatedTime_ += deltaTime;
    int numSteps = 0;

    while (accumulatedTime_ >= FIXED_TIMESTEP && numSteps < MAX_SUBSTEPS) {
        if (player_) {
            player_->advance(FIXED_TIMESTEP, *tempAllocator_);
        }
        physicsSystem_->Update(FIXED_TIMESTEP, 1, tempAllocator_.get(), jobSystem_.get());

        accumulatedTime_ -= FIXED_TIMESTEP;
        numSteps++;
    }

    // Prevent spiral of death
    if (accumulatedTime_ > FIXED_TIMESTEP * MAX_SUBSTEPS) {
        accumulatedTime_ = 0.0f;
    }

    std::vector<CollisionEvent> events;
    for (const auto& contact : contacts_->drain()) {
        auto a = entityForBody(contact.bodyA);
        auto b = entityForBody(contact.bodyB);
        if (!a || !b) continue;

        bool sensorA = isSensorBody(contact.bodyA);
        bool sensorB = isSensorBody(contact.bodyB);
        if (sensorA || sensorB) {
            CollisionEvent event;
            event.type = contact.added ? CollisionEvent::Type::SensorBegin : CollisionEvent::Type::SensorEnd;
            event.a = sensorA ? *a : *b;
            event.b = sensorA ? *b : *a;
            events.push_back(event);
        } else if (contact.added) {
            events.push_back(CollisionEvent{CollisionEvent::Type::Collision, *a, *b});
        }
    }
    return events;
}

void JoltPhysicsWorld::createCharacter(EntityId player, const glm::vec3& position) {
    if (player_) {
        entityByBody_.erase(player_->innerBodyId());
    }
    player_ = std::make_unique<PlayerCapsule>(*physicsSystem_, position,
                                              PlayerCapsule::Dimensions{CHARACTER_HEIGHT, CHARACTER_RADIUS},
                                              entityToInt(player));
    playerEntity_ = player;
    entityByBody_[player_->innerBodyId()] = player;
}

void JoltPhysicsWorld::setCharacterPosition(const glm::vec3& position) {
    if (!player_) {
        SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "JoltPhysicsWorld: no character to place");
        return;
    }
    player_->teleport(position);
}

void JoltPhysicsWorld::moveCharacter(const glm::vec3& desiredVelocity) {
    if (player_) player_->setDesiredVelocity(desiredVelocity);
}

glm::vec3 JoltPhysicsWorld::characterPosition() const {
    return player_ ? player_->feet() : glm::vec3(0.0f);
}
