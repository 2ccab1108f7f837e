#include "PlayerCapsule.h"
#include "JoltSetup.h"

#include <Jolt/Physics/PhysicsSystem.h>
#include <Jolt/Physics/Character/CharacterVirtual.h>
#include <Jolt/Physics/Collision/Shape/CapsuleShape.h>
#include <Jolt/Core/TempAllocator.h>

#include <SDL3/SDL_log.h>
#include <algorithm>

using namespace JoltSetup;

PlayerCapsule::PlayerCapsule(JPH::PhysicsSystem& system, const glm::vec3& spawnFeet,
                             Dimensions dimensions, uint64_t userData)
    : halfHeight_(dimensions.height * 0.5f) {
    // Capsule half height excludes the end caps
    const float cylinderHalf = std::max(halfHeight_ - dimensions.radius, 0.005f);
    JPH::RefConst<JPH::Shape> shape = new JPH::CapsuleShape(cylinderHalf, dimensions.radius);

    JPH::CharacterVirtualSettings settings;
    settings.mShape = shape;
    settings.mInnerBodyShape = shape;
    settings.mInnerBodyLayer = ObjectLayers::PLAYER;
    settings.mMaxSlopeAngle = JPH::DegreesToRadians(50.0f);
    settings.mCharacterPadding = 0.02f;
    settings.mSupportingVolume = JPH::Plane(JPH::Vec3::sAxisY(), -dimensions.radius);
    settings.mBackFaceMode = JPH::EBackFaceMode::CollideWithBackFaces;

    character_ = std::make_unique<JPH::CharacterVirtual>(
        &settings, toJoltR(spawnFeet + glm::vec3(0.0f, halfHeight_, 0.0f)),
        JPH::Quat::sIdentity(), userData, &system);

    SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "PlayerCapsule: spawned at (%.2f, %.2f, %.2f)",
                 spawnFeet.x, spawnFeet.y, spawnFeet.z);
}

PlayerCapsule::~PlayerCapsule() = default;

void PlayerCapsule::advance(float deltaTime, JPH::TempAllocator& allocator) {
    JPH::Vec3 velocity = toJolt(desiredVelocity_);

    // Standing on something that moves carries the player along
    if (character_->GetGroundState() == JPH::CharacterVirtual::EGroundState::OnGround) {
        velocity += character_->GetGroundVelocity();
    }
    character_->SetLinearVelocity(velocity);

    JPH::DefaultBroadPhaseLayerFilter treeFilter(layerVsTreeFilter(), ObjectLayers::PLAYER);
    JPH::DefaultObjectLayerFilter layerFilter(layerPairFilter(), ObjectLayers::PLAYER);
    JPH::BodyFilter bodyFilter;
    JPH::ShapeFilter shapeFilter;

    JPH::CharacterVirtual::ExtendedUpdateSettings stepSettings;
    stepSettings.mWalkStairsStepUp = JPH::Vec3(0.0f, 0.35f, 0.0f);
    // Only snap to the floor when not deliberately rising or sinking
    stepSettings.mStickToFloorStepDown = desiredVelocity_.y == 0.0f ? JPH::Vec3(0.0f, -0.35f, 0.0f) : JPH::Vec3::sZero();

    character_->ExtendedUpdate(deltaTime, JPH::Vec3::sZero(), stepSettings,
                               treeFilter, layerFilter, bodyFilter, shapeFilter, allocator);
}

void PlayerCapsule::teleport(const glm::vec3& target) {
    character_->SetPosition(toJoltR(target + glm::vec3(0.0f, halfHeight_, 0.0f)));
    character_->SetLinearVelocity(JPH::Vec3::sZero());
}

glm::vec3 PlayerCapsule::feet() const {
    const JPH::RVec3 center = character_->GetPosition();
    return glm::vec3(static_cast<float>(center.GetX()),
                     static_cast<float>(center.GetY()) - halfHeight_,
                     static_cast<float>(center.GetZ()));
}

uint32_t PlayerCapsule::innerBodyId() const {
    return character_->GetInnerBodyID().GetIndexAndSequenceNumber();
}
