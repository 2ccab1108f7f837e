#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "EntityId.h"
#include "Skeleton.h"

// Authoritative pose; written back from physics every tick
struct Position {
    glm::vec3 position{0.0f};
    glm::quat rotation{1.0f, 0.0f, 0.0f, 0.0f};
    uint32_t cell = 0;
};

// T * R * |S| of the entity, recomputed after the physics sync
struct RuntimeTransform {
    glm::mat4 matrix{1.0f};
};

struct Scale {
    glm::vec3 value{1.0f};
};

struct TemplateId {
    int32_t id = 0;
};

// Designer name of an entity, used by named triggers and voice labels
struct SymName {
    std::string name;
};

struct ModelName {
    std::string name;
};

// Attachment points of the current model, model space (asset units)
struct Vhots {
    std::vector<glm::vec3> offsets;
};

// Creature species; indexes the creature definition table
struct Creature {
    uint32_t type = 0;
};

// Extra optional tags appended to every motion query for this actor
struct MotionActorTags {
    std::vector<std::string> tags;
};

struct HitPoints {
    int32_t hitPoints = 0;
};

struct VoiceIndex {
    int32_t index = -1;
};

struct SpeechVoice {
    std::string label;
};

// (tag, value) pairs used by environmental sound and voice lookups
struct ClassTags {
    std::vector<std::pair<std::string, std::string>> tags;
};

struct Scripts {
    std::vector<std::string> names;
};

// Launch velocity in asset units/sec, in the template's local frame
struct PhysInitialVelocity {
    glm::vec3 velocity{0.0f};
};

// Bounding box half extents in asset units
struct PhysDimensions {
    glm::vec3 halfExtents{0.5f};
    bool isSensor = false;
    bool isStatic = false;
};

// Present while a teleport cooldown runs
struct Teleported {
    static constexpr float DEFAULT_COUNTDOWN = 1.0f;
    float countdownTimer = DEFAULT_COUNTDOWN;
};

// False while the entity lives inside a container or hand
struct HasRefs {
    bool value = true;
};

struct RuntimeJointTransforms {
    JointTransforms transforms;
};

struct KeyCard {
    std::string name;
};

struct PlayerTag {};

// Hit-box body following one joint of a creature; damage is forwarded to the owner
struct HitBoxOf {
    EntityId owner;
    JointId joint = 0;
};

// Entities flagged this way are not rendered
struct RenderType {
    enum class Kind : uint8_t { Normal, NotRendered, Unlit, EditorOnly };
    Kind kind = Kind::Normal;
};

// Particle group emitted around the entity; sizes and rates in asset units
struct ParticleGroup {
    uint32_t count = 16;
    float size = 0.1f;
    glm::vec3 gravity{0.0f};
    float launchTime = 0.0f;    // seconds over which the initial particles are released
    float fadeTime = 0.0f;
    uint8_t alpha = 255;
};

// Launch box and ranges for particles of a ParticleGroup, in the entity's frame
struct ParticleLaunchInfo {
    glm::vec3 locMin{0.0f};
    glm::vec3 locMax{0.0f};
    glm::vec3 velMin{0.0f};
    glm::vec3 velMax{0.0f};
    float minTime = 1.0f;
    float maxTime = 1.0f;
};

// Fraction of normal gravity applied to the entity's body
struct GravityScale {
    float scale = 1.0f;
};
