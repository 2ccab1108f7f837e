#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "AIProperties.h"
#include "AudioHandle.h"
#include "EntityId.h"
#include "Message.h"
#include "MotionDatabase.h"
#include "TagDatabase.h"
#include "Skeleton.h"

enum class Handedness : uint8_t {
    Left,
    Right
};

// Where the player appears after a mission load
struct SpawnLocation {
    enum class Kind { MapDefault, Marker, Position };

    Kind kind = Kind::MapDefault;
    std::string marker;
    glm::vec3 position{0.0f};

    static SpawnLocation mapDefault() { return {}; }
    static SpawnLocation atMarker(std::string name) { return {Kind::Marker, std::move(name), glm::vec3(0.0f)}; }
    static SpawnLocation at(const glm::vec3& p) { return {Kind::Position, {}, p}; }
};

// Effects that leave the mission and are handled by the runtime
namespace GlobalEffects {
    struct TransitionLevel {
        std::string mission;
        SpawnLocation spawn;
    };
    struct Save {
        std::string path;
    };
    struct Quit {};
}

using GlobalEffect = std::variant<GlobalEffects::TransitionLevel, GlobalEffects::Save, GlobalEffects::Quit>;

struct DebugLineSpec {
    glm::vec3 start{0.0f};
    glm::vec3 end{0.0f};
    glm::vec4 color{1.0f};
};

struct Effect;

namespace Effects {
    struct NoEffect {};
    struct Multiple { std::vector<Effect> effects; };

    struct AcquireKeyCard { std::string keyCard; };
    struct AdjustHitPoints { EntityId entity; int32_t delta = 0; };
    struct AwardXP { int32_t amount = 0; };
    struct DrawDebugLines { std::vector<DebugLineSpec> lines; };

    // Final transform is rootTransform * T(position) * R(orientation)
    struct CreateEntity {
        int32_t templateId = 0;
        glm::vec3 position{0.0f};
        glm::quat orientation{1.0f, 0.0f, 0.0f, 0.0f};
        glm::mat4 rootTransform{1.0f};
    };
    struct CreateEntityByTemplateName {
        std::string templateName;
        glm::vec3 position{0.0f};
        glm::quat orientation{1.0f, 0.0f, 0.0f, 0.0f};
    };
    struct DestroyEntity { EntityId entity; };
    struct SlayEntity { EntityId entity; };
    struct ReplaceEntity { EntityId entity; int32_t templateId = 0; };
    struct ChangeModel { EntityId entity; std::string modelName; };

    struct SetPosition { EntityId entity; glm::vec3 position{0.0f}; };
    struct SetRotation { EntityId entity; glm::quat rotation{1.0f, 0.0f, 0.0f, 0.0f}; };
    struct SetPositionRotation {
        EntityId entity;
        glm::vec3 position{0.0f};
        glm::quat rotation{1.0f, 0.0f, 0.0f, 0.0f};
    };
    struct SetPlayerPosition { glm::vec3 position{0.0f}; bool isTeleport = false; };

    struct QueueAnimationBySchema {
        EntityId entity;
        std::vector<MotionQueryItem> items;
        MotionSelection selection;
    };
    struct SetJointTransform { EntityId entity; JointId joint = 0; glm::mat4 transform{1.0f}; };

    struct PlaySound { AudioHandle handle; std::string name; };
    struct PlaySpeech {
        EntityId entity;
        size_t voiceIndex = 0;
        std::string speechConcept;
        std::vector<std::pair<std::string, std::string>> tags;
    };
    struct PlayEnvironmentalSound {
        AudioHandle handle;
        TagQuery query;
        glm::vec3 position{0.0f};
    };
    struct StopSound { AudioHandle handle; };

    struct GrabEntity { EntityId entity; Handedness hand = Handedness::Right; };
    struct DropEntityInfo { EntityId parent; EntityId dropped; };

    struct ResetGravity { EntityId entity; };
    struct SetGravity { EntityId entity; float gravityPercent = 1.0f; };

    struct SetQuestBit { std::string name; int32_t value = 0; };

    struct AlertnessUpdate { AIAlertLevel level = AIAlertLevel::Lowest; AIAlertLevel peak = AIAlertLevel::Lowest; };
    struct ModeUpdate { AIModeValue mode = AIModeValue::Normal; };
    struct SetAIProperty {
        EntityId entity;
        std::variant<AlertnessUpdate, ModeUpdate> update;
    };

    struct Send { Message message; };
    struct SetUI { EntityId parent; std::string handle; };
    struct Global { GlobalEffect effect; };
}

using EffectVariant = std::variant<
    Effects::NoEffect,
    Effects::Multiple,
    Effects::AcquireKeyCard,
    Effects::AdjustHitPoints,
    Effects::AwardXP,
    Effects::DrawDebugLines,
    Effects::CreateEntity,
    Effects::CreateEntityByTemplateName,
    Effects::DestroyEntity,
    Effects::SlayEntity,
    Effects::ReplaceEntity,
    Effects::ChangeModel,
    Effects::SetPosition,
    Effects::SetRotation,
    Effects::SetPositionRotation,
    Effects::SetPlayerPosition,
    Effects::QueueAnimationBySchema,
    Effects::SetJointTransform,
    Effects::PlaySound,
    Effects::PlaySpeech,
    Effects::PlayEnvironmentalSound,
    Effects::StopSound,
    Effects::GrabEntity,
    Effects::DropEntityInfo,
    Effects::ResetGravity,
    Effects::SetGravity,
    Effects::SetQuestBit,
    Effects::SetAIProperty,
    Effects::Send,
    Effects::SetUI,
    Effects::Global>;

// An intention produced during a tick and applied by the mission at its end
struct Effect {
    EffectVariant value;

    Effect() : value(Effects::NoEffect{}) {}

    template<typename T, typename = std::enable_if_t<!std::is_same_v<std::decay_t<T>, Effect>>>
    Effect(T&& v) : value(std::forward<T>(v)) {}

    bool isNone() const { return std::holds_alternative<Effects::NoEffect>(value); }

    template<typename T>
    const T* as() const { return std::get_if<T>(&value); }

    // Drops NoEffect entries and flattens nested Multiple
    static Effect combine(std::vector<Effect> effects);

    // Appends this effect to `out`, flattening Multiple
    void flattenInto(std::vector<Effect>& out) const;
};

const char* effectName(const Effect& effect);
