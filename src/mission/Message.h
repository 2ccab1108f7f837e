#pragma once

#include <cstdint>
#include <string>
#include <variant>

#include "AnimationClip.h"
#include "EntityId.h"

namespace MessagePayload {
    struct AnimationCompleted {};
    struct AnimationFlagTriggered { MotionFlags flags = 0; };
    struct Collided { EntityId with; };
    struct Damage { float amount = 0.0f; };
    struct Frob {};
    struct Hold {};
    struct Drop {};
    struct SensorBeginIntersect { EntityId with; };
    struct SensorEndIntersect { EntityId with; };
    struct Signal { std::string name; };
    struct TurnOn { EntityId from; };
    struct TurnOff { EntityId from; };
    struct TriggerPull {};
    struct TriggerRelease {};
}

using MessagePayloadVariant = std::variant<
    MessagePayload::AnimationCompleted,
    MessagePayload::AnimationFlagTriggered,
    MessagePayload::Collided,
    MessagePayload::Damage,
    MessagePayload::Frob,
    MessagePayload::Hold,
    MessagePayload::Drop,
    MessagePayload::SensorBeginIntersect,
    MessagePayload::SensorEndIntersect,
    MessagePayload::Signal,
    MessagePayload::TurnOn,
    MessagePayload::TurnOff,
    MessagePayload::TriggerPull,
    MessagePayload::TriggerRelease>;

// Script message addressed to one entity
struct Message {
    EntityId to;
    MessagePayloadVariant payload;
};

const char* messagePayloadName(const MessagePayloadVariant& payload);
