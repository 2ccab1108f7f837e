#pragma once

#include <optional>
#include <utility>

#include "Effect.h"
#include "Script.h"

struct SteeringOutput {
    float desiredHeading = 0.0f;    // degrees, same convention as RotationUtils::yawBetween

    static SteeringOutput fromCurrent(float heading) { return {heading}; }
};

using SteeringResult = std::optional<std::pair<SteeringOutput, Effect>>;

namespace Steering {

    // Straight at the player
    SteeringResult chasePlayer(const ScriptContext& ctx, EntityId entity);

    // Towards the next cell on the walkable path to the player. Falls back to
    // chasePlayer without navigation data, or when both share a cell.
    SteeringResult pathToPlayer(const ScriptContext& ctx, EntityId entity);

    // True when level geometry lies within `distance` along `heading`
    bool wallAhead(const ScriptContext& ctx, EntityId entity, float heading, float distance);

}
