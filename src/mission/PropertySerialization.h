#pragma once

#include <nlohmann/json.hpp>

#include "World.h"

// Template/mission property JSON <-> entity components. Keys are the property
// names used in gamesys.json ("ModelName", "HitPoints", "AIAlertCap", ...).
namespace PropertySerialization {

    // Unknown keys are skipped with a debug log; malformed values with a warning
    void apply(ecs::World& world, EntityId entity, const nlohmann::json& properties);

    // Inverse of apply for every property component the entity carries
    nlohmann::json snapshot(const ecs::World& world, EntityId entity);

}
