#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>
#include <entt/entity/entity.hpp>
#include <optional>

#include "EntityId.h"

// Singletons stored in the registry context

struct PlayerInfo {
    EntityId entity = entt::null;
    glm::vec3 position{0.0f};
    glm::quat rotation{1.0f, 0.0f, 0.0f, 0.0f};
    std::optional<EntityId> leftHand;
    std::optional<EntityId> rightHand;
    EntityId inventory = entt::null;
};

struct GameTime {
    float elapsed = 0.0f;   // seconds since the previous tick
    float total = 0.0f;     // seconds since mission start
};

struct DebugOptions {
    bool debugAI = false;
    bool debugDraw = false;
    bool debugPhysics = false;
    bool debugPortals = false;
    bool showIds = false;
};
