#pragma once

#include <glm/glm.hpp>

#include "Alertness.h"
#include "Effect.h"
#include "World.h"

// Offsets of the alertness bar and visibility tick, relative to the entity position
struct AlertnessDebugConfig {
    glm::vec3 barOffset{0.0f};
    glm::vec3 visibilityOffset{-0.25f, 0.0f, 0.0f};
    float visibilityLength = 0.5f;

    static AlertnessDebugConfig turret() { return {{0.5f, 0.0f, 0.0f}, {-0.5f, 0.5f, 0.0f}, 0.5f}; }
    static AlertnessDebugConfig monster() { return {{0.0f, 1.5f, 0.0f}, {-0.25f, 1.5f, 0.0f}, 0.5f}; }
    static AlertnessDebugConfig camera() { return {{0.5f, 0.0f, 0.0f}, {-0.5f, 0.5f, 0.0f}, 0.5f}; }
};

struct FovDebugConfig {
    float heightOffset = 0.5f;
    float lineLength = 5.0f;
    float fovHalfAngle = 45.0f;     // degrees

    static FovDebugConfig turret() { return {0.3f, 8.0f, 30.0f}; }
    static FovDebugConfig monster() { return {1.2f, 6.0f, 60.0f}; }
};

// Debug line producers for AI scripts. Both return NoEffect unless AI debugging is on.
namespace AIDebugUtil {

    glm::vec4 alertnessLevelColor(AIAlertLevel level);
    float alertnessLevelHeight(AIAlertLevel level);

    // Vertical bar sized and colored by level, plus a tick that is green while the player is seen
    Effect drawDebugAlertness(const ecs::World& world, EntityId entity, const AlertnessState& alertness,
                              bool isVisible, const AlertnessDebugConfig& config);

    // Facing line and the two FOV edges. Facing is rotation * yaw(-heading).
    Effect drawDebugFov(const ecs::World& world, EntityId entity, float heading, bool isVisible,
                        const FovDebugConfig& config);

}
