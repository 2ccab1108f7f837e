#include "AIDebugUtil.h"
#include "RotationUtils.h"

#include <glm/gtc/quaternion.hpp>
#include <cmath>

namespace AIDebugUtil {

glm::vec4 alertnessLevelColor(AIAlertLevel level) {
    switch (level) {
        case AIAlertLevel::Lowest: return {0.0f, 0.5f, 0.0f, 1.0f};
        case AIAlertLevel::Low: return {0.5f, 0.5f, 0.0f, 1.0f};
        case AIAlertLevel::Moderate: return {1.0f, 0.5f, 0.0f, 1.0f};
        case AIAlertLevel::High: return {1.0f, 0.0f, 0.0f, 1.0f};
    }
    return {1.0f, 0.0f, 0.0f, 1.0f};
}

float alertnessLevelHeight(AIAlertLevel level) {
    switch (level) {
        case AIAlertLevel::Lowest: return 0.25f;
        case AIAlertLevel::Low: return 0.5f;
        case AIAlertLevel::Moderate: return 0.75f;
        case AIAlertLevel::High: return 1.0f;
    }
    return 1.0f;
}

Effect drawDebugAlertness(const ecs::World& world, EntityId entity, const AlertnessState& alertness,
                          bool isVisible, const AlertnessDebugConfig& config) {
    if (!world.debugOptions().debugAI) {
        return {};
    }
    const Position* pose = world.tryGet<Position>(entity);
    if (!pose) {
        return {};
    }

    glm::vec4 visColor = isVisible ? glm::vec4(0.0f, 1.0f, 0.0f, 1.0f) : glm::vec4(0.5f, 0.5f, 0.5f, 1.0f);

    glm::vec3 barBase = pose->position + config.barOffset;
    glm::vec3 barTop = barBase + glm::vec3(0.0f, alertnessLevelHeight(alertness.currentLevel), 0.0f);
    glm::vec3 visBase = pose->position + config.visibilityOffset;
    glm::vec3 visEnd = visBase + glm::vec3(0.0f, 0.0f, config.visibilityLength);

    return Effects::DrawDebugLines{{
        {barBase, barTop, alertnessLevelColor(alertness.currentLevel)},
        {visBase, visEnd, visColor},
    }};
}

Effect drawDebugFov(const ecs::World& world, EntityId entity, float heading, bool isVisible,
                    const FovDebugConfig& config) {
    if (!world.debugOptions().debugAI) {
        return {};
    }
    const Position* pose = world.tryGet<Position>(entity);
    if (!pose) {
        return {};
    }

    glm::quat orientation = pose->rotation * RotationUtils::fromAngleY(-heading);
    glm::vec3 forward = glm::normalize(orientation * glm::vec3(0.0f, 0.0f, 1.0f));

    glm::vec3 right = glm::cross(forward, glm::vec3(0.0f, 1.0f, 0.0f));
    if (glm::dot(right, right) < 1e-4f) {
        right = glm::vec3(1.0f, 0.0f, 0.0f);
    } else {
        right = glm::normalize(right);
    }

    float halfRad = glm::radians(config.fovHalfAngle);
    glm::vec3 left = glm::normalize(forward * std::cos(halfRad) - right * std::sin(halfRad));
    glm::vec3 rightEdge = glm::normalize(forward * std::cos(halfRad) + right * std::sin(halfRad));

    glm::vec3 origin = pose->position + glm::vec3(0.0f, config.heightOffset, 0.0f);
    glm::vec4 mainColor = isVisible ? glm::vec4(0.0f, 1.0f, 0.0f, 1.0f) : glm::vec4(1.0f, 0.0f, 0.0f, 1.0f);
    glm::vec4 edgeColor(0.0f, 0.5f, 1.0f, 1.0f);

    return Effects::DrawDebugLines{{
        {origin, origin + forward * config.lineLength, mainColor},
        {origin, origin + left * config.lineLength, edgeColor},
        {origin, origin + rightEdge * config.lineLength, edgeColor},
    }};
}

}  // namespace AIDebugUtil
