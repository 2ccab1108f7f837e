#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <cmath>

// Angle helpers shared by the AI scripts and the mission tick. Angles are in degrees.
namespace RotationUtils {

inline glm::quat fromAngleX(float degrees) {
    return glm::angleAxis(glm::radians(degrees), glm::vec3(1.0f, 0.0f, 0.0f));
}

inline glm::quat fromAngleY(float degrees) {
    return glm::angleAxis(glm::radians(degrees), glm::vec3(0.0f, 1.0f, 0.0f));
}

inline glm::mat4 rotationYMatrix(float degrees) {
    return glm::mat4_cast(fromAngleY(degrees));
}

// Yaw of the direction a -> b, measured from +Z towards +X
inline float yawBetween(const glm::vec3& a, const glm::vec3& b) {
    float radians = -std::atan2(b.z - a.z, b.x - a.x) + glm::half_pi<float>();
    return glm::degrees(radians);
}

// Wrap into [-180, 180]
inline float clampToMinimalDeltaAngle(float degrees) {
    while (degrees > 180.0f) degrees -= 360.0f;
    while (degrees < -180.0f) degrees += 360.0f;
    return degrees;
}

// Wrap into (-180, 180]
inline float normalizeDegrees(float degrees) {
    float wrapped = std::fmod(degrees, 360.0f);
    if (wrapped <= -180.0f) wrapped += 360.0f;
    if (wrapped > 180.0f) wrapped -= 360.0f;
    return wrapped;
}

// Step `current` towards `target` by at most `maxDelta`, along the shorter arc
inline float moveTowardsAngle(float current, float target, float maxDelta) {
    float delta = normalizeDegrees(target - current);
    if (std::abs(delta) <= maxDelta) {
        return target;
    }
    return normalizeDegrees(current + (delta > 0.0f ? maxDelta : -maxDelta));
}

inline glm::vec3 transformPoint(const glm::mat4& m, const glm::vec3& p) {
    return glm::vec3(m * glm::vec4(p, 1.0f));
}

inline glm::vec3 transformVector(const glm::mat4& m, const glm::vec3& v) {
    return glm::vec3(m * glm::vec4(v, 0.0f));
}

}  // namespace RotationUtils
