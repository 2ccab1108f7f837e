#pragma once

#include <glm/glm.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "Skeleton.h"

// Motion flag bits attached to clip frames
namespace MotionFlag {
    constexpr uint32_t Standing        = 1u << 0;
    constexpr uint32_t LeftFootfall    = 1u << 1;
    constexpr uint32_t RightFootfall   = 1u << 2;
    constexpr uint32_t LeftFootUp      = 1u << 3;
    constexpr uint32_t RightFootUp     = 1u << 4;
    constexpr uint32_t Fire            = 1u << 5;
    constexpr uint32_t FireRelease     = 1u << 6;
    constexpr uint32_t CanInterrupt    = 1u << 7;
    constexpr uint32_t StartMotionHere = 1u << 8;
    constexpr uint32_t EndMotionHere   = 1u << 9;
    constexpr uint32_t EndOfAttack     = 1u << 10;
    constexpr uint32_t Death           = 1u << 11;

    // Parse a flag name as written in motion data ("fire", "left_footfall", ...). 0 if unknown.
    uint32_t fromName(const std::string& name);
}

using MotionFlags = uint32_t;

struct MotionFlagFrame {
    uint32_t frame = 0;
    MotionFlags flags = 0;
};

// Immutable sampled animation. Times are in seconds, angles in degrees.
struct AnimationClip {
    static constexpr float DEFAULT_BLEND_LENGTH = 0.25f;

    std::optional<std::string> name;
    uint32_t numFrames = 0;
    float timePerFrame = 1.0f / 30.0f;
    float duration = 0.0f;
    float blendLength = DEFAULT_BLEND_LENGTH;
    float endRotation = 0.0f;
    glm::vec3 slidingVelocity{0.0f};
    glm::vec3 translation{0.0f};

    // Every vector holds at least numFrames entries
    std::unordered_map<JointId, std::vector<glm::mat4>> jointToFrame;

    // Empty means identity on every frame
    std::vector<glm::mat4> rootTransforms;

    std::vector<MotionFlagFrame> motionFlags;

    uint32_t normalizeFrame(uint32_t frame) const {
        return numFrames == 0 ? 0 : frame % numFrames;
    }

    glm::mat4 rootTransformAt(uint32_t frame) const {
        if (rootTransforms.empty() || numFrames == 0) return glm::mat4(1.0f);
        return rootTransforms[normalizeFrame(frame)];
    }

    // Drops joint tracks and root transforms shorter than numFrames; returns false if any were dropped
    bool sanitize();
};
