#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>
#include <optional>
#include <string>
#include <vector>

#include "AnimationClip.h"
#include "Skeleton.h"

// glTF sampler modes
enum class KeyInterpolation {
    Linear,
    Step,
    CubicSpline
};

// Keyframe channel of one node property, as stored in the file
template<typename T>
struct KeyframeTrack {
    KeyInterpolation interpolation = KeyInterpolation::Linear;
    std::vector<float> times;
    std::vector<T> values;
    // CubicSpline only, one per key
    std::vector<T> inTangents;
    std::vector<T> outTangents;

    bool empty() const { return times.empty() || values.empty(); }

    // Fills the track from a sampler output. CubicSpline output holds
    // (in-tangent, value, out-tangent) per key.
    bool assign(KeyInterpolation mode, std::vector<float> keyTimes, const std::vector<T>& output);

    // Interpolates between the bracketing keys by the track's mode (slerp for
    // linear rotations); clamps outside the key range
    std::optional<T> sample(float time) const;
};

struct NodeAnimation {
    size_t nodeIndex = 0;
    KeyframeTrack<glm::vec3> translation;
    KeyframeTrack<glm::quat> rotation;
    KeyframeTrack<glm::vec3> scale;
};

struct GLBAnimation {
    std::string name;
    float duration = 0.0f;
    std::vector<NodeAnimation> nodes;
};

// Skeleton plus clips resampled at GLB_TARGET_FPS
struct GLBAnimationSet {
    std::optional<Skeleton> skeleton;
    std::vector<AnimationClip> clips;
};

constexpr float GLB_TARGET_FPS = 30.0f;

namespace GLTFLoader {
    // Load the skeleton of the first skin (depth-first over the scenes) and every animation.
    // Only the embedded binary chunk is honored; external buffer URIs fail the load.
    std::optional<GLBAnimationSet> loadAnimations(const std::string& path);

    // Resample to GLB_TARGET_FPS. Per joint the stored matrix is rest_local_inverse * T * R * S,
    // with missing channels falling back to the joint's rest values.
    std::optional<AnimationClip> convertAnimation(const GLBAnimation& animation,
                                                  const std::optional<Skeleton>& skeleton);
}
