#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>
#include <glm/gtc/matrix_transform.hpp>

#include "Skeleton.h"

// Transform of a single joint decomposed into T/R/S for blending
struct BonePose {
    glm::vec3 translation{0.0f};
    glm::quat rotation{1.0f, 0.0f, 0.0f, 0.0f};
    glm::vec3 scale{1.0f};

    // T * R * S
    glm::mat4 toMatrix() const;

    // Assumes an affine T * R * S matrix; zero-length axes are treated as unit scale
    static BonePose fromMatrix(const glm::mat4& matrix);
};

namespace AnimationBlend {

    // t = 0 gives a, t = 1 gives b
    BonePose blend(const BonePose& a, const BonePose& b, float t);

    // Translation lerp, rotation slerp and scale lerp of two affine matrices.
    // Returns the inputs exactly at alpha <= 0 and alpha >= 1.
    glm::mat4 blendMatrix(const glm::mat4& from, const glm::mat4& to, float alpha);

    JointTransforms blendTransforms(const JointTransforms& from, const JointTransforms& to, float alpha);

}  // namespace AnimationBlend
