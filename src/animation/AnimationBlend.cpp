#include "AnimationBlend.h"
#include <cmath>

glm::mat4 BonePose::toMatrix() const {
    glm::mat4 T = glm::translate(glm::mat4(1.0f), translation);
    glm::mat4 R = glm::mat4_cast(rotation);
    glm::mat4 S = glm::scale(glm::mat4(1.0f), scale);
    return T * R * S;
}

BonePose BonePose::fromMatrix(const glm::mat4& matrix) {
    BonePose pose;

    pose.translation = glm::vec3(matrix[3]);

    pose.scale.x = glm::length(glm::vec3(matrix[0]));
    pose.scale.y = glm::length(glm::vec3(matrix[1]));
    pose.scale.z = glm::length(glm::vec3(matrix[2]));

    const float epsilon = 1e-6f;
    if (pose.scale.x < epsilon) pose.scale.x = 1.0f;
    if (pose.scale.y < epsilon) pose.scale.y = 1.0f;
    if (pose.scale.z < epsilon) pose.scale.z = 1.0f;

    glm::mat3 rotMat(
        glm::vec3(matrix[0]) / pose.scale.x,
        glm::vec3(matrix[1]) / pose.scale.y,
        glm::vec3(matrix[2]) / pose.scale.z
    );
    pose.rotation = glm::normalize(glm::quat_cast(rotMat));

    return pose;
}

namespace AnimationBlend {

BonePose blend(const BonePose& a, const BonePose& b, float t) {
    BonePose result;
    result.translation = glm::mix(a.translation, b.translation, t);
    result.rotation = glm::normalize(glm::slerp(a.rotation, b.rotation, t));
    result.scale = glm::mix(a.scale, b.scale, t);
    return result;
}

glm::mat4 blendMatrix(const glm::mat4& from, const glm::mat4& to, float alpha) {
    if (alpha <= 0.0f) return from;
    if (alpha >= 1.0f) return to;
    return blend(BonePose::fromMatrix(from), BonePose::fromMatrix(to), alpha).toMatrix();
}

JointTransforms blendTransforms(const JointTransforms& from, const JointTransforms& to, float alpha) {
    if (alpha <= 0.0f) return from;
    if (alpha >= 1.0f) return to;

    JointTransforms result;
    for (size_t i = 0; i < result.size(); ++i) {
        result[i] = blendMatrix(from[i], to[i], alpha);
    }
    return result;
}

}  // namespace AnimationBlend
