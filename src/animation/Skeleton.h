#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>
#include <array>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>

#include "DarkConstants.h"

struct AnimationClip;

using JointId = uint32_t;

// Fixed-size export of joint matrices handed to skinning and hit-boxes
using JointTransforms = std::array<glm::mat4, MAX_JOINTS>;

// Per-joint override composed on top of clip animation (turret aim, head look)
using JointOverrides = std::map<JointId, glm::mat4>;

struct Bone {
    JointId jointId = 0;
    std::optional<JointId> parentId;
    glm::mat4 localTransform{1.0f};
};

// Rest pose of a joint imported from GLB. Joints without one behave as identity.
struct JointRestTransform {
    glm::vec3 translation{0.0f};
    glm::quat rotation{1.0f, 0.0f, 0.0f, 0.0f};
    glm::vec3 scale{1.0f};
    glm::mat4 localMatrix{1.0f};
    glm::mat4 localInverse{1.0f};
    glm::mat4 inverseBind{1.0f};
};

struct AnimationInfo {
    const AnimationClip* clip = nullptr;
    uint32_t frame = 0;
};

// Hierarchical joint tree plus the global matrices of one evaluation.
// Bone data is shared between all evaluations of the same asset; animate()
// never modifies the skeleton it is given.
class Skeleton {
public:
    Skeleton();

    static Skeleton empty() { return Skeleton(); }

    // Parents that do not exist, and parent cycles, are re-parented to the root with a warning
    static Skeleton fromBones(std::vector<Bone> bones);

    static Skeleton fromBonesWithRest(std::vector<Bone> bones,
                                      std::unordered_map<size_t, JointId> nodeToJoint,
                                      std::unordered_map<JointId, JointRestTransform> restTransforms);

    // Evaluate `base` for one frame of `info` (or the rest pose), with overrides replacing
    // the clip's contribution for their joints
    static Skeleton animate(const Skeleton& base,
                            std::optional<AnimationInfo> info,
                            const JointOverrides& overrides);

    size_t boneCount() const { return shared_->bones.size(); }
    const std::vector<Bone>& bones() const { return shared_->bones; }

    // Joints >= MAX_JOINTS are evaluated but left out of this export
    JointTransforms getTransforms() const;

    glm::mat4 globalTransform(JointId joint) const;
    const std::unordered_map<JointId, glm::mat4>& globalTransforms() const { return globalTransforms_; }

    const JointRestTransform* restTransform(JointId joint) const;
    std::optional<JointId> jointForNode(size_t nodeIndex) const;

private:
    struct SharedData {
        std::vector<Bone> bones;
        std::unordered_map<JointId, size_t> jointToBone;  // first bone wins for duplicate ids
        std::unordered_map<size_t, JointId> nodeToJoint;
        std::unordered_map<JointId, JointRestTransform> restTransforms;
    };

    static std::shared_ptr<const SharedData> buildShared(std::vector<Bone> bones,
                                                         std::unordered_map<size_t, JointId> nodeToJoint,
                                                         std::unordered_map<JointId, JointRestTransform> restTransforms);

    void evaluate(const std::unordered_map<JointId, glm::mat4>& animationTransforms,
                  const glm::mat4& rootTransform);

    glm::mat4 globalFor(JointId joint,
                        const std::unordered_map<JointId, glm::mat4>& animationTransforms,
                        const glm::mat4& rootTransform);

    std::shared_ptr<const SharedData> shared_;
    std::unordered_map<JointId, glm::mat4> globalTransforms_;
};
