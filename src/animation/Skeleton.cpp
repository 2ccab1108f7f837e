#include "Skeleton.h"
#include "AnimationClip.h"
#include <SDL3/SDL_log.h>
#include <unordered_set>

Skeleton::Skeleton()
    : shared_(std::make_shared<const SharedData>()) {
}

std::shared_ptr<const Skeleton::SharedData> Skeleton::buildShared(
    std::vector<Bone> bones,
    std::unordered_map<size_t, JointId> nodeToJoint,
    std::unordered_map<JointId, JointRestTransform> restTransforms) {

    auto data = std::make_shared<SharedData>();
    data->nodeToJoint = std::move(nodeToJoint);
    data->restTransforms = std::move(restTransforms);

    for (size_t i = 0; i < bones.size(); ++i) {
        data->jointToBone.emplace(bones[i].jointId, i);
    }

    // Missing parents become roots
    for (auto& bone : bones) {
        if (bone.parentId && data->jointToBone.find(*bone.parentId) == data->jointToBone.end()) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                "Skeleton: Joint %u references missing parent %u, treating as root",
                bone.jointId, *bone.parentId);
            bone.parentId.reset();
        }
    }

    // Break parent cycles by rooting the bone that closes the loop
    for (const auto& bone : bones) {
        std::unordered_set<JointId> visited{bone.jointId};
        Bone* current = &bones[data->jointToBone.at(bone.jointId)];
        while (current->parentId) {
            if (!visited.insert(*current->parentId).second) {
                SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                    "Skeleton: Joint %u closes a parent cycle, treating as root", current->jointId);
                current->parentId.reset();
                break;
            }
            current = &bones[data->jointToBone.at(*current->parentId)];
        }
    }

    data->bones = std::move(bones);
    return data;
}

Skeleton Skeleton::fromBones(std::vector<Bone> bones) {
    return fromBonesWithRest(std::move(bones), {}, {});
}

Skeleton Skeleton::fromBonesWithRest(std::vector<Bone> bones,
                                     std::unordered_map<size_t, JointId> nodeToJoint,
                                     std::unordered_map<JointId, JointRestTransform> restTransforms) {
    Skeleton skeleton;
    skeleton.shared_ = buildShared(std::move(bones), std::move(nodeToJoint), std::move(restTransforms));
    skeleton.evaluate({}, glm::mat4(1.0f));
    return skeleton;
}

Skeleton Skeleton::animate(const Skeleton& base,
                           std::optional<AnimationInfo> info,
                           const JointOverrides& overrides) {
    std::unordered_map<JointId, glm::mat4> animationTransforms;
    glm::mat4 rootTransform(1.0f);

    if (info && info->clip && info->clip->numFrames > 0) {
        const AnimationClip& clip = *info->clip;
        uint32_t frame = clip.normalizeFrame(info->frame);
        for (const auto& [joint, frames] : clip.jointToFrame) {
            if (frame < frames.size()) {
                animationTransforms[joint] = frames[frame];
            }
        }
        rootTransform = clip.rootTransformAt(frame);
    }

    for (const auto& [joint, transform] : overrides) {
        animationTransforms[joint] = transform;
    }

    Skeleton result;
    result.shared_ = base.shared_;
    result.evaluate(animationTransforms, rootTransform);
    return result;
}

void Skeleton::evaluate(const std::unordered_map<JointId, glm::mat4>& animationTransforms,
                        const glm::mat4& rootTransform) {
    globalTransforms_.clear();
    globalTransforms_.reserve(shared_->bones.size());
    for (const auto& bone : shared_->bones) {
        globalFor(bone.jointId, animationTransforms, rootTransform);
    }
}

glm::mat4 Skeleton::globalFor(JointId joint,
                              const std::unordered_map<JointId, glm::mat4>& animationTransforms,
                              const glm::mat4& rootTransform) {
    auto cached = globalTransforms_.find(joint);
    if (cached != globalTransforms_.end()) {
        return cached->second;
    }

    const Bone& bone = shared_->bones[shared_->jointToBone.at(joint)];

    glm::mat4 animation(1.0f);
    auto animIt = animationTransforms.find(joint);
    if (animIt != animationTransforms.end()) {
        animation = animIt->second;
    }

    glm::mat4 parent = bone.parentId
        ? globalFor(*bone.parentId, animationTransforms, rootTransform)
        : rootTransform;

    glm::mat4 global = parent * bone.localTransform * animation;
    globalTransforms_.emplace(joint, global);
    return global;
}

JointTransforms Skeleton::getTransforms() const {
    JointTransforms transforms;
    transforms.fill(glm::mat4(1.0f));
    for (const auto& [joint, global] : globalTransforms_) {
        if (joint < MAX_JOINTS) {
            transforms[joint] = global;
        }
    }
    return transforms;
}

glm::mat4 Skeleton::globalTransform(JointId joint) const {
    auto it = globalTransforms_.find(joint);
    return it != globalTransforms_.end() ? it->second : glm::mat4(1.0f);
}

const JointRestTransform* Skeleton::restTransform(JointId joint) const {
    auto it = shared_->restTransforms.find(joint);
    return it != shared_->restTransforms.end() ? &it->second : nullptr;
}

std::optional<JointId> Skeleton::jointForNode(size_t nodeIndex) const {
    auto it = shared_->nodeToJoint.find(nodeIndex);
    if (it == shared_->nodeToJoint.end()) return std::nullopt;
    return it->second;
}
