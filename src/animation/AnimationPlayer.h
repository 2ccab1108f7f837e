#pragma once

#include <glm/glm.hpp>
#include <memory>
#include <optional>
#include <vector>

#include "AnimationClip.h"
#include "Skeleton.h"

using ClipHandle = std::shared_ptr<const AnimationClip>;

enum class PlayMode {
    Loop,
    PlayOnce
};

struct AnimationEvent {
    enum class Type {
        Completed,
        DirectionChanged,   // angle holds the clip's end rotation in degrees
        VelocityChanged     // velocity holds the clip's sliding velocity
    };

    Type type = Type::Completed;
    float angle = 0.0f;
    glm::vec3 velocity{0.0f};

    static AnimationEvent completed() { return {Type::Completed}; }
    static AnimationEvent directionChanged(float degrees) { return {Type::DirectionChanged, degrees}; }
    static AnimationEvent velocityChanged(const glm::vec3& v) { return {Type::VelocityChanged, 0.0f, v}; }
};

struct AnimationUpdateResult;

// Per-entity playback state. Every operation returns a new player and leaves
// the original untouched, so a snapshot can be rendered while the next tick runs.
class AnimationPlayer {
public:
    struct BlendState {
        ClipHandle fromClip;
        float fromFrame = 0.0f;
        float duration = 0.0f;
        float elapsed = 0.0f;
    };

    AnimationPlayer() = default;

    // Start looping `clip`
    static AnimationPlayer fromAnimation(ClipHandle clip);

    // Play `clip` once in front of whatever is queued; cross-fades from the current clip
    [[nodiscard]] AnimationPlayer queueAnimation(ClipHandle clip) const;

    [[nodiscard]] AnimationPlayer setAdditionalJointTransform(JointId joint, const glm::mat4& transform) const;

    [[nodiscard]] AnimationUpdateResult update(float deltaTime) const;

    // Pure function of this player and the skeleton
    JointTransforms getTransforms(const Skeleton& skeleton) const;

    bool isEmpty() const { return queue_.empty(); }
    const AnimationClip* currentClip() const { return queue_.empty() ? nullptr : queue_.front().clip.get(); }
    const AnimationClip* lastClip() const { return lastClip_.get(); }
    uint32_t currentFrame() const { return currentFrame_; }
    float residualTime() const { return residualTime_; }
    size_t queueLength() const { return queue_.size(); }
    const std::optional<BlendState>& blendState() const { return blend_; }
    const JointOverrides& overrides() const { return overrides_; }

private:
    struct QueuedClip {
        ClipHandle clip;
        PlayMode mode = PlayMode::Loop;
    };

    static JointTransforms transformsForClip(const Skeleton& skeleton, const AnimationClip& clip,
                                             uint32_t frame, const JointOverrides& overrides);

    std::vector<QueuedClip> queue_;     // front is playing
    ClipHandle lastClip_;               // final pose held once the queue drains
    uint32_t currentFrame_ = 0;
    float residualTime_ = 0.0f;
    JointOverrides overrides_;
    std::optional<BlendState> blend_;
};

struct AnimationUpdateResult {
    AnimationPlayer player;
    MotionFlags flags = 0;
    std::vector<AnimationEvent> events;
    glm::vec3 slidingVelocity{0.0f};
};
