#include "AnimationPlayer.h"
#include "AnimationBlend.h"
#include <algorithm>
#include <cfloat>
#include <cmath>

AnimationPlayer AnimationPlayer::fromAnimation(ClipHandle clip) {
    AnimationPlayer player;
    if (clip) {
        player.queue_.push_back({std::move(clip), PlayMode::Loop});
    }
    return player;
}

AnimationPlayer AnimationPlayer::queueAnimation(ClipHandle clip) const {
    AnimationPlayer next;
    next.overrides_ = overrides_;
    if (!clip) {
        next.queue_ = queue_;
        next.lastClip_ = lastClip_;
        next.currentFrame_ = currentFrame_;
        next.residualTime_ = residualTime_;
        next.blend_ = blend_;
        return next;
    }

    if (!queue_.empty() && clip->blendLength > 0.0f) {
        next.blend_ = BlendState{
            queue_.front().clip,
            static_cast<float>(currentFrame_),
            clip->blendLength,
            0.0f
        };
    }

    next.queue_.reserve(queue_.size() + 1);
    next.queue_.push_back({std::move(clip), PlayMode::PlayOnce});
    next.queue_.insert(next.queue_.end(), queue_.begin(), queue_.end());
    return next;
}

AnimationPlayer AnimationPlayer::setAdditionalJointTransform(JointId joint, const glm::mat4& transform) const {
    AnimationPlayer next = *this;
    next.overrides_[joint] = transform;
    return next;
}

AnimationUpdateResult AnimationPlayer::update(float deltaTime) const {
    AnimationUpdateResult result;
    result.player = *this;
    AnimationPlayer& next = result.player;

    float remaining = residualTime_ + deltaTime;

    if (next.blend_) {
        BlendState& blend = *next.blend_;
        blend.elapsed += deltaTime;
        const AnimationClip& from = *blend.fromClip;
        if (from.numFrames > 0 && from.timePerFrame > 0.0f) {
            float frame = blend.fromFrame + deltaTime / from.timePerFrame;
            float frameCount = static_cast<float>(from.numFrames);
            if (frame >= frameCount) {
                frame = std::fmod(frame, frameCount);
            }
            blend.fromFrame = frame;
        }
        if (blend.duration <= FLT_EPSILON || blend.elapsed >= blend.duration) {
            next.blend_.reset();
        }
    }

    if (queue_.empty()) {
        return result;
    }

    const QueuedClip& current = queue_.front();
    const AnimationClip& clip = *current.clip;
    result.slidingVelocity = clip.slidingVelocity;

    uint32_t nextFrame = currentFrame_;
    if (clip.timePerFrame > 0.0f) {
        while (remaining >= clip.timePerFrame) {
            remaining -= clip.timePerFrame;
            ++nextFrame;
        }
    } else {
        nextFrame = std::max(nextFrame, clip.numFrames);
        remaining = 0.0f;
    }

    for (const auto& flag : clip.motionFlags) {
        if (flag.frame > currentFrame_ && flag.frame <= nextFrame) {
            result.flags |= flag.flags;
        }
    }

    if (nextFrame >= clip.numFrames) {
        result.events.push_back(AnimationEvent::completed());
        if (clip.endRotation != 0.0f) {
            result.events.push_back(AnimationEvent::directionChanged(clip.endRotation));
        }

        if (current.mode == PlayMode::Loop) {
            next.currentFrame_ = clip.numFrames > 0 ? nextFrame % clip.numFrames : 0;
            next.residualTime_ = remaining;
        } else {
            next.lastClip_ = current.clip;
            next.queue_.erase(next.queue_.begin());
            next.currentFrame_ = 0;
            next.residualTime_ = 0.0f;
        }
    } else {
        if (currentFrame_ == 0 && nextFrame > 0) {
            result.events.push_back(AnimationEvent::velocityChanged(clip.slidingVelocity));
        }
        next.currentFrame_ = nextFrame;
        next.residualTime_ = remaining;
    }

    return result;
}

JointTransforms AnimationPlayer::transformsForClip(const Skeleton& skeleton, const AnimationClip& clip,
                                                   uint32_t frame, const JointOverrides& overrides) {
    return Skeleton::animate(skeleton, AnimationInfo{&clip, frame}, overrides).getTransforms();
}

JointTransforms AnimationPlayer::getTransforms(const Skeleton& skeleton) const {
    const AnimationClip* clip = nullptr;
    bool isLast = false;
    if (!queue_.empty()) {
        clip = queue_.front().clip.get();
    } else if (lastClip_) {
        clip = lastClip_.get();
        isLast = true;
    }

    if (!clip) {
        return Skeleton::animate(skeleton, std::nullopt, overrides_).getTransforms();
    }

    uint32_t frame = isLast ? (clip->numFrames > 0 ? clip->numFrames - 1 : 0) : currentFrame_;
    JointTransforms transforms = transformsForClip(skeleton, *clip, frame, overrides_);

    if (blend_ && blend_->duration > FLT_EPSILON && blend_->elapsed < blend_->duration) {
        float alpha = std::clamp(blend_->elapsed / blend_->duration, 0.0f, 1.0f);
        const AnimationClip& from = *blend_->fromClip;
        uint32_t fromFrame = from.numFrames > 0
            ? static_cast<uint32_t>(std::floor(blend_->fromFrame)) % from.numFrames
            : 0;
        JointTransforms fromTransforms = transformsForClip(skeleton, from, fromFrame, overrides_);
        transforms = AnimationBlend::blendTransforms(fromTransforms, transforms, alpha);
    }

    return transforms;
}
