#include <doctest/doctest.h>
#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>

#include "animation/AnimationPlayer.h"

static bool approxEqual(const glm::vec3& a, const glm::vec3& b, float eps = 0.01f) {
    return glm::length(a - b) < eps;
}

static Skeleton singleJoint() {
    return Skeleton::fromBones({{0, std::nullopt, glm::mat4(1.0f)}});
}

// Joint 0 translated by frame * step on every frame
static ClipHandle translationClip(const std::string& name, uint32_t frames, float timePerFrame,
                                  const glm::vec3& step, const glm::vec3& offset = glm::vec3(0.0f)) {
    auto clip = std::make_shared<AnimationClip>();
    clip->name = name;
    clip->numFrames = frames;
    clip->timePerFrame = timePerFrame;
    clip->duration = frames * timePerFrame;
    for (uint32_t i = 0; i < frames; ++i) {
        clip->jointToFrame[0].push_back(glm::translate(glm::mat4(1.0f), offset + step * static_cast<float>(i)));
    }
    return clip;
}

static int countCompleted(const AnimationUpdateResult& result) {
    int count = 0;
    for (const auto& event : result.events) {
        if (event.type == AnimationEvent::Type::Completed) ++count;
    }
    return count;
}

TEST_SUITE("AnimationPlayer") {
    TEST_CASE("play-once clip completes exactly once") {
        ClipHandle swing = translationClip("swing", 3, 0.1f, glm::vec3(1.0f, 0.0f, 0.0f));

        AnimationPlayer player;
        player = player.queueAnimation(swing);
        REQUIRE(player.queueLength() == 1);

        int completed = 0;
        for (int i = 0; i < 3; ++i) {
            AnimationUpdateResult result = player.update(0.1f);
            int events = countCompleted(result);
            if (i < 2) {
                CHECK(events == 0);
            } else {
                CHECK(events == 1);
            }
            completed += events;
            player = result.player;
        }
        CHECK(completed == 1);
        CHECK(player.isEmpty());
        CHECK(player.lastClip() == swing.get());
    }

    TEST_CASE("finished player holds the last frame of the last clip") {
        ClipHandle swing = translationClip("swing", 3, 0.1f, glm::vec3(1.0f, 0.0f, 0.0f));
        std::const_pointer_cast<AnimationClip>(swing)->blendLength = 0.0f;

        AnimationPlayer player = AnimationPlayer().queueAnimation(swing);
        for (int i = 0; i < 5; ++i) {
            player = player.update(0.1f).player;
        }
        JointTransforms transforms = player.getTransforms(singleJoint());
        CHECK(approxEqual(glm::vec3(transforms[0][3]), glm::vec3(2.0f, 0.0f, 0.0f)));
    }

    TEST_CASE("looping clip wraps and reports completion each cycle") {
        ClipHandle walk = translationClip("walk", 2, 0.1f, glm::vec3(0.0f, 0.0f, 1.0f));
        AnimationPlayer player = AnimationPlayer::fromAnimation(walk);

        AnimationUpdateResult first = player.update(0.1f);
        CHECK(countCompleted(first) == 0);
        CHECK(first.player.currentFrame() == 1);

        AnimationUpdateResult second = first.player.update(0.1f);
        CHECK(countCompleted(second) == 1);
        CHECK(second.player.currentFrame() == 0);
        CHECK(second.player.queueLength() == 1);
    }

    TEST_CASE("cross-fade blends from the interrupted clip") {
        // A holds joint 0 at (2,0,0); B moves it 4 units up per frame
        ClipHandle a = translationClip("a", 10, 0.1f, glm::vec3(0.0f), glm::vec3(2.0f, 0.0f, 0.0f));
        ClipHandle b = translationClip("b", 4, 0.1f, glm::vec3(0.0f, 4.0f, 0.0f));
        std::const_pointer_cast<AnimationClip>(b)->blendLength = 0.2f;

        AnimationPlayer player = AnimationPlayer::fromAnimation(a);
        for (int i = 0; i < 5; ++i) {
            player = player.update(0.1f).player;
        }
        REQUIRE(player.currentFrame() == 5);

        Skeleton skeleton = singleJoint();
        player = player.queueAnimation(b);
        REQUIRE(player.blendState().has_value());
        CHECK(approxEqual(glm::vec3(player.getTransforms(skeleton)[0][3]), glm::vec3(2.0f, 0.0f, 0.0f)));

        player = player.update(0.1f).player;
        REQUIRE(player.currentFrame() == 1);
        CHECK(approxEqual(glm::vec3(player.getTransforms(skeleton)[0][3]), glm::vec3(1.0f, 2.0f, 0.0f)));

        player = player.update(0.1f).player;
        CHECK_FALSE(player.blendState().has_value());
        CHECK(approxEqual(glm::vec3(player.getTransforms(skeleton)[0][3]), glm::vec3(0.0f, 8.0f, 0.0f)));
    }

    TEST_CASE("update leaves the original player untouched") {
        ClipHandle walk = translationClip("walk", 4, 0.1f, glm::vec3(1.0f, 0.0f, 0.0f));
        AnimationPlayer player = AnimationPlayer::fromAnimation(walk);

        AnimationUpdateResult result = player.update(0.25f);
        CHECK(player.currentFrame() == 0);
        CHECK(player.residualTime() == doctest::Approx(0.0f));
        CHECK(result.player.currentFrame() == 2);
        CHECK(result.player.residualTime() == doctest::Approx(0.05f).epsilon(0.01));

        AnimationPlayer overridden = player.setAdditionalJointTransform(3, glm::mat4(2.0f));
        CHECK(player.overrides().empty());
        CHECK(overridden.overrides().size() == 1);
    }

    TEST_CASE("motion flags fire once when their frame is crossed") {
        auto clip = std::const_pointer_cast<AnimationClip>(
            translationClip("attack", 6, 0.1f, glm::vec3(0.0f)));
        clip->motionFlags.push_back({2, MotionFlag::Fire});

        AnimationPlayer player = AnimationPlayer::fromAnimation(clip);
        AnimationUpdateResult r1 = player.update(0.1f);
        CHECK((r1.flags & MotionFlag::Fire) == 0);
        AnimationUpdateResult r2 = r1.player.update(0.1f);
        CHECK((r2.flags & MotionFlag::Fire) != 0);
        AnimationUpdateResult r3 = r2.player.update(0.1f);
        CHECK((r3.flags & MotionFlag::Fire) == 0);
    }

    TEST_CASE("end rotation is reported on completion") {
        auto clip = std::const_pointer_cast<AnimationClip>(
            translationClip("turn", 2, 0.1f, glm::vec3(0.0f)));
        clip->endRotation = 90.0f;
        clip->blendLength = 0.0f;

        AnimationPlayer player = AnimationPlayer().queueAnimation(clip);
        AnimationUpdateResult result = player.update(0.2f);

        bool sawDirection = false;
        for (const auto& event : result.events) {
            if (event.type == AnimationEvent::Type::DirectionChanged) {
                sawDirection = true;
                CHECK(event.angle == doctest::Approx(90.0f));
            }
        }
        CHECK(sawDirection);
    }

    TEST_CASE("queued clip plays before the previous loop resumes") {
        ClipHandle idle = translationClip("idle", 4, 0.1f, glm::vec3(0.0f));
        ClipHandle wave = translationClip("wave", 2, 0.1f, glm::vec3(0.0f));

        AnimationPlayer player = AnimationPlayer::fromAnimation(idle).queueAnimation(wave);
        CHECK(player.currentClip() == wave.get());
        CHECK(player.queueLength() == 2);

        player = player.update(0.2f).player;
        CHECK(player.currentClip() == idle.get());
        CHECK(player.queueLength() == 1);
    }
}
