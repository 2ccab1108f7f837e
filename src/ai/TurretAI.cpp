#include "TurretAI.h"
#include "AIDebugUtil.h"
#include "AIUtil.h"
#include "RotationUtils.h"
#include "Steering.h"

#include <glm/gtc/matrix_transform.hpp>
#include <algorithm>

Effect TurretAI::initialize(EntityId entity, ScriptContext& ctx) {
    initialYaw_ = AIUtil::currentYaw(ctx.world, entity);
    heading_ = initialYaw_;

    const auto* cap = ctx.world.tryGet<AIAlertCap>(entity);
    cap_ = cap ? *cap : AIAlertCap{};
    const auto* delay = ctx.world.tryGet<AIAwareDelay>(entity);
    timings_ = AlertnessTimings::fromAwareDelay(
        delay ? *delay : Alertness::defaultAwareDelay(DEFAULT_ESCALATE_SECONDS, DEFAULT_DECAY_SECONDS));

    alertness_ = AlertnessState(Alertness::clampLevel(AIAlertLevel::Lowest, cap_));
    return Alertness::syncEffect(entity, alertness_);
}

float TurretAI::openAmount() const {
    switch (state_) {
        case State::Closed: return 0.0f;
        case State::Opening: return std::min(progress_, 1.0f);
        case State::Open: return 1.0f;
        case State::Closing: return 1.0f - std::min(progress_, 1.0f);
    }
    return 0.0f;
}

Effect TurretAI::update(EntityId entity, ScriptContext& ctx) {
    const bool isVisible = AIUtil::isPlayerVisible(ctx, entity);

    std::vector<Effect> effects;
    if (Alertness::processUpdate(alertness_, isVisible, ctx.deltaTime(), timings_, cap_)) {
        effects.push_back(Alertness::syncEffect(entity, alertness_));
    }

    effects.push_back(advanceState(entity, ctx, isVisible));

    glm::mat4 cap = glm::translate(glm::mat4(1.0f), glm::vec3(-0.75f * openAmount(), 0.0f, 0.0f));
    effects.push_back(Effects::SetJointTransform{entity, 2, cap});

    if (state_ == State::Open) {
        effects.push_back(tryToShoot(entity, ctx));
    }
    effects.push_back(AIDebugUtil::drawDebugAlertness(ctx.world, entity, alertness_, isVisible,
                                                      AlertnessDebugConfig::turret()));
    effects.push_back(AIDebugUtil::drawDebugFov(ctx.world, entity, -heading_, isVisible, FovDebugConfig::turret()));
    return Effect::combine(std::move(effects));
}

Effect TurretAI::advanceState(EntityId entity, const ScriptContext& ctx, bool isVisible) {
    const float step = ctx.deltaTime() / OPEN_TIME;
    switch (state_) {
        case State::Closed:
            if (isVisible) {
                state_ = State::Opening;
                progress_ = 0.0f;
                return AIUtil::playPositionalSound(ctx.world, entity, std::nullopt, {{"event", "activate"}});
            }
            break;
        case State::Opening:
            if (progress_ >= 1.0f) {
                state_ = State::Open;
            } else {
                progress_ += step;
            }
            break;
        case State::Open:
            if (!isVisible) {
                state_ = State::Closing;
                progress_ = 0.0f;
                return AIUtil::playPositionalSound(ctx.world, entity, std::nullopt, {{"event", "deactivate"}});
            }
            break;
        case State::Closing:
            if (progress_ >= 1.0f) {
                state_ = State::Closed;
            } else {
                progress_ += step;
            }
            break;
    }
    return {};
}

Effect TurretAI::tryToShoot(EntityId entity, const ScriptContext& ctx) {
    std::vector<Effect> effects;
    const float now = ctx.totalTime();
    if (nextFire_ < now) {
        nextFire_ = now + FIRE_INTERVAL;
        glm::quat rotation = RotationUtils::fromAngleY(heading_ - initialYaw_);
        effects.push_back(AIUtil::fireRangedWeapon(ctx, entity, rotation));
    }

    if (auto steering = Steering::chasePlayer(ctx, entity)) {
        heading_ = steering->first.desiredHeading;
        glm::quat aim = RotationUtils::fromAngleX(initialYaw_ - heading_ - 90.0f);
        effects.push_back(Effects::SetJointTransform{entity, 1, glm::mat4_cast(aim)});
        effects.push_back(std::move(steering->second));
    }
    return Effect::combine(std::move(effects));
}
