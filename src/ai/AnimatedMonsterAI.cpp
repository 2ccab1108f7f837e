#include "AnimatedMonsterAI.h"
#include "AIDebugUtil.h"
#include "AIUtil.h"
#include "DarkConstants.h"
#include "PhysicsWorld.h"
#include "Random.h"
#include "RotationUtils.h"

#include <SDL3/SDL_log.h>
#include <algorithm>
#include <cmath>

Effect AnimatedMonsterAI::initialize(EntityId entity, ScriptContext& ctx) {
    heading_ = AIUtil::currentYaw(ctx.world, entity);

    const auto* cap = ctx.world.tryGet<AIAlertCap>(entity);
    cap_ = cap ? *cap : AIAlertCap{};
    const auto* delay = ctx.world.tryGet<AIAwareDelay>(entity);
    timings_ = AlertnessTimings::fromAwareDelay(
        delay ? *delay : Alertness::defaultAwareDelay(DEFAULT_ESCALATE_SECONDS, DEFAULT_DECAY_SECONDS));

    alertness_ = AlertnessState(Alertness::clampLevel(AIAlertLevel::Lowest, cap_));
    behavior_ = behaviorForAlertness(ctx.world, entity);

    return Effect::combine({Alertness::syncEffect(entity, alertness_), queueCurrentAnimation(entity)});
}

Effect AnimatedMonsterAI::update(EntityId entity, ScriptContext& ctx) {
    if (isDead_) {
        return {};
    }
    const float deltaTime = ctx.deltaTime();
    const bool isVisible = AIUtil::isPlayerVisible(ctx, entity);

    std::vector<Effect> effects;
    if (!behavior_.is<DeadBehavior>() &&
        Alertness::processUpdate(alertness_, isVisible, deltaTime, timings_, cap_)) {
        effects.push_back(Alertness::syncEffect(entity, alertness_));
        effects.push_back(switchBehavior(entity, behaviorForAlertness(ctx.world, entity)));
    }

    for (const Link& link : ctx.world.linksOf(entity, LinkKind::AIWatchObj)) {
        if (!link.toEntity || playedWatchObjects_.count(*link.toEntity) > 0) {
            continue;
        }
        if (AIUtil::playerWithinRadius(ctx.world, *link.toEntity, link.radius)) {
            playedWatchObjects_.insert(*link.toEntity);
            SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "AnimatedMonsterAI: entity %u watch object %u triggered",
                         entityToInt(entity), entityToInt(*link.toEntity));
            effects.push_back(switchBehavior(entity, ScriptedSequenceBehavior(link.actions)));
            return Effect::combine(std::move(effects));
        }
    }

    SteeringResult steering = behavior_.steer(heading_, ctx, entity);
    if (steering) {
        effects.push_back(std::move(steering->second));
    }
    effects.push_back(applySteering(entity, steering ? steering->first : SteeringOutput::fromCurrent(heading_),
                                    deltaTime));
    effects.push_back(tickleSensor(ctx, entity));
    effects.push_back(AIDebugUtil::drawDebugAlertness(ctx.world, entity, alertness_, isVisible,
                                                      AlertnessDebugConfig::monster()));
    effects.push_back(AIDebugUtil::drawDebugFov(ctx.world, entity, 0.0f, isVisible, FovDebugConfig::monster()));
    return Effect::combine(std::move(effects));
}

Effect AnimatedMonsterAI::handleMessage(EntityId entity, ScriptContext& ctx, const MessagePayloadVariant& message) {
    behavior_.handleMessage(entity, ctx, message);

    if (const auto* damage = std::get_if<MessagePayload::Damage>(&message)) {
        tookDamage_ = true;
        return Effects::AdjustHitPoints{entity, -static_cast<int32_t>(std::lround(damage->amount))};
    }

    if (std::holds_alternative<MessagePayload::TurnOn>(message) ||
        std::holds_alternative<MessagePayload::Signal>(message)) {
        const auto* response = ctx.world.tryGet<AISignalResponse>(entity);
        if (!response || isDead_ || behavior_.is<DeadBehavior>()) {
            return {};
        }
        return switchBehavior(entity, ScriptedSequenceBehavior(response->actions));
    }

    if (std::holds_alternative<MessagePayload::AnimationCompleted>(message)) {
        return onAnimationCompleted(entity, ctx);
    }

    if (const auto* flagged = std::get_if<MessagePayload::AnimationFlagTriggered>(&message)) {
        if (flagged->flags & MotionFlag::Fire) {
            return AIUtil::fireRangedProjectile(ctx, entity);
        }
        if (flagged->flags & MotionFlag::Death) {
            isDead_ = true;
        }
    }
    return {};
}

Effect AnimatedMonsterAI::onAnimationCompleted(EntityId entity, const ScriptContext& ctx) {
    if (isDead_) {
        return {};
    }

    if (behavior_.is<DeadBehavior>()) {
        // Crumple finished without a death flag; hold the final pose
        isDead_ = true;
        return {};
    }

    if (AIUtil::isKilled(ctx.world, entity)) {
        behavior_ = DeadBehavior{};
        Effect speech = AIUtil::playSpeech(ctx, entity, Random::chance() ? "comdieloud" : "comdiesoft");
        Effect crumple = Effects::QueueAnimationBySchema{entity, behavior_.animation(), MotionSelection::random()};
        return Effect::combine({std::move(speech), std::move(crumple)});
    }

    if (tookDamage_) {
        tookDamage_ = false;
        return Effects::QueueAnimationBySchema{entity, {MotionQueryItem::required("receivewound")},
                                               MotionSelection::random()};
    }

    NextBehavior next = behavior_.nextBehavior(ctx, entity);
    if (next.kind == NextBehavior::Kind::Next && next.next) {
        SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "AnimatedMonsterAI: entity %u %s -> %s",
                     entityToInt(entity), behavior_.name(), next.next->name());
        behavior_ = std::move(*next.next);
    }

    std::vector<MotionQueryItem> items = behavior_.animation();
    Effect attackSpeech = isAttackAnimation(items) ? AIUtil::playSpeech(ctx, entity, "comattack") : Effect();
    return Effect::combine({std::move(attackSpeech), queueCurrentAnimation(entity)});
}

Behavior AnimatedMonsterAI::behaviorForAlertness(const ecs::World& world, EntityId entity) const {
    switch (alertness_.currentLevel) {
        case AIAlertLevel::Lowest: return IdleBehavior{};
        case AIAlertLevel::Low: return WanderBehavior{};
        case AIAlertLevel::Moderate: return ChaseBehavior{};
        case AIAlertLevel::High:
            if (AIUtil::hasRangedWeapon(world, entity)) {
                return RangedAttackBehavior{};
            }
            return MeleeAttackBehavior{};
    }
    return IdleBehavior{};
}

Effect AnimatedMonsterAI::switchBehavior(EntityId entity, Behavior behavior) {
    behavior_ = std::move(behavior);
    return queueCurrentAnimation(entity);
}

Effect AnimatedMonsterAI::queueCurrentAnimation(EntityId entity) {
    MotionSelection selection = nextSelection(behavior_.isLocomotion());
    return Effects::QueueAnimationBySchema{entity, behavior_.animation(), selection};
}

MotionSelection AnimatedMonsterAI::nextSelection(bool isLocomotion) {
    uint32_t& counter = isLocomotion ? locomotionSeq_ : animationSeq_;
    return MotionSelection::sequential(counter++);
}

Effect AnimatedMonsterAI::applySteering(EntityId entity, const SteeringOutput& steering, float deltaTime) {
    const float maxTurn = behavior_.turnSpeed() * deltaTime;
    const float delta = RotationUtils::clampToMinimalDeltaAngle(steering.desiredHeading - heading_);
    const float turn = delta < 0.0f ? std::max(-maxTurn, delta) : std::min(maxTurn, delta);
    heading_ += turn;
    return Effects::SetRotation{entity, RotationUtils::fromAngleY(heading_)};
}

Effect AnimatedMonsterAI::tickleSensor(const ScriptContext& ctx, EntityId entity) {
    auto [position, forward] = AIUtil::positionAndForward(ctx.world, entity);
    const glm::vec3 down(0.0f, -2.0f / SCALE_FACTOR, 0.0f);
    const float distance = 8.0f / SCALE_FACTOR;
    glm::vec3 direction = forward + down;
    if (glm::length(direction) > 1e-6f) {
        direction = glm::normalize(direction);
    }

    std::optional<EntityId> hitSensor;
    auto hit = ctx.physics.rayCast(position, direction, distance, CollisionGroup::ALL_COLLIDABLE | CollisionGroup::SENSOR,
                                   entity, true);
    if (hit && hit->isSensor) {
        hitSensor = hit->entity;
    }

    std::vector<Effect> effects;
    if (hitSensor != lastHitSensor_) {
        if (lastHitSensor_) {
            effects.push_back(Effects::Send{Message{*lastHitSensor_, MessagePayload::SensorEndIntersect{entity}}});
        }
        if (hitSensor) {
            effects.push_back(Effects::Send{Message{*hitSensor, MessagePayload::SensorBeginIntersect{entity}}});
        }
    }
    lastHitSensor_ = hitSensor;

    if (ctx.world.debugOptions().debugAI) {
        glm::vec4 color = hitSensor ? glm::vec4(1.0f, 1.0f, 0.0f, 1.0f) : glm::vec4(0.0f, 1.0f, 1.0f, 1.0f);
        effects.push_back(Effects::DrawDebugLines{{{position, position + direction * distance, color}}});
    }
    return Effect::combine(std::move(effects));
}
