#pragma once

#include <optional>
#include <unordered_set>

#include "Alertness.h"
#include "Behavior.h"
#include "Script.h"

// Creature AI: alertness picks the behavior, the behavior picks animations and
// heading, and animation completion drives the transitions.
class AnimatedMonsterAI final : public Script {
public:
    static constexpr float DEFAULT_ESCALATE_SECONDS = 1.5f;
    static constexpr float DEFAULT_DECAY_SECONDS = 3.0f;

    Effect initialize(EntityId entity, ScriptContext& ctx) override;
    Effect update(EntityId entity, ScriptContext& ctx) override;
    Effect handleMessage(EntityId entity, ScriptContext& ctx, const MessagePayloadVariant& message) override;

    const Behavior& behavior() const { return behavior_; }
    const AlertnessState& alertness() const { return alertness_; }
    float heading() const { return heading_; }

private:
    Behavior behaviorForAlertness(const ecs::World& world, EntityId entity) const;

    // Replace the behavior and queue its animation in front of whatever plays
    Effect switchBehavior(EntityId entity, Behavior behavior);
    Effect queueCurrentAnimation(EntityId entity);
    MotionSelection nextSelection(bool isLocomotion);

    Effect applySteering(EntityId entity, const SteeringOutput& steering, float deltaTime);
    Effect tickleSensor(const ScriptContext& ctx, EntityId entity);
    Effect onAnimationCompleted(EntityId entity, const ScriptContext& ctx);

    Behavior behavior_;
    float heading_ = 0.0f;
    bool isDead_ = false;
    bool tookDamage_ = false;
    uint32_t animationSeq_ = 0;
    uint32_t locomotionSeq_ = 0;
    std::optional<EntityId> lastHitSensor_;
    std::unordered_set<EntityId> playedWatchObjects_;

    AlertnessState alertness_;
    AlertnessTimings timings_;
    AIAlertCap cap_;
};
