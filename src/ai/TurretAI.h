#pragma once

#include "Alertness.h"
#include "Script.h"

// Pop-up turret: opens its cap while the player is in sight, tracks with joint 1
// and fires its ranged weapon once per second while fully open.
class TurretAI final : public Script {
public:
    static constexpr float OPEN_TIME = 2.5f;
    static constexpr float FIRE_INTERVAL = 1.0f;
    static constexpr float DEFAULT_ESCALATE_SECONDS = 2.0f;
    static constexpr float DEFAULT_DECAY_SECONDS = 4.0f;

    enum class State { Closed, Opening, Open, Closing };

    Effect initialize(EntityId entity, ScriptContext& ctx) override;
    Effect update(EntityId entity, ScriptContext& ctx) override;

    State state() const { return state_; }
    float openAmount() const;
    const AlertnessState& alertness() const { return alertness_; }

private:
    Effect advanceState(EntityId entity, const ScriptContext& ctx, bool isVisible);
    Effect tryToShoot(EntityId entity, const ScriptContext& ctx);

    State state_ = State::Closed;
    float progress_ = 0.0f;
    float nextFire_ = 0.0f;
    float initialYaw_ = 0.0f;
    float heading_ = 0.0f;

    AlertnessState alertness_;
    AlertnessTimings timings_;
    AIAlertCap cap_;
};
