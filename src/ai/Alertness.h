#pragma once

#include <optional>
#include <utility>

#include "AIProperties.h"
#include "Effect.h"

// Alertness of one AI. Times are in seconds.
struct AlertnessState {
    AIAlertLevel currentLevel = AIAlertLevel::Lowest;
    AIAlertLevel peakLevel = AIAlertLevel::Lowest;
    float visibleTime = 0.0f;
    float hiddenTime = 0.0f;
    float timeSinceLevelChange = 0.0f;

    AlertnessState() = default;
    explicit AlertnessState(AIAlertLevel initial) : currentLevel(initial), peakLevel(initial) {}
};

// Seconds of continuous visibility to escalate / invisibility to decay, per level
struct AlertnessTimings {
    static constexpr float DEFAULT_ESCALATE_SECONDS = 3.0f;
    static constexpr float DEFAULT_DECAY_SECONDS = 5.0f;

    float toLow = DEFAULT_ESCALATE_SECONDS / 2.0f;
    float toModerate = DEFAULT_ESCALATE_SECONDS / 2.0f;
    float toHigh = DEFAULT_ESCALATE_SECONDS;
    float fromHigh = DEFAULT_DECAY_SECONDS;
    float fromModerate = DEFAULT_DECAY_SECONDS;
    float fromLow = DEFAULT_DECAY_SECONDS;

    // The "to level two" delay is split evenly across Lowest->Low and Low->Moderate
    static AlertnessTimings fromAwareDelay(const AIAwareDelay& delay);
};

using AlertnessTransition = std::pair<AIAlertLevel, AIAlertLevel>;

namespace Alertness {

    AIAlertLevel clampLevel(AIAlertLevel level, const AIAlertCap& cap);

    // Advance the timers by `deltaTime` and escalate or decay one level when the
    // relevant threshold is reached. Returns (old, new) when the level changed.
    // Depends only on its arguments, so replaying on a copy gives the same result.
    std::optional<AlertnessTransition> processUpdate(AlertnessState& state, bool isVisible, float deltaTime,
                                                     const AlertnessTimings& timings, const AIAlertCap& cap);

    // Clamp into the cap and move the peak: raised when escalating, lowered no further
    // than minRelax when decaying. Returns false if the clamped level equals the current one.
    bool setLevel(AlertnessState& state, AIAlertLevel level, const AIAlertCap& cap);

    // SetAIProperty mirroring (level, peak) onto the entity
    Effect syncEffect(EntityId entity, const AlertnessState& state);

    // Delay used when an entity carries no AIAwareDelay
    AIAwareDelay defaultAwareDelay(float escalateSeconds, float decaySeconds);

}  // namespace Alertness
