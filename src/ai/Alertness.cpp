#include "Alertness.h"
#include <algorithm>

AlertnessTimings AlertnessTimings::fromAwareDelay(const AIAwareDelay& delay) {
    const float toTwoSeconds = static_cast<float>(delay.toTwo) / 1000.0f;
    AlertnessTimings timings;
    timings.toLow = toTwoSeconds / 2.0f;
    timings.toModerate = toTwoSeconds / 2.0f;
    timings.toHigh = static_cast<float>(delay.toThree) / 1000.0f;
    timings.fromHigh = static_cast<float>(delay.threeReuse) / 1000.0f;
    timings.fromModerate = static_cast<float>(delay.twoReuse) / 1000.0f;
    timings.fromLow = static_cast<float>(delay.ignoreRange) / 1000.0f;
    return timings;
}

namespace Alertness {

namespace {

std::optional<AlertnessTransition> tryEscalate(AlertnessState& state, const AlertnessTimings& timings,
                                               const AIAlertCap& cap) {
    float threshold = 0.0f;
    AIAlertLevel next = AIAlertLevel::High;
    switch (state.currentLevel) {
        case AIAlertLevel::Lowest: threshold = timings.toLow; next = AIAlertLevel::Low; break;
        case AIAlertLevel::Low: threshold = timings.toModerate; next = AIAlertLevel::Moderate; break;
        case AIAlertLevel::Moderate: threshold = timings.toHigh; next = AIAlertLevel::High; break;
        case AIAlertLevel::High: return std::nullopt;
    }

    if (state.visibleTime >= threshold) {
        AIAlertLevel old = state.currentLevel;
        if (setLevel(state, next, cap)) {
            state.visibleTime = 0.0f;
            return AlertnessTransition{old, state.currentLevel};
        }
    }
    return std::nullopt;
}

std::optional<AlertnessTransition> tryDecay(AlertnessState& state, const AlertnessTimings& timings,
                                            const AIAlertCap& cap) {
    float threshold = 0.0f;
    AIAlertLevel next = AIAlertLevel::Lowest;
    switch (state.currentLevel) {
        case AIAlertLevel::High: threshold = timings.fromHigh; next = AIAlertLevel::Moderate; break;
        case AIAlertLevel::Moderate: threshold = timings.fromModerate; next = AIAlertLevel::Low; break;
        case AIAlertLevel::Low: threshold = timings.fromLow; next = AIAlertLevel::Lowest; break;
        case AIAlertLevel::Lowest: return std::nullopt;
    }

    if (state.hiddenTime >= threshold) {
        AIAlertLevel old = state.currentLevel;
        if (setLevel(state, next, cap)) {
            state.hiddenTime = 0.0f;
            return AlertnessTransition{old, state.currentLevel};
        }
    }
    return std::nullopt;
}

} // anonymous namespace

AIAlertLevel clampLevel(AIAlertLevel level, const AIAlertCap& cap) {
    // A cap with min above max resolves to max
    AIAlertLevel clamped = std::max(level, cap.minLevel);
    return std::min(clamped, cap.maxLevel);
}

bool setLevel(AlertnessState& state, AIAlertLevel level, const AIAlertCap& cap) {
    AIAlertLevel clamped = clampLevel(level, cap);
    if (clamped == state.currentLevel) {
        return false;
    }

    state.currentLevel = clamped;
    state.timeSinceLevelChange = 0.0f;

    if (clamped > state.peakLevel) {
        state.peakLevel = clamped;
    } else if (clamped < state.peakLevel) {
        state.peakLevel = std::max(clamped, cap.minRelax);
    }
    return true;
}

std::optional<AlertnessTransition> processUpdate(AlertnessState& state, bool isVisible, float deltaTime,
                                                 const AlertnessTimings& timings, const AIAlertCap& cap) {
    state.timeSinceLevelChange += deltaTime;

    std::optional<AlertnessTransition> transition;
    if (isVisible) {
        state.visibleTime += deltaTime;
        state.hiddenTime = 0.0f;
        transition = tryEscalate(state, timings, cap);
    } else {
        state.hiddenTime += deltaTime;
        state.visibleTime = 0.0f;
        transition = tryDecay(state, timings, cap);
    }

    // The peak never rests below the relax floor
    state.peakLevel = std::max(state.peakLevel, cap.minRelax);
    return transition;
}

Effect syncEffect(EntityId entity, const AlertnessState& state) {
    return Effects::SetAIProperty{entity, Effects::AlertnessUpdate{state.currentLevel, state.peakLevel}};
}

AIAwareDelay defaultAwareDelay(float escalateSeconds, float decaySeconds) {
    AIAwareDelay delay;
    delay.toTwo = static_cast<uint32_t>(escalateSeconds * 1000.0f);
    delay.toThree = static_cast<uint32_t>(escalateSeconds * 1000.0f);
    delay.twoReuse = static_cast<uint32_t>(decaySeconds * 1000.0f);
    delay.threeReuse = static_cast<uint32_t>(decaySeconds * 1000.0f);
    delay.ignoreRange = static_cast<uint32_t>(decaySeconds * 1000.0f);
    return delay;
}

}  // namespace Alertness
