#pragma once

#include <cstdint>
#include <vector>

#include "Links.h"

enum class AIAlertLevel : uint8_t {
    Lowest = 0,
    Low = 1,
    Moderate = 2,
    High = 3
};

// Unknown raw values are treated as the highest level
inline AIAlertLevel alertLevelFromRaw(uint32_t raw) {
    return raw <= 3 ? static_cast<AIAlertLevel>(raw) : AIAlertLevel::High;
}

inline const char* alertLevelName(AIAlertLevel level) {
    switch (level) {
        case AIAlertLevel::Lowest: return "Lowest";
        case AIAlertLevel::Low: return "Low";
        case AIAlertLevel::Moderate: return "Moderate";
        case AIAlertLevel::High: return "High";
    }
    return "High";
}

struct AIAlertCap {
    AIAlertLevel maxLevel = AIAlertLevel::High;
    AIAlertLevel minLevel = AIAlertLevel::Lowest;
    AIAlertLevel minRelax = AIAlertLevel::Low;
};

// Writable mirror of the AI's alertness, kept in sync by the AI scripts
struct AIAlertness {
    AIAlertLevel level = AIAlertLevel::Lowest;
    AIAlertLevel peak = AIAlertLevel::Lowest;
};

// Milliseconds
struct AIAwareDelay {
    uint32_t toTwo = 0;
    uint32_t toThree = 0;
    uint32_t twoReuse = 0;
    uint32_t threeReuse = 0;
    uint32_t ignoreRange = 0;
};

enum class AIModeValue : uint8_t {
    Asleep = 0,
    SuperEfficient = 1,
    Efficient = 2,
    Normal = 3,
    Combat = 4,
    Dead = 5
};

// Unknown raw values fall back to Normal
inline AIModeValue aiModeFromRaw(uint32_t raw) {
    return raw <= 5 ? static_cast<AIModeValue>(raw) : AIModeValue::Normal;
}

struct AIMode {
    AIModeValue mode = AIModeValue::Normal;
};

// Security camera sweep, angles in degrees
struct AICamera {
    float scanAngle1 = -45.0f;
    float scanAngle2 = 45.0f;
    float scanSpeed = 0.05f;
};

struct AIDevice {
    int32_t jointActivate = 0;
    float inactivePos = 0.0f;
    float activePos = 2.0f;
    float activateSpeed = 0.1f;
    int32_t jointRotate = 1;
    float facingEpsilon = 0.1f;
    bool activateRotate = false;
};

// Scripted sequence played when the AI is switched on or signalled
struct AISignalResponse {
    std::vector<ScriptedAction> actions;
};
