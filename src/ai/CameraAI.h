#pragma once

#include <optional>
#include <string>

#include "Alertness.h"
#include "Script.h"

// Green / yellow / red model names of a security camera
struct CameraModels {
    std::string green;
    std::string yellow;
    std::string red;

    // "camgrn" -> camyel/camred, "xgreen" -> xyellow/xred, otherwise "_yel"/"_red" suffixes.
    // The extension, if any, is kept.
    static CameraModels derive(const std::string& baseModel);

    const std::string& forLevel(AIAlertLevel level) const;
};

// Sweeping security camera. Alertness escalates while the player is in view;
// level changes swap the model and play the camera's announcements.
class CameraAI final : public Script {
public:
    static constexpr float DEFAULT_ESCALATE_SECONDS = 3.0f;
    static constexpr float DEFAULT_DECAY_SECONDS = 5.0f;
    static constexpr float SPEECH_LOOP_DELAY = 1.5f;
    static constexpr float SPEECH_MIN_INTERVAL = 1.0f;
    static constexpr const char* DEFAULT_MODEL = "camgrn";

    Effect initialize(EntityId entity, ScriptContext& ctx) override;
    Effect update(EntityId entity, ScriptContext& ctx) override;

    const AlertnessState& alertness() const { return alertness_; }
    float viewAngle() const { return viewAngle_; }

private:
    void onLevelChanged(EntityId entity, const ScriptContext& ctx, AIAlertLevel previous, bool wasVisible,
                        std::vector<Effect>& effects);
    void maybePlaySustain(EntityId entity, const ScriptContext& ctx, std::vector<Effect>& effects);
    bool speak(EntityId entity, const ScriptContext& ctx, const char* speechConcept, std::vector<Effect>& effects);
    void syncModel(EntityId entity, std::vector<Effect>& effects, bool force);
    void resetForLevel(AIAlertLevel level);

    AICamera camera_;
    AIAlertCap cap_;
    AlertnessTimings timings_;
    CameraModels models_;
    AlertnessState alertness_;
    std::optional<std::string> currentModel_;
    float viewAngle_ = 0.0f;
    float timeSinceLastSpeech_ = SPEECH_MIN_INTERVAL;
    bool playedAtLevelLine_ = true;
};
