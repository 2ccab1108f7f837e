#include "CameraAI.h"
#include "AIDebugUtil.h"
#include "AIUtil.h"
#include "RotationUtils.h"
#include "StringUtils.h"

#include <SDL3/SDL_log.h>
#include <algorithm>
#include <cmath>

CameraModels CameraModels::derive(const std::string& baseModel) {
    std::string stem = baseModel;
    std::string extension;
    if (auto dot = baseModel.rfind('.'); dot != std::string::npos) {
        stem = baseModel.substr(0, dot);
        extension = baseModel.substr(dot);
    }

    std::string yellow;
    std::string red;
    if (StringUtils::endsWith(StringUtils::toLower(stem), "grn")) {
        std::string prefix = stem.substr(0, stem.size() - 3);
        yellow = prefix + "yel";
        red = prefix + "red";
    } else if (StringUtils::endsWith(StringUtils::toLower(stem), "green")) {
        std::string prefix = stem.substr(0, stem.size() - 5);
        yellow = prefix + "yellow";
        red = prefix + "red";
    } else {
        yellow = stem + "_yel";
        red = stem + "_red";
    }
    return {baseModel, yellow + extension, red + extension};
}

const std::string& CameraModels::forLevel(AIAlertLevel level) const {
    switch (level) {
        case AIAlertLevel::High: return red;
        case AIAlertLevel::Moderate:
        case AIAlertLevel::Low: return yellow;
        case AIAlertLevel::Lowest: return green;
    }
    return green;
}

Effect CameraAI::initialize(EntityId entity, ScriptContext& ctx) {
    const ecs::World& world = ctx.world;
    if (const auto* camera = world.tryGet<AICamera>(entity)) camera_ = *camera;
    if (const auto* cap = world.tryGet<AIAlertCap>(entity)) cap_ = *cap;

    const auto* delay = world.tryGet<AIAwareDelay>(entity);
    timings_ = AlertnessTimings::fromAwareDelay(
        delay ? *delay : Alertness::defaultAwareDelay(DEFAULT_ESCALATE_SECONDS, DEFAULT_DECAY_SECONDS));

    const auto* model = world.tryGet<ModelName>(entity);
    models_ = CameraModels::derive(model ? model->name : DEFAULT_MODEL);

    // Cameras may start pre-alerted by the level designer
    alertness_ = AlertnessState(AIAlertLevel::Lowest);
    if (const auto* initial = world.tryGet<AIAlertness>(entity)) {
        alertness_.currentLevel = initial->level;
        alertness_.peakLevel = initial->peak;
    }
    alertness_.currentLevel = Alertness::clampLevel(alertness_.currentLevel, cap_);
    alertness_.peakLevel = std::max({Alertness::clampLevel(alertness_.peakLevel, cap_), alertness_.currentLevel,
                                     cap_.minRelax});
    resetForLevel(alertness_.currentLevel);

    std::vector<Effect> effects;
    effects.push_back(Alertness::syncEffect(entity, alertness_));
    syncModel(entity, effects, true);
    return Effect::combine(std::move(effects));
}

Effect CameraAI::update(EntityId entity, ScriptContext& ctx) {
    const float deltaTime = ctx.deltaTime();
    std::vector<Effect> effects;

    float target = std::sin(ctx.totalTime()) * 90.0f;
    const bool isVisible = AIUtil::isPlayerVisible(ctx, entity);
    if (isVisible) {
        if (const auto* pose = ctx.world.tryGet<Position>(entity)) {
            float targetYaw = RotationUtils::yawBetween(pose->position, ctx.world.player().position);
            target = RotationUtils::clampToMinimalDeltaAngle(AIUtil::currentYaw(ctx.world, entity) - targetYaw - 90.0f);
        }
    }

    AIAlertLevel previous = alertness_.currentLevel;
    if (Alertness::processUpdate(alertness_, isVisible, deltaTime, timings_, cap_)) {
        effects.push_back(Alertness::syncEffect(entity, alertness_));
        syncModel(entity, effects, false);
        onLevelChanged(entity, ctx, previous, isVisible, effects);
    }
    timeSinceLastSpeech_ += deltaTime;

    const float maxDelta = std::max(camera_.scanSpeed * 1000.0f, 1.0f) * deltaTime;
    if (maxDelta > 0.0f) {
        viewAngle_ = RotationUtils::moveTowardsAngle(viewAngle_, target, maxDelta);
    }
    effects.push_back(Effects::SetJointTransform{entity, 1, glm::mat4_cast(RotationUtils::fromAngleX(viewAngle_))});

    maybePlaySustain(entity, ctx, effects);

    FovDebugConfig fov;
    fov.fovHalfAngle = (camera_.scanAngle2 - camera_.scanAngle1) * 0.5f;
    effects.push_back(AIDebugUtil::drawDebugFov(ctx.world, entity, viewAngle_ + 90.0f, isVisible, fov));
    effects.push_back(AIDebugUtil::drawDebugAlertness(ctx.world, entity, alertness_, isVisible,
                                                      AlertnessDebugConfig::camera()));
    return Effect::combine(std::move(effects));
}

void CameraAI::onLevelChanged(EntityId entity, const ScriptContext& ctx, AIAlertLevel previous, bool wasVisible,
                              std::vector<Effect>& effects) {
    const AIAlertLevel level = alertness_.currentLevel;
    resetForLevel(level);

    if (level > previous) {
        switch (level) {
            case AIAlertLevel::Low: speak(entity, ctx, "tolevelone", effects); break;
            case AIAlertLevel::Moderate: speak(entity, ctx, "toleveltwo", effects); break;
            case AIAlertLevel::High: speak(entity, ctx, "tolevelthree", effects); break;
            case AIAlertLevel::Lowest: break;
        }
        return;
    }

    if (previous == AIAlertLevel::High && level == AIAlertLevel::Moderate && !wasVisible) {
        speak(entity, ctx, "lostcontact", effects);
    }
    if (level == AIAlertLevel::Lowest) {
        speak(entity, ctx, "backtozero", effects);
    }
}

void CameraAI::maybePlaySustain(EntityId entity, const ScriptContext& ctx, std::vector<Effect>& effects) {
    const char* speechConcept = nullptr;
    if (alertness_.currentLevel == AIAlertLevel::Moderate) speechConcept = "atleveltwo";
    if (alertness_.currentLevel == AIAlertLevel::High) speechConcept = "atlevelthree";
    if (!speechConcept || playedAtLevelLine_) {
        return;
    }
    if (alertness_.timeSinceLevelChange >= SPEECH_LOOP_DELAY && timeSinceLastSpeech_ >= SPEECH_MIN_INTERVAL) {
        if (speak(entity, ctx, speechConcept, effects)) {
            playedAtLevelLine_ = true;
        }
    }
}

bool CameraAI::speak(EntityId entity, const ScriptContext& ctx, const char* speechConcept, std::vector<Effect>& effects) {
    Effect speech = AIUtil::playSpeech(ctx, entity, speechConcept);
    if (speech.isNone()) {
        return false;
    }
    effects.push_back(std::move(speech));
    timeSinceLastSpeech_ = 0.0f;
    return true;
}

void CameraAI::syncModel(EntityId entity, std::vector<Effect>& effects, bool force) {
    const std::string& target = models_.forLevel(alertness_.currentLevel);
    if (force || currentModel_ != target) {
        effects.push_back(Effects::ChangeModel{entity, target});
        currentModel_ = target;
    }
}

void CameraAI::resetForLevel(AIAlertLevel level) {
    playedAtLevelLine_ = !(level == AIAlertLevel::Moderate || level == AIAlertLevel::High);
}
