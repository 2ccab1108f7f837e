#include "ScriptFactory.h"
#include "AnimatedMonsterAI.h"
#include "CameraAI.h"
#include "StringUtils.h"
#include "TrapScripts.h"
#include "TurretAI.h"

std::unique_ptr<Script> ScriptFactory::create(const std::string& name) {
    const std::string key = StringUtils::toLower(name);
    if (key == "animatedmonsterai" || key == "monsterai") return std::make_unique<AnimatedMonsterAI>();
    if (key == "cameraai" || key == "securitycamera") return std::make_unique<CameraAI>();
    if (key == "turretai" || key == "turret") return std::make_unique<TurretAI>();
    if (key == "traprouter") return std::make_unique<TrapRouter>();
    if (key == "trapinverter") return std::make_unique<TrapInverter>();
    if (key == "triggercollide") return std::make_unique<TriggerCollide>();
    if (key == "createsound") return std::make_unique<CreateSound>();
    return nullptr;
}
