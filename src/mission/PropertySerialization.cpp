#include "PropertySerialization.h"
#include "AIProperties.h"
#include "StringUtils.h"

#include <SDL3/SDL_log.h>

using json = nlohmann::json;

namespace {

glm::vec3 vec3From(const json& j, const glm::vec3& fallback) {
    if (!j.is_array() || j.size() < 3) {
        return fallback;
    }
    return glm::vec3(j[0].get<float>(), j[1].get<float>(), j[2].get<float>());
}

json vec3To(const glm::vec3& v) {
    return json::array({v.x, v.y, v.z});
}

RenderType::Kind renderTypeFromName(const std::string& name) {
    std::string key = StringUtils::toLower(name);
    if (key == "notrendered") return RenderType::Kind::NotRendered;
    if (key == "unlit") return RenderType::Kind::Unlit;
    if (key == "editoronly") return RenderType::Kind::EditorOnly;
    return RenderType::Kind::Normal;
}

const char* renderTypeName(RenderType::Kind kind) {
    switch (kind) {
        case RenderType::Kind::Normal: return "Normal";
        case RenderType::Kind::NotRendered: return "NotRendered";
        case RenderType::Kind::Unlit: return "Unlit";
        case RenderType::Kind::EditorOnly: return "EditorOnly";
    }
    return "Normal";
}

std::vector<ScriptedAction> actionsFrom(const json& j) {
    std::vector<ScriptedAction> actions;
    for (const auto& a : j) {
        ScriptedAction action;
        action.type = ScriptedActions::typeFromName(a.value("type", std::string()));
        action.argument = a.value("argument", std::string());
        action.value = a.value("value", 0.0f);
        actions.push_back(std::move(action));
    }
    return actions;
}

const char* actionTypeName(ScriptedAction::Type type) {
    switch (type) {
        case ScriptedAction::Type::PlayMotion: return "PlayMotion";
        case ScriptedAction::Type::Wait: return "Wait";
        case ScriptedAction::Type::Frob: return "Frob";
        case ScriptedAction::Type::Unknown: return "Unknown";
    }
    return "Unknown";
}

void applyOne(ecs::World& world, EntityId entity, const std::string& key, const json& value) {
    if (key == "ModelName") {
        world.set(entity, ModelName{value.get<std::string>()});
    } else if (key == "Scale") {
        world.set(entity, Scale{vec3From(value, glm::vec3(1.0f))});
    } else if (key == "SymName") {
        world.set(entity, SymName{value.get<std::string>()});
    } else if (key == "Creature") {
        world.set(entity, Creature{value.get<uint32_t>()});
    } else if (key == "MotionActorTags") {
        world.set(entity, MotionActorTags{value.get<std::vector<std::string>>()});
    } else if (key == "HitPoints") {
        world.set(entity, HitPoints{value.get<int32_t>()});
    } else if (key == "VoiceIndex") {
        world.set(entity, VoiceIndex{value.get<int32_t>()});
    } else if (key == "SpeechVoice") {
        world.set(entity, SpeechVoice{value.get<std::string>()});
    } else if (key == "ClassTags") {
        ClassTags tags;
        for (const auto& [tag, tagValue] : value.items()) {
            tags.tags.emplace_back(tag, tagValue.get<std::string>());
        }
        world.set(entity, std::move(tags));
    } else if (key == "Scripts") {
        world.set(entity, Scripts{value.get<std::vector<std::string>>()});
    } else if (key == "PhysInitialVelocity") {
        world.set(entity, PhysInitialVelocity{vec3From(value, glm::vec3(0.0f))});
    } else if (key == "PhysDimensions") {
        PhysDimensions dims;
        dims.halfExtents = vec3From(value.value("half_extents", json::array()), dims.halfExtents);
        dims.isSensor = value.value("sensor", false);
        dims.isStatic = value.value("static", false);
        world.set(entity, dims);
    } else if (key == "KeyCard") {
        world.set(entity, KeyCard{value.get<std::string>()});
    } else if (key == "RenderType") {
        world.set(entity, RenderType{renderTypeFromName(value.get<std::string>())});
    } else if (key == "AIAlertCap") {
        AIAlertCap cap;
        cap.maxLevel = alertLevelFromRaw(value.value("max", 3u));
        cap.minLevel = alertLevelFromRaw(value.value("min", 0u));
        cap.minRelax = alertLevelFromRaw(value.value("min_relax", 1u));
        world.set(entity, cap);
    } else if (key == "AIAwareDelay") {
        AIAwareDelay delay;
        delay.toTwo = value.value("to_two", 0u);
        delay.toThree = value.value("to_three", 0u);
        delay.twoReuse = value.value("two_reuse", 0u);
        delay.threeReuse = value.value("three_reuse", 0u);
        delay.ignoreRange = value.value("ignore_range", 0u);
        world.set(entity, delay);
    } else if (key == "AIAlertness") {
        world.set(entity, AIAlertness{alertLevelFromRaw(value.value("level", 0u)),
                                      alertLevelFromRaw(value.value("peak", 0u))});
    } else if (key == "AIMode") {
        world.set(entity, AIMode{aiModeFromRaw(value.get<uint32_t>())});
    } else if (key == "AICamera") {
        AICamera camera;
        camera.scanAngle1 = value.value("scan_angle_1", camera.scanAngle1);
        camera.scanAngle2 = value.value("scan_angle_2", camera.scanAngle2);
        camera.scanSpeed = value.value("scan_speed", camera.scanSpeed);
        world.set(entity, camera);
    } else if (key == "AIDevice") {
        AIDevice device;
        device.jointActivate = value.value("joint_activate", device.jointActivate);
        device.inactivePos = value.value("inactive_pos", device.inactivePos);
        device.activePos = value.value("active_pos", device.activePos);
        device.activateSpeed = value.value("activate_speed", device.activateSpeed);
        device.jointRotate = value.value("joint_rotate", device.jointRotate);
        device.facingEpsilon = value.value("facing_epsilon", device.facingEpsilon);
        device.activateRotate = value.value("activate_rotate", device.activateRotate);
        world.set(entity, device);
    } else if (key == "ParticleGroup") {
        ParticleGroup group;
        group.count = value.value("num", group.count);
        group.size = value.value("size", group.size);
        group.gravity = vec3From(value.value("gravity", json::array()), group.gravity);
        group.launchTime = value.value("launch_time", group.launchTime);
        group.fadeTime = value.value("fade_time", group.fadeTime);
        group.alpha = value.value("alpha", group.alpha);
        world.set(entity, group);
    } else if (key == "ParticleLaunchInfo") {
        ParticleLaunchInfo info;
        info.locMin = vec3From(value.value("loc_min", json::array()), info.locMin);
        info.locMax = vec3From(value.value("loc_max", json::array()), info.locMax);
        info.velMin = vec3From(value.value("vel_min", json::array()), info.velMin);
        info.velMax = vec3From(value.value("vel_max", json::array()), info.velMax);
        info.minTime = value.value("min_time", info.minTime);
        info.maxTime = value.value("max_time", info.maxTime);
        world.set(entity, info);
    } else if (key == "AISignalResponse") {
        world.set(entity, AISignalResponse{actionsFrom(value)});
    } else {
        SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "PropertySerialization: ignoring property '%s'", key.c_str());
    }
}

}  // namespace

namespace PropertySerialization {

void apply(ecs::World& world, EntityId entity, const json& properties) {
    if (!properties.is_object()) {
        return;
    }
    for (const auto& [key, value] : properties.items()) {
        try {
            applyOne(world, entity, key, value);
        } catch (const json::exception& e) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "PropertySerialization: bad value for '%s' on entity %u: %s",
                        key.c_str(), entityToInt(entity), e.what());
        }
    }
}

json snapshot(const ecs::World& world, EntityId entity) {
    json j = json::object();
    if (const auto* p = world.tryGet<ModelName>(entity)) j["ModelName"] = p->name;
    if (const auto* p = world.tryGet<Scale>(entity)) j["Scale"] = vec3To(p->value);
    if (const auto* p = world.tryGet<SymName>(entity)) j["SymName"] = p->name;
    if (const auto* p = world.tryGet<Creature>(entity)) j["Creature"] = p->type;
    if (const auto* p = world.tryGet<MotionActorTags>(entity)) j["MotionActorTags"] = p->tags;
    if (const auto* p = world.tryGet<HitPoints>(entity)) j["HitPoints"] = p->hitPoints;
    if (const auto* p = world.tryGet<VoiceIndex>(entity)) j["VoiceIndex"] = p->index;
    if (const auto* p = world.tryGet<SpeechVoice>(entity)) j["SpeechVoice"] = p->label;
    if (const auto* p = world.tryGet<ClassTags>(entity)) {
        json tags = json::object();
        for (const auto& [tag, value] : p->tags) tags[tag] = value;
        j["ClassTags"] = tags;
    }
    if (const auto* p = world.tryGet<Scripts>(entity)) j["Scripts"] = p->names;
    if (const auto* p = world.tryGet<PhysInitialVelocity>(entity)) j["PhysInitialVelocity"] = vec3To(p->velocity);
    if (const auto* p = world.tryGet<PhysDimensions>(entity)) {
        j["PhysDimensions"] = {{"half_extents", vec3To(p->halfExtents)}, {"sensor", p->isSensor}, {"static", p->isStatic}};
    }
    if (const auto* p = world.tryGet<KeyCard>(entity)) j["KeyCard"] = p->name;
    if (const auto* p = world.tryGet<RenderType>(entity)) j["RenderType"] = renderTypeName(p->kind);
    if (const auto* p = world.tryGet<AIAlertCap>(entity)) {
        j["AIAlertCap"] = {{"max", static_cast<uint32_t>(p->maxLevel)}, {"min", static_cast<uint32_t>(p->minLevel)},
                           {"min_relax", static_cast<uint32_t>(p->minRelax)}};
    }
    if (const auto* p = world.tryGet<AIAwareDelay>(entity)) {
        j["AIAwareDelay"] = {{"to_two", p->toTwo}, {"to_three", p->toThree}, {"two_reuse", p->twoReuse},
                             {"three_reuse", p->threeReuse}, {"ignore_range", p->ignoreRange}};
    }
    if (const auto* p = world.tryGet<AIAlertness>(entity)) {
        j["AIAlertness"] = {{"level", static_cast<uint32_t>(p->level)}, {"peak", static_cast<uint32_t>(p->peak)}};
    }
    if (const auto* p = world.tryGet<AIMode>(entity)) j["AIMode"] = static_cast<uint32_t>(p->mode);
    if (const auto* p = world.tryGet<AICamera>(entity)) {
        j["AICamera"] = {{"scan_angle_1", p->scanAngle1}, {"scan_angle_2", p->scanAngle2}, {"scan_speed", p->scanSpeed}};
    }
    if (const auto* p = world.tryGet<AIDevice>(entity)) {
        j["AIDevice"] = {{"joint_activate", p->jointActivate}, {"inactive_pos", p->inactivePos},
                         {"active_pos", p->activePos}, {"activate_speed", p->activateSpeed},
                         {"joint_rotate", p->jointRotate}, {"facing_epsilon", p->facingEpsilon},
                         {"activate_rotate", p->activateRotate}};
    }
    if (const auto* p = world.tryGet<ParticleGroup>(entity)) {
        j["ParticleGroup"] = {{"num", p->count}, {"size", p->size}, {"gravity", vec3To(p->gravity)},
                              {"launch_time", p->launchTime}, {"fade_time", p->fadeTime}, {"alpha", p->alpha}};
    }
    if (const auto* p = world.tryGet<ParticleLaunchInfo>(entity)) {
        j["ParticleLaunchInfo"] = {{"loc_min", vec3To(p->locMin)}, {"loc_max", vec3To(p->locMax)},
                                   {"vel_min", vec3To(p->velMin)}, {"vel_max", vec3To(p->velMax)},
                                   {"min_time", p->minTime}, {"max_time", p->maxTime}};
    }
    if (const auto* p = world.tryGet<AISignalResponse>(entity)) {
        json actions = json::array();
        for (const auto& action : p->actions) {
            actions.push_back({{"type", actionTypeName(action.type)}, {"argument", action.argument}, {"value", action.value}});
        }
        j["AISignalResponse"] = actions;
    }
    return j;
}

}  // namespace PropertySerialization
