#include "CreatureDefinitions.h"

#include <nlohmann/json.hpp>
#include <SDL3/SDL_log.h>

using json = nlohmann::json;

std::optional<JointId> CreatureDefinition::mappedJoint(int32_t abstractJoint) const {
    if (abstractJoint < 0 || static_cast<size_t>(abstractJoint) >= jointMap.size()) {
        return std::nullopt;
    }
    int32_t joint = jointMap[abstractJoint];
    if (joint < 0) {
        return std::nullopt;
    }
    return static_cast<JointId>(joint);
}

std::optional<CreatureDefinitions> CreatureDefinitions::loadFromString(const std::string& jsonText) {
    CreatureDefinitions defs;
    try {
        json j = json::parse(jsonText);
        for (const auto& c : j.value("creatures", json::array())) {
            CreatureDefinition def;
            def.type = c.at("type").get<uint32_t>();
            def.name = c.value("name", std::string());
            def.actorType = c.value("actor_type", 0u);
            def.jointMap = c.value("joint_map", std::vector<int32_t>{});
            for (const auto& hb : c.value("hit_boxes", json::array())) {
                HitBoxSpec spec;
                spec.joint = hb.at("joint").get<JointId>();
                if (hb.contains("half_extents")) {
                    const auto& e = hb["half_extents"];
                    spec.halfExtents = glm::vec3(e[0].get<float>(), e[1].get<float>(), e[2].get<float>());
                }
                def.hitBoxes.push_back(spec);
            }
            defs.add(std::move(def));
        }
    } catch (const json::exception& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "CreatureDefinitions: JSON parse error: %s", e.what());
        return std::nullopt;
    }
    return defs;
}

void CreatureDefinitions::add(CreatureDefinition definition) {
    for (auto& existing : definitions_) {
        if (existing.type == definition.type) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "CreatureDefinitions: duplicate creature type %u, replacing",
                        definition.type);
            existing = std::move(definition);
            return;
        }
    }
    definitions_.push_back(std::move(definition));
}

const CreatureDefinition* CreatureDefinitions::find(uint32_t type) const {
    for (const auto& def : definitions_) {
        if (def.type == type) {
            return &def;
        }
    }
    return nullptr;
}
