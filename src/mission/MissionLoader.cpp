#include "MissionLoader.h"
#include "DarkConstants.h"
#include "StringUtils.h"
#include "TemplateLibrary.h"

#include <SDL3/SDL_log.h>
#include <filesystem>
#include <fstream>

using json = nlohmann::json;

namespace {

glm::vec3 worldPosition(const json& j) {
    if (!j.is_array() || j.size() < 3) {
        return glm::vec3(0.0f);
    }
    return glm::vec3(j[0].get<float>(), j[1].get<float>(), j[2].get<float>()) / SCALE_FACTOR;
}

MissionEntity parseEntity(const json& j) {
    MissionEntity entity;
    if (j.contains("id")) {
        entity.objectId = j.at("id").get<int32_t>();
    }
    entity.templateId = j.value("template_id", 0);
    entity.templateName = j.value("template", std::string());
    entity.position = worldPosition(j.value("position", json::array()));
    entity.yaw = j.value("rotation", 0.0f);
    entity.properties = j.value("properties", json::object());

    for (const auto& linkJson : j.value("links", json::array())) {
        auto link = linkFromJson(linkJson);
        if (!link) {
            continue;
        }
        // Bound to a placed object when `to` names one, else left as a template reference
        int32_t toObject = link->toTemplateId;
        entity.links.push_back({std::move(*link), toObject});
    }
    return entity;
}

}  // namespace

glm::vec3 MissionDescription::resolveSpawn(const SpawnLocation& spawn) const {
    switch (spawn.kind) {
        case SpawnLocation::Kind::Position:
            return spawn.position;
        case SpawnLocation::Kind::Marker: {
            auto it = spawnPoints.find(StringUtils::toLower(spawn.marker));
            if (it != spawnPoints.end()) {
                return it->second;
            }
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "MissionLoader: no spawn point '%s' in %s, using default",
                        spawn.marker.c_str(), name.c_str());
            break;
        }
        case SpawnLocation::Kind::MapDefault:
            break;
    }
    auto it = spawnPoints.find("default");
    return it != spawnPoints.end() ? it->second : glm::vec3(0.0f);
}

namespace MissionLoader {

std::optional<MissionDescription> loadFromString(const std::string& name, const std::string& jsonText) {
    try {
        json root = json::parse(jsonText);
        MissionDescription mission;
        mission.name = name;
        for (const auto& entityJson : root.value("entities", json::array())) {
            mission.entities.push_back(parseEntity(entityJson));
        }
        for (const auto& [marker, position] : root.value("spawn_points", json::object()).items()) {
            mission.spawnPoints[StringUtils::toLower(marker)] = worldPosition(position);
        }
        if (root.contains("aipath") && root["aipath"].is_string()) {
            mission.aipathFile = root["aipath"].get<std::string>();
        }
        return mission;
    } catch (const json::exception& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "MissionLoader: Failed to parse mission '%s': %s",
                     name.c_str(), e.what());
        return std::nullopt;
    }
}

std::optional<MissionDescription> load(const std::string& assetRoot, const std::string& name) {
    const auto path = std::filesystem::path(assetRoot) / "missions" / (StringUtils::toLower(name) + ".json");
    std::ifstream file(path);
    if (!file.is_open()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "MissionLoader: Failed to open '%s'", path.string().c_str());
        return std::nullopt;
    }
    std::string contents((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    auto mission = loadFromString(name, contents);
    if (mission) {
        SDL_Log("MissionLoader: Loaded mission '%s' with %zu entities and %zu spawn points",
                name.c_str(), mission->entities.size(), mission->spawnPoints.size());
    }
    return mission;
}

}  // namespace MissionLoader
