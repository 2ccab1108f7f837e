#pragma once

#include <glm/glm.hpp>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "Effect.h"
#include "Links.h"

// One placed object of a mission file. Positions are converted to world units.
struct MissionEntity {
    std::optional<int32_t> objectId;        // referenced by other objects' links
    int32_t templateId = 0;
    std::string templateName;               // used when templateId is 0
    glm::vec3 position{0.0f};
    float yaw = 0.0f;                       // degrees
    nlohmann::json properties = nlohmann::json::object();

    struct LinkRef {
        Link link;
        int32_t toObject = 0;
    };
    std::vector<LinkRef> links;
};

// Parsed missions/<name>.json:
//   { "entities": [ { "id", "template_id" | "template", "position", "rotation", "properties",
//                     "links": [ { "kind", "to", ... } ] } ],
//     "spawn_points": { "default": [x, y, z], "<marker>": [x, y, z] },
//     "aipath": "<file relative to the asset root>" }
struct MissionDescription {
    std::string name;
    std::vector<MissionEntity> entities;
    std::map<std::string, glm::vec3> spawnPoints;   // lowercase names
    std::optional<std::string> aipathFile;

    // World position for a spawn request; unknown markers fall back to the default spawn
    glm::vec3 resolveSpawn(const SpawnLocation& spawn) const;
};

namespace MissionLoader {

    std::optional<MissionDescription> loadFromString(const std::string& name, const std::string& jsonText);

    // <assetRoot>/missions/<name>.json
    std::optional<MissionDescription> load(const std::string& assetRoot, const std::string& name);

}
