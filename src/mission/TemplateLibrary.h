#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "Links.h"

// An archetype from gamesys.json. Properties are inherited along the parent
// chain (child values win); links are not.
struct EntityTemplate {
    int32_t id = 0;
    std::string name;
    std::optional<int32_t> parent;
    nlohmann::json properties = nlohmann::json::object();
    std::vector<Link> links;        // toTemplateId set, toEntity unset
};

class TemplateLibrary {
public:
    // Reads the "templates" array of gamesys.json:
    //   { "id": -1415, "name": "Laser Turret", "parent": -1400,
    //     "properties": { "ModelName": "turlas", "HitPoints": 40 },
    //     "links": [ { "kind": "AIRangedWeapon", "to": -1420 } ] }
    static std::optional<TemplateLibrary> loadFromString(const std::string& jsonText);

    void add(EntityTemplate entityTemplate);

    const EntityTemplate* find(int32_t id) const;
    const EntityTemplate* findByName(const std::string& name) const;

    nlohmann::json resolvedProperties(int32_t id) const;

    size_t size() const { return templates_.size(); }

private:
    std::unordered_map<int32_t, EntityTemplate> templates_;
    std::unordered_map<std::string, int32_t> nameToId_;     // lowercase
};

// Parses one link object; returns nullopt for unknown kinds
std::optional<Link> linkFromJson(const nlohmann::json& j);
