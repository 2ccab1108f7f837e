#include "TemplateLibrary.h"
#include "StringUtils.h"

#include <SDL3/SDL_log.h>
#include <unordered_set>

using json = nlohmann::json;

std::optional<Link> linkFromJson(const json& j) {
    std::string kindName = j.value("kind", std::string());
    auto kind = LinkNames::fromName(kindName);
    if (!kind) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "TemplateLibrary: unknown link kind '%s'", kindName.c_str());
        return std::nullopt;
    }

    Link link;
    link.kind = *kind;
    link.toTemplateId = j.value("to", 0);
    link.joint = j.value("joint", 0);
    link.radius = j.value("radius", 0.0f);
    for (const auto& a : j.value("actions", json::array())) {
        ScriptedAction action;
        action.type = ScriptedActions::typeFromName(a.value("type", std::string()));
        action.argument = a.value("argument", std::string());
        action.value = a.value("value", 0.0f);
        link.actions.push_back(std::move(action));
    }
    return link;
}

std::optional<TemplateLibrary> TemplateLibrary::loadFromString(const std::string& jsonText) {
    TemplateLibrary library;
    try {
        json j = json::parse(jsonText);
        for (const auto& t : j.value("templates", json::array())) {
            EntityTemplate entityTemplate;
            entityTemplate.id = t.at("id").get<int32_t>();
            entityTemplate.name = t.value("name", std::string());
            if (t.contains("parent") && !t["parent"].is_null()) {
                entityTemplate.parent = t["parent"].get<int32_t>();
            }
            entityTemplate.properties = t.value("properties", json::object());
            for (const auto& l : t.value("links", json::array())) {
                if (auto link = linkFromJson(l)) {
                    entityTemplate.links.push_back(std::move(*link));
                }
            }
            library.add(std::move(entityTemplate));
        }
    } catch (const json::exception& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "TemplateLibrary: JSON parse error: %s", e.what());
        return std::nullopt;
    }

    SDL_Log("TemplateLibrary: loaded %zu templates", library.templates_.size());
    return library;
}

void TemplateLibrary::add(EntityTemplate entityTemplate) {
    if (!entityTemplate.name.empty()) {
        nameToId_[StringUtils::toLower(entityTemplate.name)] = entityTemplate.id;
    }
    int32_t id = entityTemplate.id;
    templates_[id] = std::move(entityTemplate);
}

const EntityTemplate* TemplateLibrary::find(int32_t id) const {
    auto it = templates_.find(id);
    return it == templates_.end() ? nullptr : &it->second;
}

const EntityTemplate* TemplateLibrary::findByName(const std::string& name) const {
    auto it = nameToId_.find(StringUtils::toLower(name));
    return it == nameToId_.end() ? nullptr : find(it->second);
}

json TemplateLibrary::resolvedProperties(int32_t id) const {
    // Walk to the root first, then apply children over it
    std::vector<const EntityTemplate*> chain;
    std::unordered_set<int32_t> seen;
    const EntityTemplate* current = find(id);
    while (current) {
        if (!seen.insert(current->id).second) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "TemplateLibrary: parent cycle at template %d", current->id);
            break;
        }
        chain.push_back(current);
        current = current->parent ? find(*current->parent) : nullptr;
    }

    json merged = json::object();
    for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
        for (const auto& [key, value] : (*it)->properties.items()) {
            merged[key] = value;
        }
    }
    return merged;
}
