#include "World.h"
#include "StringUtils.h"

namespace ecs {

using StringUtils::equalsIgnoreCase;

std::vector<Link> World::linksOf(EntityId entity, LinkKind kind) const {
    std::vector<Link> result;
    if (const auto* links = tryGet<Links>(entity)) {
        for (const auto& link : links->links) {
            if (link.kind == kind) {
                result.push_back(link);
            }
        }
    }
    return result;
}

std::vector<EntityId> World::switchLinkTargets(EntityId entity) const {
    std::vector<EntityId> targets;
    for (const auto& link : linksOf(entity, LinkKind::SwitchLink)) {
        if (link.toEntity && valid(*link.toEntity)) {
            targets.push_back(*link.toEntity);
        }
    }
    return targets;
}

std::vector<EntityId> World::entitiesByName(const std::string& name) const {
    std::vector<EntityId> result;
    auto view = registry_.view<SymName>();
    for (auto entity : view) {
        if (equalsIgnoreCase(view.get<SymName>(entity).name, name)) {
            result.push_back(entity);
        }
    }
    return result;
}

std::vector<EntityId> World::entitiesWithTemplate(int32_t templateId) const {
    std::vector<EntityId> result;
    auto view = registry_.view<TemplateId>();
    for (auto entity : view) {
        if (view.get<TemplateId>(entity).id == templateId) {
            result.push_back(entity);
        }
    }
    return result;
}

void World::detachFromContainers(EntityId entity) {
    auto view = registry_.view<Links>();
    for (auto owner : view) {
        auto& links = view.get<Links>(owner).links;
        links.erase(std::remove_if(links.begin(), links.end(), [entity](const Link& link) {
            return link.kind == LinkKind::Contains && link.toEntity && *link.toEntity == entity;
        }), links.end());
    }
}

} // namespace ecs
