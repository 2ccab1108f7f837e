#include "EntityCreator.h"
#include "DarkConstants.h"
#include "FastProjectile.h"
#include "PhysicsWorld.h"
#include "PropertySerialization.h"
#include "ScriptWorld.h"

#include <SDL3/SDL_log.h>
#include <glm/gtc/matrix_transform.hpp>

std::optional<EntityId> EntityCreator::create(int32_t templateId,
                                              const glm::vec3& position,
                                              const glm::quat& orientation,
                                              const glm::mat4& rootTransform,
                                              const nlohmann::json& overrides) {
    const EntityTemplate* entityTemplate = global_.templates ? global_.templates->find(templateId) : nullptr;
    if (!entityTemplate) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "EntityCreator: unknown template %d", templateId);
        return std::nullopt;
    }

    EntityId entity = world_.createEntity();
    world_.set(entity, TemplateId{templateId});
    PropertySerialization::apply(world_, entity, global_.templates->resolvedProperties(templateId));
    PropertySerialization::apply(world_, entity, overrides);

    const glm::mat4 transform = rootTransform * glm::translate(glm::mat4(1.0f), position) * glm::mat4_cast(orientation);
    const glm::vec3 worldPosition(transform[3]);
    const glm::quat worldRotation = glm::normalize(glm::quat_cast(glm::mat3(transform)));
    world_.set(entity, Position{worldPosition, worldRotation, 0});

    glm::vec3 scale(1.0f);
    if (const auto* s = world_.tryGet<Scale>(entity)) {
        scale = glm::abs(s->value);
    }
    world_.set(entity, RuntimeTransform{glm::translate(glm::mat4(1.0f), worldPosition) *
                                        glm::mat4_cast(worldRotation) *
                                        glm::scale(glm::mat4(1.0f), scale)});

    resolveLinks(entity, templateId);

    if (const auto* scripts = world_.tryGet<Scripts>(entity)) {
        scripts_.addScripts(entity, scripts->names);
    }

    glm::vec3 bodyVelocity(0.0f);
    if (const auto* initial = world_.tryGet<PhysInitialVelocity>(entity)) {
        const glm::vec3 launch = launchVelocity(initial->velocity, rootTransform);
        if (isFastProjectile(initial->velocity)) {
            scripts_.addScript(entity, std::make_unique<FastProjectile>(launch));
        } else {
            bodyVelocity = launch / SCALE_FACTOR * INITIAL_VELOCITY_BOOST;
        }
    }

    registerPhysics(entity, bodyVelocity);

    SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "EntityCreator: created %u from template %d (%s)",
                 entityToInt(entity), templateId, entityTemplate->name.c_str());
    return entity;
}

std::optional<EntityId> EntityCreator::createByName(const std::string& templateName,
                                                    const glm::vec3& position,
                                                    const glm::quat& orientation) {
    const EntityTemplate* entityTemplate = global_.templates ? global_.templates->findByName(templateName) : nullptr;
    if (!entityTemplate) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "EntityCreator: no template named '%s'", templateName.c_str());
        return std::nullopt;
    }
    return create(entityTemplate->id, position, orientation);
}

void EntityCreator::resolveLinks(EntityId entity, int32_t templateId) {
    const EntityTemplate* entityTemplate = global_.templates->find(templateId);
    if (!entityTemplate || entityTemplate->links.empty()) {
        return;
    }

    Links links;
    if (const auto* existing = world_.tryGet<Links>(entity)) {
        links = *existing;
    }
    for (Link link : entityTemplate->links) {
        // Links to archetypes stay template-only; links to concrete objects bind to a live entity
        auto targets = world_.entitiesWithTemplate(link.toTemplateId);
        if (link.toTemplateId > 0 && !targets.empty()) {
            link.toEntity = targets.front();
        }
        links.links.push_back(std::move(link));
    }
    world_.set(entity, std::move(links));
}

glm::vec3 EntityCreator::launchVelocity(const glm::vec3& authored, const glm::mat4& rootTransform) {
    return glm::vec3(rootTransform * glm::vec4(0.0f, 0.0f, glm::length(authored), 0.0f));
}

bool EntityCreator::registerPhysics(EntityId entity, const glm::vec3& initialVelocity) {
    const auto* dims = world_.tryGet<PhysDimensions>(entity);
    const auto* pose = world_.tryGet<Position>(entity);
    if (!dims || !pose) {
        return false;
    }
    if (const auto* initial = world_.tryGet<PhysInitialVelocity>(entity); initial && isFastProjectile(initial->velocity)) {
        return false;
    }

    glm::vec3 scale(1.0f);
    if (const auto* s = world_.tryGet<Scale>(entity)) {
        scale = glm::abs(s->value);
    }

    BodyDesc desc;
    desc.shape = BodyShape::Box;
    desc.halfExtents = glm::max(dims->halfExtents * scale / SCALE_FACTOR, glm::vec3(0.01f));
    desc.position = pose->position;
    desc.rotation = pose->rotation;
    desc.isSensor = dims->isSensor;
    desc.motion = dims->isStatic || dims->isSensor ? BodyMotion::Static : BodyMotion::Dynamic;
    desc.group = dims->isSensor ? CollisionGroup::SENSOR : CollisionGroup::ENTITY;
    if (const auto* gravity = world_.tryGet<GravityScale>(entity)) {
        desc.gravityScale = gravity->scale;
    }

    if (!physics_.addBody(entity, desc)) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "EntityCreator: failed to add body for %u", entityToInt(entity));
        return false;
    }
    if (glm::length(initialVelocity) > 0.0f) {
        physics_.setVelocity(entity, initialVelocity);
    }
    return true;
}
