#include "Steering.h"
#include "GlobalContext.h"
#include "PhysicsWorld.h"
#include "RotationUtils.h"

namespace Steering {

SteeringResult chasePlayer(const ScriptContext& ctx, EntityId entity) {
    const auto* pose = ctx.world.tryGet<Position>(entity);
    if (!pose) {
        return std::nullopt;
    }
    float heading = RotationUtils::yawBetween(pose->position, ctx.world.player().position);
    return std::make_pair(SteeringOutput{heading}, Effect());
}

SteeringResult pathToPlayer(const ScriptContext& ctx, EntityId entity) {
    const auto* pose = ctx.world.tryGet<Position>(entity);
    if (!pose || !ctx.global.pathfinding) {
        return chasePlayer(ctx, entity);
    }

    const glm::vec3& goal = ctx.world.player().position;
    auto path = ctx.global.pathfinding->findPath(pose->position, goal, MovementBits::Walk);
    if (!path || path->size() < 2) {
        return chasePlayer(ctx, entity);
    }

    const glm::vec3& waypoint = (*path)[1];
    float heading = RotationUtils::yawBetween(pose->position, waypoint);

    Effect debug;
    if (ctx.world.debugOptions().debugAI) {
        Effects::DrawDebugLines lines;
        glm::vec3 previous = pose->position;
        for (size_t i = 1; i < path->size(); ++i) {
            lines.lines.push_back({previous, (*path)[i], glm::vec4(0.2f, 0.6f, 1.0f, 1.0f)});
            previous = (*path)[i];
        }
        debug = std::move(lines);
    }
    return std::make_pair(SteeringOutput{heading}, std::move(debug));
}

bool wallAhead(const ScriptContext& ctx, EntityId entity, float heading, float distance) {
    const auto* pose = ctx.world.tryGet<Position>(entity);
    if (!pose) {
        return false;
    }
    glm::vec3 direction = RotationUtils::fromAngleY(heading) * glm::vec3(0.0f, 0.0f, 1.0f);
    return ctx.physics.rayCast(pose->position, direction, distance, CollisionGroup::WORLD, entity, false).has_value();
}

}  // namespace Steering
