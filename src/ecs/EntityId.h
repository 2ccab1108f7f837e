#pragma once

#include <entt/entity/entity.hpp>
#include <cstdint>

// Opaque handle of a row in the entity store
using EntityId = entt::entity;

inline uint32_t entityToInt(EntityId entity) {
    return static_cast<uint32_t>(entt::to_integral(entity));
}
