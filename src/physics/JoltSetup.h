#pragma once

#include <Jolt/Jolt.h>
#include <Jolt/Physics/Collision/ObjectLayer.h>
#include <Jolt/Physics/Collision/BroadPhase/BroadPhaseLayer.h>

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

#include <array>
#include <memory>

// Jolt plumbing shared by JoltPhysicsWorld and PlayerCapsule: object layers,
// the layer filters handed to PhysicsSystem::Init, glm conversions, and the
// process-wide allocator/factory lifetime.
namespace JoltSetup {

// Object layers. Movers and the player live in the MOVER broad phase tree;
// world geometry and trigger volumes in the SCENERY tree.
enum ObjectLayers : JPH::ObjectLayer {
    WORLD = 0,      // static level geometry and fixed objects
    PROP = 1,       // dynamic and kinematic mission objects, projectiles
    PLAYER = 2,     // capsule inner body
    HITBOX = 3,     // per-joint creature boxes, struck only by props
    TRIGGER = 4,    // sensors and tripwires
    LAYER_COUNT = 5
};

namespace Tree {
    constexpr JPH::BroadPhaseLayer SCENERY(0);
    constexpr JPH::BroadPhaseLayer MOVER(1);
    constexpr uint32_t COUNT = 2;
}

// Symmetric layer-vs-layer collision table
constexpr std::array<std::array<bool, LAYER_COUNT>, LAYER_COUNT> COLLIDES = {{
    //  WORLD  PROP   PLAYER HITBOX TRIGGER
    {{ false, true,  true,  false, false }},  // WORLD
    {{ true,  true,  true,  true,  true  }},  // PROP
    {{ true,  true,  true,  false, true  }},  // PLAYER
    {{ false, true,  false, false, false }},  // HITBOX
    {{ false, true,  true,  false, false }},  // TRIGGER
}};

constexpr JPH::BroadPhaseLayer treeFor(JPH::ObjectLayer layer) {
    return (layer == WORLD || layer == TRIGGER) ? Tree::SCENERY : Tree::MOVER;
}

class LayerInterface final : public JPH::BroadPhaseLayerInterface {
public:
    uint32_t GetNumBroadPhaseLayers() const override { return Tree::COUNT; }

    JPH::BroadPhaseLayer GetBroadPhaseLayer(JPH::ObjectLayer layer) const override {
        JPH_ASSERT(layer < LAYER_COUNT);
        return treeFor(layer);
    }

#if defined(JPH_EXTERNAL_PROFILE) || defined(JPH_PROFILE_ENABLED)
    const char* GetBroadPhaseLayerName(JPH::BroadPhaseLayer layer) const override {
        return layer == Tree::SCENERY ? "SCENERY" : "MOVER";
    }
#endif
};

class LayerPairFilter final : public JPH::ObjectLayerPairFilter {
public:
    bool ShouldCollide(JPH::ObjectLayer a, JPH::ObjectLayer b) const override {
        if (a >= LAYER_COUNT || b >= LAYER_COUNT) return false;
        return COLLIDES[a][b];
    }
};

// A layer may skip a whole tree when nothing in it can touch the layer
class LayerVsTreeFilter final : public JPH::ObjectVsBroadPhaseLayerFilter {
public:
    bool ShouldCollide(JPH::ObjectLayer layer, JPH::BroadPhaseLayer tree) const override {
        if (layer >= LAYER_COUNT) return false;
        for (JPH::ObjectLayer other = 0; other < LAYER_COUNT; ++other) {
            if (COLLIDES[layer][other] && treeFor(other) == tree) return true;
        }
        return false;
    }
};

const LayerInterface& layerInterface();
const LayerPairFilter& layerPairFilter();
const LayerVsTreeFilter& layerVsTreeFilter();

inline JPH::Vec3 toJolt(const glm::vec3& v) { return JPH::Vec3(v.x, v.y, v.z); }
inline JPH::RVec3 toJoltR(const glm::vec3& v) { return JPH::RVec3(v.x, v.y, v.z); }
inline JPH::Quat toJolt(const glm::quat& q) { return JPH::Quat(q.x, q.y, q.z, q.w); }

inline glm::vec3 toGLM(JPH::Vec3Arg v) { return glm::vec3(v.GetX(), v.GetY(), v.GetZ()); }
#ifdef JPH_DOUBLE_PRECISION
inline glm::vec3 toGLM(JPH::RVec3Arg v) {
    return glm::vec3(static_cast<float>(v.GetX()), static_cast<float>(v.GetY()), static_cast<float>(v.GetZ()));
}
#endif
inline glm::quat toGLM(JPH::QuatArg q) { return glm::quat(q.GetW(), q.GetX(), q.GetY(), q.GetZ()); }

// Holds the Jolt allocator, factory and type registry alive. Every
// JoltPhysicsWorld keeps one; the last release unregisters.
class RuntimeLease {
public:
    static std::shared_ptr<RuntimeLease> acquire();
    ~RuntimeLease();

    RuntimeLease(const RuntimeLease&) = delete;
    RuntimeLease& operator=(const RuntimeLease&) = delete;

private:
    RuntimeLease();
};

} // namespace JoltSetup
