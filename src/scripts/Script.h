#pragma once

#include "Effect.h"
#include "Message.h"
#include "World.h"

class PhysicsWorld;
struct GlobalContext;

// Read-only view of the tick handed to scripts; they respond with effects only
struct ScriptContext {
    const ecs::World& world;
    const PhysicsWorld& physics;
    const GlobalContext& global;

    float deltaTime() const { return world.time().elapsed; }
    float totalTime() const { return world.time().total; }
};

// Per-entity behaviour attached through the Scripts property
class Script {
public:
    virtual ~Script() = default;

    virtual Effect initialize(EntityId /*entity*/, ScriptContext& /*ctx*/) { return {}; }
    virtual Effect update(EntityId /*entity*/, ScriptContext& /*ctx*/) { return {}; }
    virtual Effect handleMessage(EntityId /*entity*/, ScriptContext& /*ctx*/,
                                 const MessagePayloadVariant& /*message*/) { return {}; }
};
