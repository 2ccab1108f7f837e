#pragma once

#include "Script.h"

// Forwards every message to its SwitchLink targets
class TrapRouter final : public Script {
public:
    Effect handleMessage(EntityId entity, ScriptContext& ctx, const MessagePayloadVariant& message) override;
};

// Forwards TurnOn as TurnOff and vice versa
class TrapInverter final : public Script {
public:
    Effect handleMessage(EntityId entity, ScriptContext& ctx, const MessagePayloadVariant& message) override;
};

// Turns a TurnOn into Collided for itself and its SwitchLink targets
class TriggerCollide final : public Script {
public:
    Effect handleMessage(EntityId entity, ScriptContext& ctx, const MessagePayloadVariant& message) override;
};

// Plays the "create" environmental sound when the entity appears
class CreateSound final : public Script {
public:
    Effect initialize(EntityId entity, ScriptContext& ctx) override;
};
