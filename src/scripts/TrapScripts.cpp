#include "TrapScripts.h"
#include "AIUtil.h"

Effect TrapRouter::handleMessage(EntityId entity, ScriptContext& ctx, const MessagePayloadVariant& message) {
    return AIUtil::sendToAllSwitchLinks(ctx.world, entity, message);
}

Effect TrapInverter::handleMessage(EntityId entity, ScriptContext& ctx, const MessagePayloadVariant& message) {
    MessagePayloadVariant inverted = message;
    if (const auto* on = std::get_if<MessagePayload::TurnOn>(&message)) {
        inverted = MessagePayload::TurnOff{on->from};
    } else if (const auto* off = std::get_if<MessagePayload::TurnOff>(&message)) {
        inverted = MessagePayload::TurnOn{off->from};
    }
    return AIUtil::sendToAllSwitchLinks(ctx.world, entity, inverted);
}

Effect TriggerCollide::handleMessage(EntityId entity, ScriptContext& ctx, const MessagePayloadVariant& message) {
    const auto* on = std::get_if<MessagePayload::TurnOn>(&message);
    if (!on) {
        return {};
    }
    MessagePayloadVariant collided = MessagePayload::Collided{on->from};
    return Effect::combine({AIUtil::sendToAllSwitchLinks(ctx.world, entity, collided),
                            Effects::Send{Message{entity, collided}}});
}

Effect CreateSound::initialize(EntityId entity, ScriptContext& ctx) {
    return AIUtil::playPositionalSound(ctx.world, entity, std::nullopt, {{"event", "create"}});
}
