#include "Effect.h"

Effect Effect::combine(std::vector<Effect> effects) {
    std::vector<Effect> flat;
    for (const auto& effect : effects) {
        effect.flattenInto(flat);
    }
    if (flat.empty()) {
        return Effect();
    }
    if (flat.size() == 1) {
        return std::move(flat.front());
    }
    return Effect(Effects::Multiple{std::move(flat)});
}

void Effect::flattenInto(std::vector<Effect>& out) const {
    if (isNone()) {
        return;
    }
    if (const auto* multiple = as<Effects::Multiple>()) {
        for (const auto& inner : multiple->effects) {
            inner.flattenInto(out);
        }
        return;
    }
    out.push_back(*this);
}

namespace {

struct EffectNameVisitor {
    const char* operator()(const Effects::NoEffect&) const { return "NoEffect"; }
    const char* operator()(const Effects::Multiple&) const { return "Multiple"; }
    const char* operator()(const Effects::AcquireKeyCard&) const { return "AcquireKeyCard"; }
    const char* operator()(const Effects::AdjustHitPoints&) const { return "AdjustHitPoints"; }
    const char* operator()(const Effects::AwardXP&) const { return "AwardXP"; }
    const char* operator()(const Effects::DrawDebugLines&) const { return "DrawDebugLines"; }
    const char* operator()(const Effects::CreateEntity&) const { return "CreateEntity"; }
    const char* operator()(const Effects::CreateEntityByTemplateName&) const { return "CreateEntityByTemplateName"; }
    const char* operator()(const Effects::DestroyEntity&) const { return "DestroyEntity"; }
    const char* operator()(const Effects::SlayEntity&) const { return "SlayEntity"; }
    const char* operator()(const Effects::ReplaceEntity&) const { return "ReplaceEntity"; }
    const char* operator()(const Effects::ChangeModel&) const { return "ChangeModel"; }
    const char* operator()(const Effects::SetPosition&) const { return "SetPosition"; }
    const char* operator()(const Effects::SetRotation&) const { return "SetRotation"; }
    const char* operator()(const Effects::SetPositionRotation&) const { return "SetPositionRotation"; }
    const char* operator()(const Effects::SetPlayerPosition&) const { return "SetPlayerPosition"; }
    const char* operator()(const Effects::QueueAnimationBySchema&) const { return "QueueAnimationBySchema"; }
    const char* operator()(const Effects::SetJointTransform&) const { return "SetJointTransform"; }
    const char* operator()(const Effects::PlaySound&) const { return "PlaySound"; }
    const char* operator()(const Effects::PlaySpeech&) const { return "PlaySpeech"; }
    const char* operator()(const Effects::PlayEnvironmentalSound&) const { return "PlayEnvironmentalSound"; }
    const char* operator()(const Effects::StopSound&) const { return "StopSound"; }
    const char* operator()(const Effects::GrabEntity&) const { return "GrabEntity"; }
    const char* operator()(const Effects::DropEntityInfo&) const { return "DropEntityInfo"; }
    const char* operator()(const Effects::ResetGravity&) const { return "ResetGravity"; }
    const char* operator()(const Effects::SetGravity&) const { return "SetGravity"; }
    const char* operator()(const Effects::SetQuestBit&) const { return "SetQuestBit"; }
    const char* operator()(const Effects::SetAIProperty&) const { return "SetAIProperty"; }
    const char* operator()(const Effects::Send&) const { return "Send"; }
    const char* operator()(const Effects::SetUI&) const { return "SetUI"; }
    const char* operator()(const Effects::Global&) const { return "GlobalEffect"; }
};

struct MessageNameVisitor {
    const char* operator()(const MessagePayload::AnimationCompleted&) const { return "AnimationCompleted"; }
    const char* operator()(const MessagePayload::AnimationFlagTriggered&) const { return "AnimationFlagTriggered"; }
    const char* operator()(const MessagePayload::Collided&) const { return "Collided"; }
    const char* operator()(const MessagePayload::Damage&) const { return "Damage"; }
    const char* operator()(const MessagePayload::Frob&) const { return "Frob"; }
    const char* operator()(const MessagePayload::Hold&) const { return "Hold"; }
    const char* operator()(const MessagePayload::Drop&) const { return "Drop"; }
    const char* operator()(const MessagePayload::SensorBeginIntersect&) const { return "SensorBeginIntersect"; }
    const char* operator()(const MessagePayload::SensorEndIntersect&) const { return "SensorEndIntersect"; }
    const char* operator()(const MessagePayload::Signal&) const { return "Signal"; }
    const char* operator()(const MessagePayload::TurnOn&) const { return "TurnOn"; }
    const char* operator()(const MessagePayload::TurnOff&) const { return "TurnOff"; }
    const char* operator()(const MessagePayload::TriggerPull&) const { return "TriggerPull"; }
    const char* operator()(const MessagePayload::TriggerRelease&) const { return "TriggerRelease"; }
};

} // anonymous namespace

const char* effectName(const Effect& effect) {
    return std::visit(EffectNameVisitor{}, effect.value);
}

const char* messagePayloadName(const MessagePayloadVariant& payload) {
    return std::visit(MessageNameVisitor{}, payload);
}
