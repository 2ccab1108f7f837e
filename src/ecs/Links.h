#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "EntityId.h"

enum class LinkKind : uint8_t {
    SwitchLink,
    Contains,
    Flinderize,
    Corpse,
    AIProjectile,
    AIRangedWeapon,
    AIWatchObj,
    Projectile,
    GunFlash
};

// One step of a designer-scripted AI sequence
struct ScriptedAction {
    enum class Type : uint8_t {
        PlayMotion,     // argument: comma separated motion tags
        Wait,           // value: seconds
        Frob,
        Unknown
    };

    Type type = Type::Unknown;
    std::string argument;
    float value = 0.0f;
};

struct Link {
    LinkKind kind = LinkKind::SwitchLink;
    std::optional<EntityId> toEntity;   // unset when the target only exists as a template
    int32_t toTemplateId = 0;

    int32_t joint = 0;                  // AIProjectile launch joint
    float radius = 0.0f;                // AIWatchObj trigger radius
    std::vector<ScriptedAction> actions;
};

struct Links {
    std::vector<Link> links;
};

namespace LinkNames {
    std::optional<LinkKind> fromName(const std::string& name);
    const char* toName(LinkKind kind);
}

namespace ScriptedActions {
    ScriptedAction::Type typeFromName(const std::string& name);
}
