#include "Links.h"
#include "StringUtils.h"

using StringUtils::toLower;

namespace LinkNames {

std::optional<LinkKind> fromName(const std::string& name) {
    std::string key = toLower(name);
    if (key == "switchlink") return LinkKind::SwitchLink;
    if (key == "contains") return LinkKind::Contains;
    if (key == "flinderize") return LinkKind::Flinderize;
    if (key == "corpse") return LinkKind::Corpse;
    if (key == "aiprojectile") return LinkKind::AIProjectile;
    if (key == "airangedweapon") return LinkKind::AIRangedWeapon;
    if (key == "aiwatchobj") return LinkKind::AIWatchObj;
    if (key == "projectile") return LinkKind::Projectile;
    if (key == "gunflash") return LinkKind::GunFlash;
    return std::nullopt;
}

const char* toName(LinkKind kind) {
    switch (kind) {
        case LinkKind::SwitchLink: return "SwitchLink";
        case LinkKind::Contains: return "Contains";
        case LinkKind::Flinderize: return "Flinderize";
        case LinkKind::Corpse: return "Corpse";
        case LinkKind::AIProjectile: return "AIProjectile";
        case LinkKind::AIRangedWeapon: return "AIRangedWeapon";
        case LinkKind::AIWatchObj: return "AIWatchObj";
        case LinkKind::Projectile: return "Projectile";
        case LinkKind::GunFlash: return "GunFlash";
    }
    return "Unknown";
}

} // namespace LinkNames

namespace ScriptedActions {

ScriptedAction::Type typeFromName(const std::string& name) {
    std::string key = toLower(name);
    if (key == "play" || key == "playmotion" || key == "motion") return ScriptedAction::Type::PlayMotion;
    if (key == "wait") return ScriptedAction::Type::Wait;
    if (key == "frob") return ScriptedAction::Type::Frob;
    return ScriptedAction::Type::Unknown;
}

} // namespace ScriptedActions
