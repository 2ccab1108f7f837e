#include "Behavior.h"
#include "AIUtil.h"
#include "Random.h"
#include "RotationUtils.h"
#include "StringUtils.h"

#include <SDL3/SDL_log.h>
#include <algorithm>

using Req = MotionQueryItem;

namespace {

template<class... Ts> struct Overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

float playerDistance(const ScriptContext& ctx, EntityId entity) {
    const auto* pose = ctx.world.tryGet<Position>(entity);
    if (!pose) {
        return 0.0f;
    }
    return glm::distance(pose->position, ctx.world.player().position);
}

}  // namespace

ScriptedSequenceBehavior::ScriptedSequenceBehavior(std::vector<ScriptedAction> sequence)
    : actions(std::move(sequence)) {
    settle();
}

void ScriptedSequenceBehavior::settle() {
    while (index < actions.size()) {
        const ScriptedAction& action = actions[index];
        if (action.type == ScriptedAction::Type::Frob) {
            SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "Behavior: skipping scripted frob of '%s'",
                         action.argument.c_str());
            ++index;
            continue;
        }
        if (action.type == ScriptedAction::Type::Unknown) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Behavior: skipping unknown scripted action '%s'",
                        action.argument.c_str());
            ++index;
            continue;
        }
        if (action.type == ScriptedAction::Type::Wait) {
            waitRemaining = action.value;
        }
        break;
    }
}

std::vector<MotionQueryItem> Behavior::animation() const {
    return std::visit(Overloaded{
        [](const IdleBehavior&) { return std::vector<MotionQueryItem>{Req::required("idlegesture")}; },
        [](const WanderBehavior&) {
            return std::vector<MotionQueryItem>{Req::required("locomote"), Req::preferred("search")};
        },
        [](const ChaseBehavior&) {
            return std::vector<MotionQueryItem>{Req::required("locomote"), Req::preferred("locourgent")};
        },
        [](const MeleeAttackBehavior&) {
            return std::vector<MotionQueryItem>{Req::required("meleecombat"), Req::required("attack"),
                                                Req::preferred("direction")};
        },
        [](const RangedAttackBehavior&) {
            return std::vector<MotionQueryItem>{Req::required("rangedcombat"), Req::required("attack"),
                                                Req::preferred("direction")};
        },
        [](const ScriptedSequenceBehavior& seq) {
            const ScriptedAction* action = seq.current();
            std::vector<MotionQueryItem> items;
            if (action && action->type == ScriptedAction::Type::PlayMotion) {
                for (const auto& tag : StringUtils::split(action->argument, ',')) {
                    items.push_back(Req::required(StringUtils::toLower(tag)));
                }
            }
            if (items.empty()) {
                items.push_back(Req::required("idlegesture"));
            }
            return items;
        },
        [](const DeadBehavior&) { return std::vector<MotionQueryItem>{Req::required("crumple")}; },
    }, state_);
}

bool Behavior::isLocomotion() const {
    return is<WanderBehavior>() || is<ChaseBehavior>();
}

float Behavior::turnSpeed() const {
    return std::visit(Overloaded{
        [](const WanderBehavior&) { return 45.0f; },
        [](const ChaseBehavior&) { return 180.0f; },
        [](const MeleeAttackBehavior&) { return 270.0f; },
        [](const RangedAttackBehavior&) { return 180.0f; },
        [](const auto&) { return 0.0f; },
    }, state_);
}

SteeringResult Behavior::steer(float currentHeading, const ScriptContext& ctx, EntityId entity) {
    return std::visit(Overloaded{
        [&](WanderBehavior& wander) -> SteeringResult {
            float now = ctx.totalTime();
            if (wander.turnAround) {
                wander.turnAround = false;
                wander.targetHeading = RotationUtils::normalizeDegrees(currentHeading + 180.0f);
                wander.hasTarget = true;
                wander.nextTurnTime = now + WanderBehavior::MIN_TURN_INTERVAL;
            } else if (!wander.hasTarget || now >= wander.nextTurnTime) {
                wander.targetHeading = RotationUtils::normalizeDegrees(currentHeading + AIUtil::randomBinomial() * 90.0f);
                wander.hasTarget = true;
                wander.nextTurnTime = now + WanderBehavior::MIN_TURN_INTERVAL +
                    Random::unit() * (WanderBehavior::MAX_TURN_INTERVAL - WanderBehavior::MIN_TURN_INTERVAL);
            }

            if (Steering::wallAhead(ctx, entity, wander.targetHeading, WanderBehavior::WALL_CHECK_DISTANCE)) {
                wander.targetHeading = RotationUtils::normalizeDegrees(wander.targetHeading + 90.0f);
            }
            return std::make_pair(SteeringOutput{wander.targetHeading}, Effect());
        },
        [&](ChaseBehavior&) -> SteeringResult { return Steering::pathToPlayer(ctx, entity); },
        [&](MeleeAttackBehavior&) -> SteeringResult { return Steering::chasePlayer(ctx, entity); },
        [&](RangedAttackBehavior&) -> SteeringResult { return Steering::chasePlayer(ctx, entity); },
        [&](ScriptedSequenceBehavior& seq) -> SteeringResult {
            const ScriptedAction* action = seq.current();
            if (action && action->type == ScriptedAction::Type::Wait) {
                seq.waitRemaining = std::max(0.0f, seq.waitRemaining - ctx.deltaTime());
            }
            return std::nullopt;
        },
        [](auto&) -> SteeringResult { return std::nullopt; },
    }, state_);
}

NextBehavior Behavior::nextBehavior(const ScriptContext& ctx, EntityId entity) {
    return std::visit(Overloaded{
        [&](ChaseBehavior& chase) {
            if (chase.pursuingAttack && playerDistance(ctx, entity) <= MELEE_RANGE) {
                return NextBehavior::to(MeleeAttackBehavior{});
            }
            return NextBehavior::noOpinion();
        },
        [&](MeleeAttackBehavior&) {
            if (playerDistance(ctx, entity) > MELEE_RANGE) {
                return NextBehavior::to(ChaseBehavior{true});
            }
            return NextBehavior::stay();
        },
        [](ScriptedSequenceBehavior& seq) {
            const ScriptedAction* action = seq.current();
            if (action && action->type == ScriptedAction::Type::Wait && seq.waitRemaining > 0.0f) {
                return NextBehavior::stay();
            }
            ++seq.index;
            seq.settle();
            if (!seq.current()) {
                return NextBehavior::to(IdleBehavior{});
            }
            return NextBehavior::stay();
        },
        [](IdleBehavior&) { return NextBehavior::stay(); },
        [](RangedAttackBehavior&) { return NextBehavior::stay(); },
        [](DeadBehavior&) { return NextBehavior::stay(); },
        [](WanderBehavior&) { return NextBehavior::noOpinion(); },
    }, state_);
}

void Behavior::handleMessage(EntityId /*entity*/, const ScriptContext& /*ctx*/, const MessagePayloadVariant& message) {
    if (auto* wander = std::get_if<WanderBehavior>(&state_)) {
        if (std::holds_alternative<MessagePayload::Collided>(message)) {
            wander->turnAround = true;
        }
    }
}

const char* Behavior::name() const {
    return std::visit(Overloaded{
        [](const IdleBehavior&) { return "Idle"; },
        [](const WanderBehavior&) { return "Wander"; },
        [](const ChaseBehavior&) { return "Chase"; },
        [](const MeleeAttackBehavior&) { return "MeleeAttack"; },
        [](const RangedAttackBehavior&) { return "RangedAttack"; },
        [](const ScriptedSequenceBehavior&) { return "ScriptedSequence"; },
        [](const DeadBehavior&) { return "Dead"; },
    }, state_);
}

bool isAttackAnimation(const std::vector<MotionQueryItem>& items) {
    for (const auto& item : items) {
        if (item.tag == "attack" || item.tag == "meleecombat" || item.tag == "rangedcombat") {
            return true;
        }
    }
    return false;
}
