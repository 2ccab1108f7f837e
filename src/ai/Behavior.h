#pragma once

#include <optional>
#include <type_traits>
#include <variant>
#include <vector>

#include "DarkConstants.h"
#include "Links.h"
#include "MotionDatabase.h"
#include "Steering.h"

// Player distance at which melee attacks start and stop, world units
constexpr float MELEE_RANGE = 5.0f / SCALE_FACTOR;

struct IdleBehavior {};

struct WanderBehavior {
    static constexpr float MIN_TURN_INTERVAL = 2.0f;
    static constexpr float MAX_TURN_INTERVAL = 5.0f;
    static constexpr float WALL_CHECK_DISTANCE = 1.5f;

    float targetHeading = 0.0f;
    float nextTurnTime = 0.0f;
    bool hasTarget = false;
    bool turnAround = false;
};

struct ChaseBehavior {
    // Set when chasing a player that escaped a melee attack
    bool pursuingAttack = false;
};

struct MeleeAttackBehavior {};

struct RangedAttackBehavior {};

// Designer sequence from AISignalResponse or an AIWatchObj link
struct ScriptedSequenceBehavior {
    std::vector<ScriptedAction> actions;
    size_t index = 0;
    float waitRemaining = 0.0f;

    explicit ScriptedSequenceBehavior(std::vector<ScriptedAction> sequence);

    const ScriptedAction* current() const { return index < actions.size() ? &actions[index] : nullptr; }

    // Moves past actions with no animation of their own; loads the wait timer
    void settle();
};

struct DeadBehavior {};

struct NextBehavior;

// Per-tick AI micro-program of an animated monster
class Behavior {
public:
    using Variant = std::variant<IdleBehavior, WanderBehavior, ChaseBehavior, MeleeAttackBehavior,
                                 RangedAttackBehavior, ScriptedSequenceBehavior, DeadBehavior>;

    Behavior() : state_(IdleBehavior{}) {}
    template<typename T, typename = std::enable_if_t<!std::is_same_v<std::decay_t<T>, Behavior>>>
    Behavior(T behavior) : state_(std::move(behavior)) {}

    // Motion tags for the animation this behavior plays
    std::vector<MotionQueryItem> animation() const;

    // Locomotion clips advance their own sequential counter
    bool isLocomotion() const;

    // Degrees per second
    float turnSpeed() const;

    // nullopt leaves the heading unchanged
    SteeringResult steer(float currentHeading, const ScriptContext& ctx, EntityId entity);

    // Asked when the current animation completes
    NextBehavior nextBehavior(const ScriptContext& ctx, EntityId entity);

    void handleMessage(EntityId entity, const ScriptContext& ctx, const MessagePayloadVariant& message);

    const char* name() const;

    template<typename T>
    bool is() const { return std::holds_alternative<T>(state_); }

    template<typename T>
    const T* as() const { return std::get_if<T>(&state_); }

private:
    Variant state_;
};

struct NextBehavior {
    enum class Kind { Stay, NoOpinion, Next };

    Kind kind = Kind::NoOpinion;
    std::optional<Behavior> next;

    static NextBehavior stay() { return {Kind::Stay, std::nullopt}; }
    static NextBehavior noOpinion() { return {Kind::NoOpinion, std::nullopt}; }
    static NextBehavior to(Behavior behavior) { return {Kind::Next, std::move(behavior)}; }
};

// true when the query plays an attack, which the monster announces
bool isAttackAnimation(const std::vector<MotionQueryItem>& items);
