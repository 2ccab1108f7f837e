#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "AnimationPlayer.h"
#include "AssetCache.h"
#include "AudioSink.h"
#include "Effect.h"
#include "EntityCreator.h"
#include "GlobalContext.h"
#include "HeldItemState.h"
#include "HitBoxManager.h"
#include "MissionLoader.h"
#include "ParticleEmitter.h"
#include "PhysicsWorld.h"
#include "QuestInfo.h"
#include "ScriptWorld.h"
#include "World.h"

// Controller state for one tick
struct PlayerInput {
    glm::vec2 turnStick{0.0f};      // x turns the body, y moves vertically
    glm::vec2 moveStick{0.0f};      // strafe and forward, relative to the head
    glm::quat headRotation{1.0f, 0.0f, 0.0f, 0.0f};
};

struct DebugLine {
    glm::vec3 start{0.0f};
    glm::vec3 end{0.0f};
    glm::vec4 color{1.0f};
    float remainingLife = 0.0f;
};

struct TickResult {
    std::vector<GlobalEffect> globalEffects;
    size_t effectsApplied = 0;
    size_t effectsDeferred = 0;     // left for the next tick when the drain hit its pass limit
};

struct MissionOptions {
    std::set<std::string> experimental;
};

// Runs one mission: owns the entity store, the physics world, the scripts and the
// per-entity animation state, and reconciles them once per tick.
class MissionCore {
public:
    static constexpr float PLAYER_TURN_SPEED = 2.0f;    // radians/sec at full stick
    static constexpr float PLAYER_MOVE_SPEED = 25.0f;   // asset units/sec at full stick
    static constexpr float DEBUG_LINE_LIFE = 0.1f;
    static constexpr int MAX_EFFECT_PASSES = 8;

    MissionCore(std::string name,
                GlobalContext global,
                std::unique_ptr<PhysicsWorld> physics,
                std::shared_ptr<AudioSink> audio,
                MissionOptions options = {});
    ~MissionCore() = default;

    MissionCore(const MissionCore&) = delete;
    MissionCore& operator=(const MissionCore&) = delete;

    // Loads navigation, instantiates the placed objects, binds their links and spawns the player
    void populate(const MissionDescription& mission, const SpawnLocation& spawn);

    // Re-creates carried items from a previous level; their bodies stay off while held
    void restoreHeldItems(const HeldItemState& state);
    HeldItemState captureHeldItems() const { return HeldItemState::capture(world_); }

    TickResult tick(float deltaTime, const PlayerInput& input = {});

    void queueEffect(Effect effect);

    // Processed after the scripts of the next tick have run
    void queueEntityTrigger(const std::string& name);

    std::optional<EntityId> spawnEntity(int32_t templateId, const glm::vec3& position,
                                        const glm::quat& orientation = glm::quat(1.0f, 0.0f, 0.0f, 0.0f));

    // Idempotent teardown of everything tied to the entity
    void removeEntity(EntityId entity);

    // Lets go of whatever the hand holds; the item becomes physical again
    void releaseHand(Handedness hand);

    const std::string& name() const { return name_; }
    uint64_t frame() const { return frame_; }
    ecs::World& world() { return world_; }
    const ecs::World& world() const { return world_; }
    PhysicsWorld& physics() { return *physics_; }
    ScriptWorld& scripts() { return scripts_; }
    AssetCache& assets() { return assets_; }
    const GlobalContext& global() const { return global_; }
    const QuestInfo& quests() const { return quests_; }
    const std::vector<DebugLine>& debugLines() const { return debugLines_; }
    EntityId playerEntity() const { return world_.player().entity; }

    const AnimationPlayer* animationPlayer(EntityId entity) const;
    const ParticleEmitter* particleEmitter(EntityId entity) const;
    bool hasModel(EntityId entity) const { return models_.count(entity) > 0; }

private:
    ScriptContext scriptContext();

    // Tick phases
    void integrateInput(float deltaTime, const PlayerInput& input);
    void dispatchCollisions(const std::vector<CollisionEvent>& events, std::vector<Effect>& effects);
    void updateTeleportTimers(float deltaTime);
    void updateAnimations(float deltaTime, std::vector<Effect>& effects);
    void updateHitBoxes();
    void synchronizePhysicsPositions();
    void processPendingTriggers(std::vector<Effect>& effects);
    void updateParticles(float deltaTime);
    void drainEffects(TickResult& result);

    void applyEffect(const Effect& effect, std::vector<Effect>& followUps, TickResult& result);
    void dispatch(const Message& message, std::vector<Effect>& effects);

    // Model, animation player and hit-boxes of a freshly created entity
    void finishInstantiating(EntityId entity);

    void queueAnimationBySchema(const Effects::QueueAnimationBySchema& request, std::vector<Effect>& followUps);
    void slayEntity(EntityId entity);
    void replaceEntity(EntityId entity, int32_t templateId);
    void changeModel(EntityId entity, const std::string& modelName);
    void grabEntity(EntityId entity, Handedness hand, std::vector<Effect>& followUps);
    void dropIntoContainer(EntityId parent, EntityId dropped);
    void playSound(AudioHandle handle, const std::string& name);
    void playSpeech(const Effects::PlaySpeech& speech);
    void playEnvironmentalSound(AudioHandle handle, const TagQuery& query, const glm::vec3& position);

    // Body pose when the entity has one, else its Position component
    std::optional<std::pair<glm::vec3, glm::quat>> entityPose(EntityId entity) const;
    void writeTransform(EntityId entity, const glm::vec3& position, const glm::quat& rotation);

    std::string name_;
    GlobalContext global_;
    std::unique_ptr<PhysicsWorld> physics_;
    std::shared_ptr<AudioSink> audio_;
    MissionOptions options_;

    ecs::World world_;
    ScriptWorld scripts_;
    AssetCache assets_;
    EntityCreator creator_;
    HitBoxManager hitBoxes_;
    QuestInfo quests_;

    std::map<EntityId, SkeletonHandle> models_;
    std::map<EntityId, AnimationPlayer> animationPlayers_;
    std::map<EntityId, ParticleEmitter> particleEmitters_;

    std::vector<Effect> effectQueue_;
    std::vector<std::string> pendingTriggers_;
    std::vector<DebugLine> debugLines_;
    uint64_t frame_ = 0;
};
