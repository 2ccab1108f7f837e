#include "MissionCore.h"
#include "AIUtil.h"
#include "DarkConstants.h"
#include "PathDatabase.h"
#include "Profiling.h"
#include "PropertySerialization.h"
#include "RotationUtils.h"
#include "SpeechDatabase.h"

#include <SDL3/SDL_log.h>
#include <glm/gtc/matrix_transform.hpp>
#include <algorithm>
#include <filesystem>

namespace {

glm::mat4 composeTransform(const glm::vec3& position, const glm::quat& rotation, const glm::vec3& scale) {
    return glm::translate(glm::mat4(1.0f), position) * glm::mat4_cast(rotation) *
           glm::scale(glm::mat4(1.0f), glm::abs(scale));
}

}  // namespace

MissionCore::MissionCore(std::string name,
                         GlobalContext global,
                         std::unique_ptr<PhysicsWorld> physics,
                         std::shared_ptr<AudioSink> audio,
                         MissionOptions options)
    : name_(std::move(name)),
      global_(std::move(global)),
      physics_(std::move(physics)),
      audio_(audio ? std::move(audio) : std::make_shared<LoggingAudioSink>()),
      options_(std::move(options)),
      assets_(global_.assetRoot, global_.motionDb),
      creator_(world_, *physics_, scripts_, global_),
      hitBoxes_(world_, *physics_) {}

ScriptContext MissionCore::scriptContext() {
    return ScriptContext{world_, *physics_, global_};
}

void MissionCore::populate(const MissionDescription& mission, const SpawnLocation& spawn) {
    if (mission.aipathFile) {
        const auto path = (std::filesystem::path(global_.assetRoot) / *mission.aipathFile).string();
        if (auto database = PathDatabase::load(path)) {
            global_.pathfinding = std::make_shared<const PathfindingService>(
                std::make_shared<const PathDatabase>(std::move(*database)));
        } else {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "MissionCore: no navigation for %s, AI will not path",
                        mission.name.c_str());
        }
    }

    std::map<int32_t, EntityId> objectToEntity;
    std::vector<std::pair<EntityId, const MissionEntity*>> created;
    for (const auto& placed : mission.entities) {
        int32_t templateId = placed.templateId;
        if (templateId == 0 && !placed.templateName.empty() && global_.templates) {
            if (const auto* byName = global_.templates->findByName(placed.templateName)) {
                templateId = byName->id;
            }
        }
        auto entity = creator_.create(templateId, placed.position, RotationUtils::fromAngleY(placed.yaw),
                                      glm::mat4(1.0f), placed.properties);
        if (!entity) {
            continue;
        }
        if (placed.objectId) {
            objectToEntity[*placed.objectId] = *entity;
        }
        created.emplace_back(*entity, &placed);
    }

    // Links between placed objects can only be bound once every object exists
    for (const auto& [entity, placed] : created) {
        if (placed->links.empty()) {
            continue;
        }
        Links links;
        if (const auto* existing = world_.tryGet<Links>(entity)) {
            links = *existing;
        }
        for (const auto& ref : placed->links) {
            Link link = ref.link;
            auto it = objectToEntity.find(ref.toObject);
            if (it != objectToEntity.end()) {
                link.toEntity = it->second;
                if (const auto* target = world_.tryGet<TemplateId>(it->second)) {
                    link.toTemplateId = target->id;
                }
            }
            links.links.push_back(std::move(link));
        }
        world_.set(entity, std::move(links));
    }

    for (const auto& [entity, placed] : created) {
        finishInstantiating(entity);
    }

    const glm::vec3 spawnPosition = mission.resolveSpawn(spawn);
    EntityId player = world_.createEntity();
    world_.set(player, PlayerTag{});
    world_.set(player, Position{spawnPosition, glm::quat(1.0f, 0.0f, 0.0f, 0.0f), 0});
    physics_->createCharacter(player, spawnPosition);
    auto& info = world_.player();
    info.entity = player;
    info.position = spawnPosition;

    SDL_Log("MissionCore: %s populated with %zu objects, player at (%.2f, %.2f, %.2f)",
            name_.c_str(), created.size(), spawnPosition.x, spawnPosition.y, spawnPosition.z);
}

void MissionCore::restoreHeldItems(const HeldItemState& state) {
    auto& player = world_.player();
    auto restore = [&](const std::optional<HeldItem>& item) -> std::optional<EntityId> {
        if (!item) {
            return std::nullopt;
        }
        auto entity = creator_.create(item->templateId, player.position, player.rotation,
                                      glm::mat4(1.0f), item->properties);
        if (entity) {
            finishInstantiating(*entity);
            physics_->removeBody(*entity);
        }
        return entity;
    };

    if (auto left = restore(state.leftHand)) {
        world_.set(*left, HasRefs{true});
        player.leftHand = left;
    }
    if (auto right = restore(state.rightHand)) {
        world_.set(*right, HasRefs{true});
        player.rightHand = right;
    }
    if (auto inventory = restore(state.inventory)) {
        world_.set(*inventory, HasRefs{false});
        player.inventory = *inventory;
    }
}

std::optional<EntityId> MissionCore::spawnEntity(int32_t templateId, const glm::vec3& position,
                                                 const glm::quat& orientation) {
    auto entity = creator_.create(templateId, position, orientation);
    if (entity) {
        finishInstantiating(*entity);
    }
    return entity;
}

void MissionCore::finishInstantiating(EntityId entity) {
    if (const auto* model = world_.tryGet<ModelName>(entity)) {
        if (auto skeleton = assets_.skeleton(model->name)) {
            models_[entity] = skeleton;
            world_.set(entity, RuntimeJointTransforms{skeleton->getTransforms()});
        }
    }

    if (const auto* creature = world_.tryGet<Creature>(entity)) {
        animationPlayers_.emplace(entity, AnimationPlayer());
        if (const auto* definition = global_.creatureDefinition(creature->type)) {
            hitBoxes_.spawn(entity, *definition);
        }
    }
}

void MissionCore::queueEffect(Effect effect) {
    effect.flattenInto(effectQueue_);
}

void MissionCore::queueEntityTrigger(const std::string& name) {
    pendingTriggers_.push_back(name);
}

TickResult MissionCore::tick(float deltaTime, const PlayerInput& input) {
    DARKCORE_ZONE_SCOPED_N("MissionCore::tick");
    TickResult result;
    ++frame_;
    auto& time = world_.time();
    time.elapsed = deltaTime;
    time.total += deltaTime;

    for (auto& line : debugLines_) {
        line.remainingLife -= deltaTime;
    }
    debugLines_.erase(std::remove_if(debugLines_.begin(), debugLines_.end(),
                                     [](const DebugLine& line) { return line.remainingLife <= 0.0f; }),
                      debugLines_.end());

    std::vector<Effect> effects;

    integrateInput(deltaTime, input);

    auto collisions = physics_->step(deltaTime);
    auto& player = world_.player();
    player.position = physics_->characterPosition();
    if (world_.valid(player.entity)) {
        world_.set(player.entity, Position{player.position, player.rotation, 0});
    }

    dispatchCollisions(collisions, effects);
    updateTeleportTimers(deltaTime);
    updateAnimations(deltaTime, effects);
    updateHitBoxes();
    synchronizePhysicsPositions();

    auto ctx = scriptContext();
    scripts_.update(ctx).flattenInto(effects);

    processPendingTriggers(effects);
    updateParticles(deltaTime);

    for (auto& effect : effects) {
        effect.flattenInto(effectQueue_);
    }
    drainEffects(result);
    return result;
}

void MissionCore::integrateInput(float deltaTime, const PlayerInput& input) {
    auto& player = world_.player();
    const glm::quat turn = glm::angleAxis(input.turnStick.x * deltaTime * PLAYER_TURN_SPEED, glm::vec3(0.0f, 1.0f, 0.0f));
    player.rotation = glm::normalize(player.rotation * turn);

    const glm::quat direction = player.rotation * input.headRotation;
    const float speed = PLAYER_MOVE_SPEED / SCALE_FACTOR;
    glm::vec3 velocity = direction * glm::vec3(-input.moveStick.x * speed, 0.0f, -input.moveStick.y * speed);
    velocity.y = input.turnStick.y * speed;
    physics_->moveCharacter(velocity);
}

void MissionCore::dispatchCollisions(const std::vector<CollisionEvent>& events, std::vector<Effect>& effects) {
    for (const auto& event : events) {
        switch (event.type) {
            case CollisionEvent::Type::SensorBegin:
                dispatch(Message{event.a, MessagePayload::SensorBeginIntersect{event.b}}, effects);
                break;
            case CollisionEvent::Type::SensorEnd:
                dispatch(Message{event.a, MessagePayload::SensorEndIntersect{event.b}}, effects);
                break;
            case CollisionEvent::Type::Collision:
                dispatch(Message{event.a, MessagePayload::Collided{event.b}}, effects);
                dispatch(Message{event.b, MessagePayload::Collided{event.a}}, effects);
                break;
        }
    }
}

void MissionCore::updateTeleportTimers(float deltaTime) {
    auto& registry = world_.registry();
    std::vector<EntityId> expired;
    for (auto entity : registry.view<Teleported>()) {
        auto& teleported = registry.get<Teleported>(entity);
        teleported.countdownTimer -= deltaTime;
        if (teleported.countdownTimer <= 0.0f) {
            expired.push_back(entity);
        }
    }
    for (auto entity : expired) {
        registry.remove<Teleported>(entity);
    }
}

void MissionCore::updateAnimations(float deltaTime, std::vector<Effect>& effects) {
    std::vector<Message> messages;

    for (auto& [entity, player] : animationPlayers_) {
        AnimationUpdateResult update = player.update(deltaTime);
        player = std::move(update.player);

        auto model = models_.find(entity);
        if (model != models_.end()) {
            world_.set(entity, RuntimeJointTransforms{player.getTransforms(*model->second)});
        }

        // Animation data is authored with forward on +X; the body moves along its own +Z
        const auto* transform = world_.tryGet<RuntimeTransform>(entity);
        if (transform && physics_->hasBody(entity)) {
            const glm::vec3 current = physics_->getVelocity(entity).value_or(glm::vec3(0.0f));
            const glm::vec3 v = update.slidingVelocity;
            physics_->setVelocity(entity, RotationUtils::transformVector(transform->matrix, glm::vec3(v.z, current.y, -v.x)));
        }

        if (update.flags != 0) {
            messages.push_back(Message{entity, MessagePayload::AnimationFlagTriggered{update.flags}});
        }

        for (const auto& event : update.events) {
            switch (event.type) {
                case AnimationEvent::Type::Completed:
                    messages.push_back(Message{entity, MessagePayload::AnimationCompleted{}});
                    break;
                case AnimationEvent::Type::DirectionChanged:
                    if (auto rotation = physics_->getRotation(entity)) {
                        physics_->setRotation(entity, *rotation * RotationUtils::fromAngleY(event.angle * -0.5f));
                    }
                    break;
                case AnimationEvent::Type::VelocityChanged:
                    break;
            }
        }
    }

    for (const auto& message : messages) {
        dispatch(message, effects);
    }
}

void MissionCore::updateHitBoxes() {
    for (const auto& [entity, skeleton] : models_) {
        const auto* joints = world_.tryGet<RuntimeJointTransforms>(entity);
        const auto* transform = world_.tryGet<RuntimeTransform>(entity);
        if (joints && transform) {
            hitBoxes_.update(entity, transform->matrix, joints->transforms);
        }
    }
}

void MissionCore::synchronizePhysicsPositions() {
    auto& registry = world_.registry();
    for (auto entity : registry.view<Position>()) {
        if (!physics_->hasBody(entity) || registry.all_of<HitBoxOf>(entity)) {
            continue;
        }
        auto position = physics_->getPosition(entity);
        auto rotation = physics_->getRotation(entity);
        if (position && rotation) {
            writeTransform(entity, *position, *rotation);
        }
    }
}

void MissionCore::processPendingTriggers(std::vector<Effect>& effects) {
    if (pendingTriggers_.empty()) {
        return;
    }
    std::vector<std::string> triggers;
    triggers.swap(pendingTriggers_);
    for (const auto& name : triggers) {
        auto sources = world_.entitiesByName(name);
        if (sources.empty()) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "MissionCore: no entity named '%s' to trigger", name.c_str());
            continue;
        }
        for (EntityId source : sources) {
            for (EntityId target : world_.switchLinkTargets(source)) {
                SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "MissionCore: trigger '%s' turns on %u",
                             name.c_str(), entityToInt(target));
                dispatch(Message{target, MessagePayload::TurnOn{source}}, effects);
            }
        }
    }
}

void MissionCore::updateParticles(float deltaTime) {
    auto& registry = world_.registry();
    for (auto entity : registry.view<ParticleGroup, ParticleLaunchInfo, RuntimeTransform>()) {
        auto it = particleEmitters_.find(entity);
        if (it == particleEmitters_.end()) {
            it = particleEmitters_.emplace(entity, ParticleEmitter(registry.get<ParticleGroup>(entity),
                                                                   registry.get<ParticleLaunchInfo>(entity))).first;
        }
        it->second.update(deltaTime, registry.get<RuntimeTransform>(entity).matrix);
    }
}

void MissionCore::dispatch(const Message& message, std::vector<Effect>& effects) {
    if (!world_.valid(message.to)) {
        SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "MissionCore: dropping %s for missing entity %u",
                     messagePayloadName(message.payload), entityToInt(message.to));
        return;
    }
    auto ctx = scriptContext();
    scripts_.dispatch(message, ctx).flattenInto(effects);
}

void MissionCore::drainEffects(TickResult& result) {
    // Effects can produce follow-ups (Send, synthesized completions); a chain that
    // keeps feeding itself is cut off and resumed next tick
    for (int pass = 0; pass < MAX_EFFECT_PASSES && !effectQueue_.empty(); ++pass) {
        std::vector<Effect> current;
        current.swap(effectQueue_);
        std::vector<Effect> followUps;
        for (const auto& effect : current) {
            applyEffect(effect, followUps, result);
            ++result.effectsApplied;
        }
        for (auto& effect : followUps) {
            effect.flattenInto(effectQueue_);
        }
    }
    result.effectsDeferred = effectQueue_.size();
    DARKCORE_PLOT("Deferred effects", static_cast<int64_t>(result.effectsDeferred));
    if (result.effectsDeferred > 0) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "MissionCore: deferring %zu effects to the next tick",
                    result.effectsDeferred);
    }
}

void MissionCore::applyEffect(const Effect& effect, std::vector<Effect>& followUps, TickResult& result) {
    if (effect.isNone()) {
        return;
    }
    if (const auto* multiple = effect.as<Effects::Multiple>()) {
        for (const auto& inner : multiple->effects) {
            applyEffect(inner, followUps, result);
        }
    } else if (const auto* e = effect.as<Effects::AcquireKeyCard>()) {
        quests_.addKeyCard(e->keyCard);
    } else if (const auto* e = effect.as<Effects::AdjustHitPoints>()) {
        if (auto* hitPoints = world_.tryGet<HitPoints>(e->entity)) {
            hitPoints->hitPoints += e->delta;
        }
    } else if (const auto* e = effect.as<Effects::AwardXP>()) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "MissionCore: experience awards are not tracked (%d)", e->amount);
    } else if (const auto* e = effect.as<Effects::DrawDebugLines>()) {
        if (world_.debugOptions().debugDraw) {
            for (const auto& line : e->lines) {
                debugLines_.push_back(DebugLine{line.start, line.end, line.color, DEBUG_LINE_LIFE});
            }
        }
    } else if (const auto* e = effect.as<Effects::CreateEntity>()) {
        if (auto entity = creator_.create(e->templateId, e->position, e->orientation, e->rootTransform)) {
            finishInstantiating(*entity);
        }
    } else if (const auto* e = effect.as<Effects::CreateEntityByTemplateName>()) {
        if (auto entity = creator_.createByName(e->templateName, e->position, e->orientation)) {
            finishInstantiating(*entity);
        }
    } else if (const auto* e = effect.as<Effects::DestroyEntity>()) {
        removeEntity(e->entity);
    } else if (const auto* e = effect.as<Effects::SlayEntity>()) {
        slayEntity(e->entity);
    } else if (const auto* e = effect.as<Effects::ReplaceEntity>()) {
        replaceEntity(e->entity, e->templateId);
    } else if (const auto* e = effect.as<Effects::ChangeModel>()) {
        changeModel(e->entity, e->modelName);
    } else if (const auto* e = effect.as<Effects::SetPosition>()) {
        if (physics_->hasBody(e->entity)) {
            physics_->setPosition(e->entity, e->position);
        } else if (const auto* pose = world_.tryGet<Position>(e->entity)) {
            writeTransform(e->entity, e->position, pose->rotation);
        }
    } else if (const auto* e = effect.as<Effects::SetRotation>()) {
        if (physics_->hasBody(e->entity)) {
            physics_->setRotation(e->entity, e->rotation);
        } else if (const auto* pose = world_.tryGet<Position>(e->entity)) {
            writeTransform(e->entity, pose->position, e->rotation);
        }
    } else if (const auto* e = effect.as<Effects::SetPositionRotation>()) {
        if (physics_->hasBody(e->entity)) {
            physics_->setPositionRotation(e->entity, e->position, e->rotation);
        } else if (world_.valid(e->entity)) {
            writeTransform(e->entity, e->position, e->rotation);
        }
    } else if (const auto* e = effect.as<Effects::SetPlayerPosition>()) {
        physics_->setCharacterPosition(e->position);
        auto& player = world_.player();
        player.position = e->position;
        if (e->isTeleport && world_.valid(player.entity)) {
            world_.set(player.entity, Teleported{});
        }
    } else if (const auto* e = effect.as<Effects::QueueAnimationBySchema>()) {
        queueAnimationBySchema(*e, followUps);
    } else if (const auto* e = effect.as<Effects::SetJointTransform>()) {
        auto it = animationPlayers_.find(e->entity);
        if (it != animationPlayers_.end()) {
            it->second = it->second.setAdditionalJointTransform(e->joint, e->transform);
        }
    } else if (const auto* e = effect.as<Effects::PlaySound>()) {
        playSound(e->handle, e->name);
    } else if (const auto* e = effect.as<Effects::PlaySpeech>()) {
        playSpeech(*e);
    } else if (const auto* e = effect.as<Effects::PlayEnvironmentalSound>()) {
        playEnvironmentalSound(e->handle, e->query, e->position);
    } else if (const auto* e = effect.as<Effects::StopSound>()) {
        audio_->stop(e->handle);
    } else if (const auto* e = effect.as<Effects::GrabEntity>()) {
        grabEntity(e->entity, e->hand, followUps);
    } else if (const auto* e = effect.as<Effects::DropEntityInfo>()) {
        dropIntoContainer(e->parent, e->dropped);
    } else if (const auto* e = effect.as<Effects::ResetGravity>()) {
        physics_->setGravityScale(e->entity, 1.0f);
        if (world_.valid(e->entity)) {
            world_.set(e->entity, GravityScale{1.0f});
        }
    } else if (const auto* e = effect.as<Effects::SetGravity>()) {
        physics_->setGravityScale(e->entity, e->gravityPercent);
        if (world_.valid(e->entity)) {
            world_.set(e->entity, GravityScale{e->gravityPercent});
        }
    } else if (const auto* e = effect.as<Effects::SetQuestBit>()) {
        quests_.setBit(e->name, e->value);
        SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "MissionCore: quest bit %s = %d", e->name.c_str(), e->value);
    } else if (const auto* e = effect.as<Effects::SetAIProperty>()) {
        if (!world_.valid(e->entity)) {
            return;
        }
        if (const auto* alertness = std::get_if<Effects::AlertnessUpdate>(&e->update)) {
            world_.set(e->entity, AIAlertness{alertness->level, alertness->peak});
        } else if (const auto* mode = std::get_if<Effects::ModeUpdate>(&e->update)) {
            world_.set(e->entity, AIMode{mode->mode});
        }
    } else if (const auto* e = effect.as<Effects::Send>()) {
        dispatch(e->message, followUps);
    } else if (const auto* e = effect.as<Effects::SetUI>()) {
        if (options_.experimental.count("gui") > 0) {
            SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "MissionCore: UI '%s' on %u has no renderer attached",
                         e->handle.c_str(), entityToInt(e->parent));
        }
    } else if (const auto* e = effect.as<Effects::Global>()) {
        result.globalEffects.push_back(e->effect);
    } else {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "MissionCore: unhandled effect %s", effectName(effect));
    }
}

void MissionCore::queueAnimationBySchema(const Effects::QueueAnimationBySchema& request, std::vector<Effect>& followUps) {
    auto it = animationPlayers_.find(request.entity);
    if (it == animationPlayers_.end()) {
        SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "MissionCore: entity %u has no animation player",
                     entityToInt(request.entity));
        return;
    }

    MotionQuery query;
    query.items = request.items;
    query.selection = request.selection;
    if (const auto* creature = world_.tryGet<Creature>(request.entity)) {
        if (const auto* definition = global_.creatureDefinition(creature->type)) {
            query.actorType = definition->actorType;
        } else {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "MissionCore: no creature definition for type %u",
                        creature->type);
        }
    }
    if (const auto* actorTags = world_.tryGet<MotionActorTags>(request.entity)) {
        for (const auto& tag : actorTags->tags) {
            query.items.push_back(MotionQueryItem::preferred(tag));
        }
    }

    auto motion = global_.motionDb ? global_.motionDb->query(query) : std::nullopt;
    ClipHandle clip = motion ? assets_.clip(*motion) : nullptr;
    if (!clip) {
        // Let the behavior decide again instead of stalling on a missing motion
        if (!motion) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "MissionCore: no motion for query on entity %u (actor %u)",
                        entityToInt(request.entity), query.actorType);
        }
        followUps.push_back(Effects::Send{Message{request.entity, MessagePayload::AnimationCompleted{}}});
        return;
    }
    it->second = it->second.queueAnimation(clip);
}

void MissionCore::slayEntity(EntityId entity) {
    auto pose = entityPose(entity);
    if (!pose) {
        removeEntity(entity);
        return;
    }
    const auto [position, rotation] = *pose;

    for (LinkKind kind : {LinkKind::Flinderize, LinkKind::Corpse}) {
        for (const auto& link : world_.linksOf(entity, kind)) {
            if (auto spawned = creator_.create(link.toTemplateId, position, rotation)) {
                finishInstantiating(*spawned);
            }
        }
    }

    Effect deathSound = AIUtil::playPositionalSound(world_, entity, position, {{"event", "death"}});
    if (const auto* sound = deathSound.as<Effects::PlayEnvironmentalSound>()) {
        playEnvironmentalSound(sound->handle, sound->query, sound->position);
    }

    SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "MissionCore: slayed %u", entityToInt(entity));
    removeEntity(entity);
}

void MissionCore::replaceEntity(EntityId entity, int32_t templateId) {
    auto pose = entityPose(entity).value_or(std::make_pair(glm::vec3(0.0f), glm::quat(1.0f, 0.0f, 0.0f, 0.0f)));
    auto replacement = creator_.create(templateId, pose.first, pose.second);
    if (replacement) {
        finishInstantiating(*replacement);
        auto& player = world_.player();
        for (auto* hand : {&player.leftHand, &player.rightHand}) {
            if (*hand && **hand == entity) {
                *hand = *replacement;
                physics_->removeBody(*replacement);
                world_.set(*replacement, HasRefs{true});
            }
        }
    }
    removeEntity(entity);
}

void MissionCore::changeModel(EntityId entity, const std::string& modelName) {
    if (!world_.valid(entity)) {
        return;
    }
    world_.set(entity, ModelName{modelName});
    if (const auto* offsets = assets_.vhots(modelName)) {
        world_.set(entity, Vhots{*offsets});
    } else {
        world_.registry().remove<Vhots>(entity);
    }
    if (auto skeleton = assets_.skeleton(modelName)) {
        models_[entity] = skeleton;
    } else {
        models_.erase(entity);
        world_.registry().remove<RuntimeJointTransforms>(entity);
    }
}

void MissionCore::grabEntity(EntityId entity, Handedness hand, std::vector<Effect>& followUps) {
    if (!world_.valid(entity)) {
        return;
    }
    auto& player = world_.player();
    (hand == Handedness::Left ? player.leftHand : player.rightHand) = entity;
    world_.detachFromContainers(entity);
    world_.set(entity, HasRefs{true});
    physics_->removeBody(entity);
    followUps.push_back(Effects::Send{Message{entity, MessagePayload::Hold{}}});
}

void MissionCore::dropIntoContainer(EntityId parent, EntityId dropped) {
    if (!world_.valid(parent) || !world_.valid(dropped)) {
        return;
    }
    world_.detachFromContainers(dropped);
    Links links;
    if (const auto* existing = world_.tryGet<Links>(parent)) {
        links = *existing;
    }
    Link contains;
    contains.kind = LinkKind::Contains;
    contains.toEntity = dropped;
    links.links.push_back(contains);
    world_.set(parent, std::move(links));

    auto& player = world_.player();
    for (auto* hand : {&player.leftHand, &player.rightHand}) {
        if (*hand && **hand == dropped) {
            hand->reset();
        }
    }
    world_.set(dropped, HasRefs{false});
    physics_->removeBody(dropped);
}

void MissionCore::releaseHand(Handedness hand) {
    auto& player = world_.player();
    auto& held = hand == Handedness::Left ? player.leftHand : player.rightHand;
    if (!held) {
        return;
    }
    EntityId entity = *held;
    held.reset();
    if (!world_.valid(entity)) {
        return;
    }
    creator_.registerPhysics(entity);
    std::vector<Effect> effects;
    dispatch(Message{entity, MessagePayload::Drop{}}, effects);
    for (auto& effect : effects) {
        effect.flattenInto(effectQueue_);
    }
}

void MissionCore::playSound(AudioHandle handle, const std::string& name) {
    std::string sample = name;
    if (global_.sounds) {
        sample = global_.sounds->randomSample(name).value_or(name);
    }
    audio_->play(handle, sample);
}

void MissionCore::playSpeech(const Effects::PlaySpeech& speech) {
    if (!global_.speech || !global_.sounds) {
        return;
    }
    auto sample = resolveSpeechSample(*global_.speech, *global_.sounds, speech.voiceIndex, speech.speechConcept, speech.tags);
    if (!sample) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "MissionCore: failed to resolve speech for voice %zu concept '%s'",
                    speech.voiceIndex, speech.speechConcept.c_str());
        return;
    }
    if (auto pose = entityPose(speech.entity)) {
        audio_->playSpatial(AudioHandle::next(), *sample, pose->first);
    } else {
        audio_->play(AudioHandle::next(), *sample);
    }
}

void MissionCore::playEnvironmentalSound(AudioHandle handle, const TagQuery& query, const glm::vec3& position) {
    if (!global_.sounds) {
        return;
    }
    if (auto sample = global_.sounds->randomEnvironmentalSound(query)) {
        audio_->playSpatial(handle, *sample, position);
    } else {
        SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "MissionCore: no environmental sound matches the query");
    }
}

void MissionCore::removeEntity(EntityId entity) {
    hitBoxes_.remove(entity);
    scripts_.removeEntity(entity);
    animationPlayers_.erase(entity);
    particleEmitters_.erase(entity);
    models_.erase(entity);
    physics_->removeBody(entity);

    auto& player = world_.player();
    for (auto* hand : {&player.leftHand, &player.rightHand}) {
        if (*hand && **hand == entity) {
            hand->reset();
        }
    }
    if (world_.valid(entity)) {
        world_.detachFromContainers(entity);
        world_.destroyEntity(entity);
    }
}

std::optional<std::pair<glm::vec3, glm::quat>> MissionCore::entityPose(EntityId entity) const {
    auto position = physics_->getPosition(entity);
    auto rotation = physics_->getRotation(entity);
    if (position && rotation) {
        return std::make_pair(*position, *rotation);
    }
    if (const auto* pose = world_.tryGet<Position>(entity)) {
        return std::make_pair(pose->position, pose->rotation);
    }
    return std::nullopt;
}

void MissionCore::writeTransform(EntityId entity, const glm::vec3& position, const glm::quat& rotation) {
    uint32_t cell = 0;
    if (const auto* pose = world_.tryGet<Position>(entity)) {
        cell = pose->cell;
    }
    glm::vec3 scale(1.0f);
    if (const auto* s = world_.tryGet<Scale>(entity)) {
        scale = s->value;
    }
    world_.set(entity, Position{position, rotation, cell});
    world_.set(entity, RuntimeTransform{composeTransform(position, rotation, scale)});
}

const AnimationPlayer* MissionCore::animationPlayer(EntityId entity) const {
    auto it = animationPlayers_.find(entity);
    return it == animationPlayers_.end() ? nullptr : &it->second;
}

const ParticleEmitter* MissionCore::particleEmitter(EntityId entity) const {
    auto it = particleEmitters_.find(entity);
    return it == particleEmitters_.end() ? nullptr : &it->second;
}
