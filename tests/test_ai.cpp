#include <doctest/doctest.h>
#include <glm/glm.hpp>

#include "FakePhysicsWorld.h"
#include "ai/AnimatedMonsterAI.h"
#include "ai/Behavior.h"
#include "ai/CameraAI.h"
#include "ai/TurretAI.h"
#include "mission/GlobalContext.h"

namespace {

std::vector<Effect> flatten(const Effect& effect) {
    std::vector<Effect> out;
    effect.flattenInto(out);
    return out;
}

std::vector<std::string> modelChanges(const Effect& effect) {
    std::vector<std::string> models;
    for (const auto& e : flatten(effect)) {
        if (const auto* change = e.as<Effects::ChangeModel>()) {
            models.push_back(change->modelName);
        }
    }
    return models;
}

struct CameraFixture {
    ecs::World world;
    FakePhysicsWorld physics;
    GlobalContext global;
    EntityId camera;

    CameraFixture() {
        camera = world.createEntity();
        world.set(camera, Position{glm::vec3(0.0f), glm::quat(1.0f, 0.0f, 0.0f, 0.0f)});
        world.set(camera, ModelName{"camgrn"});
        AIAwareDelay delay;
        delay.toTwo = 2000;         // one second to Low, one more to Moderate
        delay.toThree = 1000;
        delay.twoReuse = 1000;
        delay.threeReuse = 1000;
        delay.ignoreRange = 1000;
        world.set(camera, delay);
        world.player().position = glm::vec3(0.0f, 0.0f, 5.0f);
    }

    ScriptContext context() { return ScriptContext{world, physics, global}; }

    void advance(float dt) {
        world.time().elapsed = dt;
        world.time().total += dt;
    }
};

// An AI at the origin facing +Z, one second of sight per alertness level
struct AIFixture {
    ecs::World world;
    FakePhysicsWorld physics;
    GlobalContext global;
    EntityId entity;

    AIFixture() {
        entity = world.createEntity();
        world.set(entity, Position{glm::vec3(0.0f), glm::quat(1.0f, 0.0f, 0.0f, 0.0f)});
        AIAwareDelay delay;
        delay.toTwo = 2000;
        delay.toThree = 1000;
        delay.twoReuse = 1000;
        delay.threeReuse = 1000;
        delay.ignoreRange = 1000;
        world.set(entity, delay);
        world.player().position = glm::vec3(0.0f, 0.0f, 5.0f);
    }

    ScriptContext context() { return ScriptContext{world, physics, global}; }

    void advance(float dt) {
        world.time().elapsed = dt;
        world.time().total += dt;
    }

    void addLink(Link link) {
        Links links;
        if (const auto* existing = world.tryGet<Links>(entity)) {
            links = *existing;
        }
        links.links.push_back(std::move(link));
        world.set(entity, std::move(links));
    }

    void blockSight() {
        BodyDesc wall;
        wall.position = glm::vec3(0.0f, 0.0f, 2.5f);
        wall.halfExtents = glm::vec3(5.0f, 5.0f, 0.1f);
        wall.motion = BodyMotion::Static;
        wall.group = CollisionGroup::WORLD;
        physics.addBody(world.createEntity(), wall);
    }
};

}  // namespace

TEST_SUITE("CameraModels") {
    TEST_CASE("derives alert models from the base name") {
        CameraModels grn = CameraModels::derive("camgrn");
        CHECK(grn.yellow == "camyel");
        CHECK(grn.red == "camred");

        CameraModels green = CameraModels::derive("xgreen.bin");
        CHECK(green.yellow == "xyellow.bin");
        CHECK(green.red == "xred.bin");

        CameraModels other = CameraModels::derive("lens");
        CHECK(other.green == "lens");
        CHECK(other.yellow == "lens_yel");
        CHECK(other.red == "lens_red");
    }

    TEST_CASE("maps levels to models") {
        CameraModels models = CameraModels::derive("camgrn");
        CHECK(models.forLevel(AIAlertLevel::Lowest) == "camgrn");
        CHECK(models.forLevel(AIAlertLevel::Low) == "camyel");
        CHECK(models.forLevel(AIAlertLevel::Moderate) == "camyel");
        CHECK(models.forLevel(AIAlertLevel::High) == "camred");
    }
}

TEST_SUITE("CameraAI") {
    TEST_CASE("escalates while the player is in view and swaps models") {
        CameraFixture fixture;
        CameraAI camera;
        ScriptContext ctx = fixture.context();

        Effect init = camera.initialize(fixture.camera, ctx);
        CHECK(modelChanges(init) == std::vector<std::string>{"camgrn"});

        fixture.advance(1.0f);
        Effect first = camera.update(fixture.camera, ctx);
        CHECK(camera.alertness().currentLevel == AIAlertLevel::Low);
        CHECK(modelChanges(first) == std::vector<std::string>{"camyel"});

        fixture.advance(1.0f);
        Effect second = camera.update(fixture.camera, ctx);
        CHECK(camera.alertness().currentLevel == AIAlertLevel::Moderate);
        CHECK(modelChanges(second).empty());

        fixture.advance(1.0f);
        Effect third = camera.update(fixture.camera, ctx);
        CHECK(camera.alertness().currentLevel == AIAlertLevel::High);
        CHECK(modelChanges(third) == std::vector<std::string>{"camred"});
    }

    TEST_CASE("level geometry hides the player and the camera relaxes") {
        CameraFixture fixture;
        CameraAI camera;
        ScriptContext ctx = fixture.context();
        camera.initialize(fixture.camera, ctx);

        fixture.advance(1.0f);
        camera.update(fixture.camera, ctx);
        REQUIRE(camera.alertness().currentLevel == AIAlertLevel::Low);

        BodyDesc wall;
        wall.position = glm::vec3(0.0f, 0.0f, 2.5f);
        wall.halfExtents = glm::vec3(5.0f, 5.0f, 0.1f);
        wall.motion = BodyMotion::Static;
        wall.group = CollisionGroup::WORLD;
        fixture.physics.addBody(fixture.world.createEntity(), wall);

        fixture.advance(1.0f);
        Effect relaxed = camera.update(fixture.camera, ctx);
        CHECK(camera.alertness().currentLevel == AIAlertLevel::Lowest);
        CHECK(modelChanges(relaxed) == std::vector<std::string>{"camgrn"});
    }

    TEST_CASE("every update drives the lens joint") {
        CameraFixture fixture;
        CameraAI camera;
        ScriptContext ctx = fixture.context();
        camera.initialize(fixture.camera, ctx);

        fixture.advance(0.1f);
        bool sawJoint = false;
        for (const auto& effect : flatten(camera.update(fixture.camera, ctx))) {
            if (const auto* joint = effect.as<Effects::SetJointTransform>()) {
                CHECK(joint->joint == 1);
                sawJoint = true;
            }
        }
        CHECK(sawJoint);
    }
}

TEST_SUITE("Behavior") {
    TEST_CASE("scripted sequence walks its actions") {
        ecs::World world;
        FakePhysicsWorld physics;
        GlobalContext global;
        ScriptContext ctx{world, physics, global};
        EntityId monster = world.createEntity();

        std::vector<ScriptedAction> actions = {
            {ScriptedAction::Type::PlayMotion, "Stand,Search", 0.0f},
            {ScriptedAction::Type::Wait, "", 1.0f},
            {ScriptedAction::Type::Frob, "lever", 0.0f},
            {ScriptedAction::Type::PlayMotion, "attack", 0.0f},
        };
        Behavior behavior = ScriptedSequenceBehavior(actions);

        auto items = behavior.animation();
        REQUIRE(items.size() == 2);
        CHECK(items[0].tag == "stand");
        CHECK(items[1].tag == "search");

        CHECK(behavior.nextBehavior(ctx, monster).kind == NextBehavior::Kind::Stay);
        CHECK(behavior.animation()[0].tag == "idlegesture");

        world.time().elapsed = 0.5f;
        CHECK_FALSE(behavior.steer(0.0f, ctx, monster).has_value());
        CHECK(behavior.nextBehavior(ctx, monster).kind == NextBehavior::Kind::Stay);
        CHECK(behavior.as<ScriptedSequenceBehavior>()->index == 1);

        behavior.steer(0.0f, ctx, monster);
        CHECK(behavior.nextBehavior(ctx, monster).kind == NextBehavior::Kind::Stay);
        // The frob is skipped
        CHECK(behavior.as<ScriptedSequenceBehavior>()->index == 3);
        CHECK(behavior.animation()[0].tag == "attack");

        NextBehavior done = behavior.nextBehavior(ctx, monster);
        REQUIRE(done.kind == NextBehavior::Kind::Next);
        CHECK(done.next->is<IdleBehavior>());
    }

    TEST_CASE("chase and melee hand over at melee range") {
        ecs::World world;
        FakePhysicsWorld physics;
        GlobalContext global;
        ScriptContext ctx{world, physics, global};
        EntityId monster = world.createEntity();
        world.set(monster, Position{glm::vec3(0.0f), glm::quat(1.0f, 0.0f, 0.0f, 0.0f)});

        world.player().position = glm::vec3(0.0f, 0.0f, MELEE_RANGE * 0.5f);
        Behavior chase = ChaseBehavior{true};
        NextBehavior toMelee = chase.nextBehavior(ctx, monster);
        REQUIRE(toMelee.kind == NextBehavior::Kind::Next);
        CHECK(toMelee.next->is<MeleeAttackBehavior>());

        Behavior melee = MeleeAttackBehavior{};
        CHECK(melee.nextBehavior(ctx, monster).kind == NextBehavior::Kind::Stay);

        world.player().position = glm::vec3(0.0f, 0.0f, MELEE_RANGE * 3.0f);
        NextBehavior toChase = melee.nextBehavior(ctx, monster);
        REQUIRE(toChase.kind == NextBehavior::Kind::Next);
        REQUIRE(toChase.next->is<ChaseBehavior>());
        CHECK(toChase.next->as<ChaseBehavior>()->pursuingAttack);

        Behavior casual = ChaseBehavior{false};
        world.player().position = glm::vec3(0.0f);
        CHECK(casual.nextBehavior(ctx, monster).kind == NextBehavior::Kind::NoOpinion);
    }

    TEST_CASE("wander turns around after a collision") {
        ecs::World world;
        FakePhysicsWorld physics;
        GlobalContext global;
        ScriptContext ctx{world, physics, global};
        EntityId monster = world.createEntity();
        world.set(monster, Position{glm::vec3(0.0f), glm::quat(1.0f, 0.0f, 0.0f, 0.0f)});

        Behavior wander = WanderBehavior{};
        wander.handleMessage(monster, ctx, MessagePayload::Collided{world.createEntity()});
        auto steering = wander.steer(0.0f, ctx, monster);
        REQUIRE(steering.has_value());
        CHECK(std::abs(steering->first.desiredHeading) == doctest::Approx(180.0f));
    }

    TEST_CASE("capabilities per behavior") {
        CHECK(Behavior(WanderBehavior{}).isLocomotion());
        CHECK(Behavior(ChaseBehavior{}).isLocomotion());
        CHECK_FALSE(Behavior(MeleeAttackBehavior{}).isLocomotion());
        CHECK(Behavior(MeleeAttackBehavior{}).turnSpeed() == doctest::Approx(270.0f));
        CHECK(Behavior(IdleBehavior{}).turnSpeed() == doctest::Approx(0.0f));
        CHECK(isAttackAnimation(Behavior(RangedAttackBehavior{}).animation()));
        CHECK_FALSE(isAttackAnimation(Behavior(DeadBehavior{}).animation()));
        CHECK(std::string(Behavior(DeadBehavior{}).name()) == "Dead");
    }
}

TEST_SUITE("AnimatedMonsterAI") {
    TEST_CASE("alertness picks the behavior") {
        AIFixture f;
        AnimatedMonsterAI monster;
        ScriptContext ctx = f.context();

        Effect init = monster.initialize(f.entity, ctx);
        CHECK(monster.behavior().is<IdleBehavior>());
        auto queued = effectsOf<Effects::QueueAnimationBySchema>(init);
        REQUIRE(queued.size() == 1);
        CHECK(queued[0].items[0].tag == "idlegesture");

        f.advance(1.0f);
        monster.update(f.entity, ctx);
        CHECK(monster.alertness().currentLevel == AIAlertLevel::Low);
        CHECK(monster.behavior().is<WanderBehavior>());

        f.advance(1.0f);
        monster.update(f.entity, ctx);
        CHECK(monster.alertness().currentLevel == AIAlertLevel::Moderate);
        CHECK(monster.behavior().is<ChaseBehavior>());

        f.advance(1.0f);
        Effect high = monster.update(f.entity, ctx);
        CHECK(monster.alertness().currentLevel == AIAlertLevel::High);
        CHECK(monster.behavior().is<MeleeAttackBehavior>());
        queued = effectsOf<Effects::QueueAnimationBySchema>(high);
        REQUIRE(queued.size() == 1);
        CHECK(queued[0].items[0].tag == "meleecombat");
    }

    TEST_CASE("armed monsters attack from range") {
        AIFixture f;
        Link projectile;
        projectile.kind = LinkKind::AIProjectile;
        projectile.toTemplateId = -40;
        f.addLink(projectile);

        AnimatedMonsterAI monster;
        ScriptContext ctx = f.context();
        monster.initialize(f.entity, ctx);
        for (int i = 0; i < 3; ++i) {
            f.advance(1.0f);
            monster.update(f.entity, ctx);
        }
        CHECK(monster.alertness().currentLevel == AIAlertLevel::High);
        CHECK(monster.behavior().is<RangedAttackBehavior>());
    }

    TEST_CASE("watch objects start their sequence once") {
        AIFixture f;
        EntityId statue = f.world.createEntity();
        f.world.set(statue, Position{glm::vec3(0.0f, 0.0f, 6.0f), glm::quat(1.0f, 0.0f, 0.0f, 0.0f)});

        Link watch;
        watch.kind = LinkKind::AIWatchObj;
        watch.toEntity = statue;
        watch.radius = 2.0f;
        watch.actions = {{ScriptedAction::Type::PlayMotion, "Stand,Search", 0.0f}};
        f.addLink(watch);

        AnimatedMonsterAI monster;
        ScriptContext ctx = f.context();
        monster.initialize(f.entity, ctx);

        f.advance(0.1f);
        Effect triggered = monster.update(f.entity, ctx);
        REQUIRE(monster.behavior().is<ScriptedSequenceBehavior>());
        auto queued = effectsOf<Effects::QueueAnimationBySchema>(triggered);
        REQUIRE(queued.size() == 1);
        CHECK(queued[0].items[0].tag == "stand");

        f.advance(0.1f);
        Effect again = monster.update(f.entity, ctx);
        CHECK(effectsOf<Effects::QueueAnimationBySchema>(again).empty());
        CHECK(monster.behavior().is<ScriptedSequenceBehavior>());
    }

    TEST_CASE("turning is limited by the behavior's turn speed") {
        AIFixture f;
        AIAlertCap cap;
        cap.minLevel = AIAlertLevel::Moderate;
        cap.maxLevel = AIAlertLevel::Moderate;
        f.world.set(f.entity, cap);

        AnimatedMonsterAI monster;
        ScriptContext ctx = f.context();
        monster.initialize(f.entity, ctx);
        REQUIRE(monster.behavior().is<ChaseBehavior>());
        CHECK(monster.heading() == doctest::Approx(0.0f));

        // Player off to the side: a quarter turn away
        f.world.player().position = glm::vec3(5.0f, 0.0f, 0.0f);
        const float maxStep = Behavior(ChaseBehavior{}).turnSpeed() * 0.1f;

        f.advance(0.1f);
        Effect first = monster.update(f.entity, ctx);
        CHECK(monster.heading() == doctest::Approx(maxStep));
        CHECK(effectsOf<Effects::SetRotation>(first).size() == 1);

        f.advance(0.1f);
        monster.update(f.entity, ctx);
        CHECK(monster.heading() == doctest::Approx(2.0f * maxStep));

        // A long step stops at the target instead of overshooting
        f.advance(0.9f);
        monster.update(f.entity, ctx);
        CHECK(monster.heading() == doctest::Approx(90.0f));
    }

    TEST_CASE("the tickle ray begins and ends sensor contact") {
        AIFixture f;
        AnimatedMonsterAI monster;
        ScriptContext ctx = f.context();
        monster.initialize(f.entity, ctx);

        // In front of and below the monster, across the downward ray
        EntityId plate = f.world.createEntity();
        BodyDesc sensor;
        sensor.position = glm::vec3(0.0f, -1.25f, 1.56f);
        sensor.halfExtents = glm::vec3(0.3f);
        sensor.isSensor = true;
        sensor.motion = BodyMotion::Static;
        sensor.group = CollisionGroup::SENSOR;
        f.physics.addBody(plate, sensor);

        f.advance(0.1f);
        auto began = effectsOf<Effects::Send>(monster.update(f.entity, ctx));
        REQUIRE(began.size() == 1);
        CHECK(began[0].message.to == plate);
        REQUIRE(std::holds_alternative<MessagePayload::SensorBeginIntersect>(began[0].message.payload));
        CHECK(std::get<MessagePayload::SensorBeginIntersect>(began[0].message.payload).with == f.entity);

        f.advance(0.1f);
        CHECK(effectsOf<Effects::Send>(monster.update(f.entity, ctx)).empty());

        f.physics.removeBody(plate);
        f.advance(0.1f);
        auto ended = effectsOf<Effects::Send>(monster.update(f.entity, ctx));
        REQUIRE(ended.size() == 1);
        CHECK(ended[0].message.to == plate);
        CHECK(std::holds_alternative<MessagePayload::SensorEndIntersect>(ended[0].message.payload));
    }
}

TEST_SUITE("TurretAI") {
    TEST_CASE("opens while the player is in sight, fires once a second, then closes") {
        AIFixture f;
        Link weapon;
        weapon.kind = LinkKind::AIRangedWeapon;
        weapon.toTemplateId = -41;
        f.addLink(weapon);

        TurretAI turret;
        ScriptContext ctx = f.context();
        turret.initialize(f.entity, ctx);
        CHECK(turret.state() == TurretAI::State::Closed);
        CHECK(turret.openAmount() == doctest::Approx(0.0f));

        // Each step covers half of OPEN_TIME
        const float step = TurretAI::OPEN_TIME / 2.0f;
        f.advance(step);
        Effect activate = turret.update(f.entity, ctx);
        CHECK(turret.state() == TurretAI::State::Opening);
        CHECK(effectsOf<Effects::PlayEnvironmentalSound>(activate).size() == 1);

        f.advance(step);
        Effect opening = turret.update(f.entity, ctx);
        CHECK(turret.openAmount() == doctest::Approx(0.5f));
        CHECK(effectsOf<Effects::CreateEntity>(opening).empty());

        f.advance(step);
        turret.update(f.entity, ctx);
        CHECK(turret.state() == TurretAI::State::Opening);

        f.advance(step);
        Effect open = turret.update(f.entity, ctx);
        REQUIRE(turret.state() == TurretAI::State::Open);
        // No weapon entity yet, so the first shot spawns the proxy
        auto shots = effectsOf<Effects::CreateEntity>(open);
        REQUIRE(shots.size() == 1);
        CHECK(shots[0].templateId == -41);

        f.advance(0.5f);
        CHECK(effectsOf<Effects::CreateEntity>(turret.update(f.entity, ctx)).empty());
        f.advance(0.4f);
        CHECK(effectsOf<Effects::CreateEntity>(turret.update(f.entity, ctx)).empty());
        f.advance(0.2f);
        CHECK(effectsOf<Effects::CreateEntity>(turret.update(f.entity, ctx)).size() == 1);

        f.blockSight();
        f.advance(step);
        Effect deactivate = turret.update(f.entity, ctx);
        CHECK(turret.state() == TurretAI::State::Closing);
        CHECK(effectsOf<Effects::PlayEnvironmentalSound>(deactivate).size() == 1);
        CHECK(effectsOf<Effects::CreateEntity>(deactivate).empty());

        for (int i = 0; i < 3; ++i) {
            f.advance(step);
            turret.update(f.entity, ctx);
        }
        CHECK(turret.state() == TurretAI::State::Closed);
        CHECK(turret.openAmount() == doctest::Approx(0.0f));
    }
}
