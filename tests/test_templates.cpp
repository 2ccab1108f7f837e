#include <doctest/doctest.h>
#include <glm/gtc/matrix_transform.hpp>

#include "FakePhysicsWorld.h"
#include "mission/CreatureDefinitions.h"
#include "mission/EntityCreator.h"
#include "mission/HeldItemState.h"
#include "mission/HitBoxManager.h"
#include "mission/ParticleEmitter.h"
#include "mission/PropertySerialization.h"
#include "mission/TemplateLibrary.h"
#include "scripts/FastProjectile.h"
#include "scripts/ScriptWorld.h"
#include "AIProperties.h"

#include <cstdio>
#include <filesystem>

using json = nlohmann::json;

namespace {

bool approxEqual(const glm::vec3& a, const glm::vec3& b, float eps = 0.001f) {
    return glm::all(glm::lessThan(glm::abs(a - b), glm::vec3(eps)));
}

const char* GAMESYS = R"({
  "templates": [
    { "id": -1, "name": "Physical", "properties": {
        "PhysDimensions": { "half_extents": [2.5, 2.5, 2.5] }, "HitPoints": 10, "ModelName": "box" } },
    { "id": -2, "name": "Crate", "parent": -1, "properties": { "HitPoints": 20, "SymName": "crate" },
      "links": [ { "kind": "switchlink", "to": 7 }, { "kind": "Corpse", "to": -1 }, { "kind": "Teleporter", "to": 3 } ] },
    { "id": -3, "name": "Tripwire", "properties": { "PhysDimensions": { "half_extents": [5, 5, 5], "sensor": true } } },
    { "id": -4, "name": "Bullet", "properties": {
        "PhysInitialVelocity": [200, 0, 0], "PhysDimensions": { "half_extents": [0.5, 0.5, 0.5] } } },
    { "id": -5, "name": "Grenade", "properties": {
        "PhysInitialVelocity": [10, 0, 0], "PhysDimensions": { "half_extents": [0.5, 0.5, 0.5] } } },
    { "id": -6, "name": "Loop A", "parent": -7, "properties": { "HitPoints": 1 } },
    { "id": -7, "name": "Loop B", "parent": -6, "properties": { "ModelName": "loop" } },
    { "id": 7, "name": "Door 7", "properties": { "ModelName": "door" } }
  ]
})";

struct CreatorFixture {
    ecs::World world;
    FakePhysicsWorld physics;
    ScriptWorld scripts;
    GlobalContext global;
    EntityCreator creator{world, physics, scripts, global};

    CreatorFixture() {
        auto library = TemplateLibrary::loadFromString(GAMESYS);
        REQUIRE(library.has_value());
        global.templates = std::make_shared<const TemplateLibrary>(std::move(*library));
    }
};

}  // namespace

TEST_SUITE("TemplateLibrary") {
    TEST_CASE("loads templates and skips unknown link kinds") {
        auto library = TemplateLibrary::loadFromString(GAMESYS);
        REQUIRE(library.has_value());
        CHECK(library->size() == 8);

        const auto* crate = library->find(-2);
        REQUIRE(crate != nullptr);
        REQUIRE(crate->parent.has_value());
        CHECK(*crate->parent == -1);
        REQUIRE(crate->links.size() == 2);
        CHECK(crate->links[0].kind == LinkKind::SwitchLink);
        CHECK(crate->links[0].toTemplateId == 7);
        CHECK(crate->links[1].kind == LinkKind::Corpse);
    }

    TEST_CASE("lookup by name ignores case") {
        auto library = TemplateLibrary::loadFromString(GAMESYS);
        REQUIRE(library.has_value());
        const auto* t = library->findByName("tRIPWIRE");
        REQUIRE(t != nullptr);
        CHECK(t->id == -3);
        CHECK(library->findByName("nothing") == nullptr);
        CHECK(library->find(12345) == nullptr);
    }

    TEST_CASE("child properties override inherited ones") {
        auto library = TemplateLibrary::loadFromString(GAMESYS);
        REQUIRE(library.has_value());
        json props = library->resolvedProperties(-2);
        CHECK(props["HitPoints"] == 20);
        CHECK(props["ModelName"] == "box");
        CHECK(props["SymName"] == "crate");
        CHECK(props.contains("PhysDimensions"));
    }

    TEST_CASE("parent cycles terminate") {
        auto library = TemplateLibrary::loadFromString(GAMESYS);
        REQUIRE(library.has_value());
        json props = library->resolvedProperties(-6);
        CHECK(props["HitPoints"] == 1);
        CHECK(props["ModelName"] == "loop");
        CHECK(library->resolvedProperties(999).empty());
    }

    TEST_CASE("malformed json") {
        CHECK_FALSE(TemplateLibrary::loadFromString("{\"templates\": [{}]}").has_value());
        CHECK_FALSE(TemplateLibrary::loadFromString("[").has_value());
    }

    TEST_CASE("link json carries scripted actions") {
        auto link = linkFromJson(json::parse(R"({
            "kind": "AIWatchObj", "to": 3, "radius": 12.5,
            "actions": [ { "type": "Wait", "value": 2 }, { "type": "Dance" } ] })"));
        REQUIRE(link.has_value());
        CHECK(link->kind == LinkKind::AIWatchObj);
        CHECK(link->radius == doctest::Approx(12.5f));
        REQUIRE(link->actions.size() == 2);
        CHECK(link->actions[0].type == ScriptedAction::Type::Wait);
        CHECK(link->actions[0].value == doctest::Approx(2.0f));
        CHECK(link->actions[1].type == ScriptedAction::Type::Unknown);

        CHECK_FALSE(linkFromJson(json::parse(R"({"kind": "Bogus"})")).has_value());
    }
}

TEST_SUITE("PropertySerialization") {
    TEST_CASE("apply then snapshot keeps the known keys") {
        ecs::World world;
        EntityId e = world.createEntity();
        json props = json::parse(R"({
            "ModelName": "turlas", "HitPoints": 40, "Scale": [1, 2, 3],
            "ClassTags": { "creaturetype": "camera" }, "Scripts": ["TrapRouter"],
            "PhysDimensions": { "half_extents": [1, 1, 1], "static": true },
            "AIAlertCap": { "max": 2, "min": 1 },
            "RenderType": "NotRendered", "SomethingElse": 3 })");
        PropertySerialization::apply(world, e, props);

        REQUIRE(world.tryGet<ModelName>(e) != nullptr);
        CHECK(world.tryGet<ModelName>(e)->name == "turlas");
        CHECK(world.tryGet<HitPoints>(e)->hitPoints == 40);
        CHECK(approxEqual(world.tryGet<Scale>(e)->value, glm::vec3(1, 2, 3)));
        REQUIRE(world.tryGet<ClassTags>(e) != nullptr);
        CHECK(world.tryGet<ClassTags>(e)->tags.front().second == "camera");
        CHECK(world.tryGet<PhysDimensions>(e)->isStatic);
        CHECK_FALSE(world.tryGet<PhysDimensions>(e)->isSensor);
        CHECK(world.tryGet<RenderType>(e)->kind == RenderType::Kind::NotRendered);
        REQUIRE(world.tryGet<AIAlertCap>(e) != nullptr);
        CHECK(world.tryGet<AIAlertCap>(e)->maxLevel == AIAlertLevel::Moderate);

        json snap = PropertySerialization::snapshot(world, e);
        CHECK(snap["ModelName"] == "turlas");
        CHECK(snap["HitPoints"] == 40);
        CHECK(snap["RenderType"] == "NotRendered");
        CHECK(snap["ClassTags"]["creaturetype"] == "camera");
        CHECK(snap["AIAlertCap"]["max"] == 2);
        CHECK_FALSE(snap.contains("SomethingElse"));
    }

    TEST_CASE("bad values are skipped without dropping the rest") {
        ecs::World world;
        EntityId e = world.createEntity();
        PropertySerialization::apply(world, e, json::parse(R"({"HitPoints": "lots", "ModelName": "ok"})"));
        CHECK(world.tryGet<HitPoints>(e) == nullptr);
        REQUIRE(world.tryGet<ModelName>(e) != nullptr);
        CHECK(world.tryGet<ModelName>(e)->name == "ok");
    }

    TEST_CASE("non-object input is ignored") {
        ecs::World world;
        EntityId e = world.createEntity();
        PropertySerialization::apply(world, e, json::array({1, 2}));
        CHECK(PropertySerialization::snapshot(world, e).empty());
    }
}

TEST_SUITE("EntityCreator") {
    TEST_CASE("creates the entity with inherited properties and a body") {
        CreatorFixture f;
        auto e = f.creator.create(-2, glm::vec3(1.0f, 2.0f, 3.0f), glm::quat(1.0f, 0.0f, 0.0f, 0.0f));
        REQUIRE(e.has_value());
        CHECK(f.world.tryGet<TemplateId>(*e)->id == -2);
        CHECK(f.world.tryGet<HitPoints>(*e)->hitPoints == 20);
        CHECK(approxEqual(f.world.tryGet<Position>(*e)->position, glm::vec3(1.0f, 2.0f, 3.0f)));

        const auto* body = f.physics.find(*e);
        REQUIRE(body != nullptr);
        CHECK(approxEqual(body->desc.halfExtents, glm::vec3(1.0f)));
        CHECK(body->desc.motion == BodyMotion::Dynamic);
        CHECK(body->desc.group == CollisionGroup::ENTITY);
    }

    TEST_CASE("root transform is applied before the local placement") {
        CreatorFixture f;
        glm::mat4 root = glm::translate(glm::mat4(1.0f), glm::vec3(10.0f, 0.0f, 0.0f));
        auto e = f.creator.create(7, glm::vec3(0.0f, 1.0f, 0.0f), glm::quat(1.0f, 0.0f, 0.0f, 0.0f), root);
        REQUIRE(e.has_value());
        CHECK(approxEqual(f.world.tryGet<Position>(*e)->position, glm::vec3(10.0f, 1.0f, 0.0f)));
        CHECK_FALSE(f.physics.hasBody(*e));
    }

    TEST_CASE("overrides win over template properties") {
        CreatorFixture f;
        auto e = f.creator.create(-2, glm::vec3(0.0f), glm::quat(1.0f, 0.0f, 0.0f, 0.0f), glm::mat4(1.0f),
                                  json{{"HitPoints", 3}});
        REQUIRE(e.has_value());
        CHECK(f.world.tryGet<HitPoints>(*e)->hitPoints == 3);
    }

    TEST_CASE("links bind to live objects only") {
        CreatorFixture f;
        auto door = f.creator.create(7, glm::vec3(0.0f), glm::quat(1.0f, 0.0f, 0.0f, 0.0f));
        auto crate = f.creator.create(-2, glm::vec3(0.0f), glm::quat(1.0f, 0.0f, 0.0f, 0.0f));
        REQUIRE(door.has_value());
        REQUIRE(crate.has_value());

        auto switches = f.world.linksOf(*crate, LinkKind::SwitchLink);
        REQUIRE(switches.size() == 1);
        REQUIRE(switches[0].toEntity.has_value());
        CHECK(*switches[0].toEntity == *door);

        auto corpses = f.world.linksOf(*crate, LinkKind::Corpse);
        REQUIRE(corpses.size() == 1);
        CHECK_FALSE(corpses[0].toEntity.has_value());
        CHECK(corpses[0].toTemplateId == -1);

        auto targets = f.world.switchLinkTargets(*crate);
        REQUIRE(targets.size() == 1);
        CHECK(targets[0] == *door);
    }

    TEST_CASE("sensor bodies are static") {
        CreatorFixture f;
        auto e = f.creator.create(-3, glm::vec3(0.0f), glm::quat(1.0f, 0.0f, 0.0f, 0.0f));
        REQUIRE(e.has_value());
        const auto* body = f.physics.find(*e);
        REQUIRE(body != nullptr);
        CHECK(body->desc.isSensor);
        CHECK(body->desc.motion == BodyMotion::Static);
        CHECK(body->desc.group == CollisionGroup::SENSOR);
    }

    TEST_CASE("fast projectiles get a script instead of a body") {
        CreatorFixture f;
        auto bullet = f.creator.create(-4, glm::vec3(0.0f), glm::quat(1.0f, 0.0f, 0.0f, 0.0f));
        REQUIRE(bullet.has_value());
        CHECK_FALSE(f.physics.hasBody(*bullet));
        CHECK(f.scripts.find<FastProjectile>(*bullet) != nullptr);
        CHECK_FALSE(f.creator.registerPhysics(*bullet));
    }

    TEST_CASE("slow projectiles launch with the boosted velocity") {
        CreatorFixture f;
        auto grenade = f.creator.create(-5, glm::vec3(0.0f), glm::quat(1.0f, 0.0f, 0.0f, 0.0f));
        REQUIRE(grenade.has_value());
        CHECK(f.scripts.find<FastProjectile>(*grenade) == nullptr);
        const auto* body = f.physics.find(*grenade);
        REQUIRE(body != nullptr);
        CHECK(approxEqual(body->velocity, glm::vec3(0.0f, 0.0f, 6.0f)));
    }

    TEST_CASE("projectiles launch along the creation root, not their own orientation") {
        CreatorFixture f;
        const glm::quat sideways = glm::angleAxis(glm::radians(90.0f), glm::vec3(0.0f, 1.0f, 0.0f));
        const glm::mat4 root = glm::rotate(glm::mat4(1.0f), glm::radians(90.0f), glm::vec3(0.0f, 1.0f, 0.0f));

        auto grenade = f.creator.create(-5, glm::vec3(0.0f), sideways);
        REQUIRE(grenade.has_value());
        CHECK(approxEqual(f.physics.find(*grenade)->velocity, glm::vec3(0.0f, 0.0f, 6.0f)));

        auto turned = f.creator.create(-5, glm::vec3(0.0f), sideways, root);
        REQUIRE(turned.has_value());
        CHECK(approxEqual(f.physics.find(*turned)->velocity, glm::vec3(6.0f, 0.0f, 0.0f)));

        // Fast projectiles keep the authored speed
        auto bullet = f.creator.create(-4, glm::vec3(0.0f), sideways, root);
        REQUIRE(bullet.has_value());
        const auto* script = f.scripts.find<FastProjectile>(*bullet);
        REQUIRE(script != nullptr);
        CHECK(approxEqual(script->velocity(), glm::vec3(200.0f, 0.0f, 0.0f), 0.01f));
    }

    TEST_CASE("dropped items get a body without a launch") {
        CreatorFixture f;
        auto grenade = f.creator.create(-5, glm::vec3(0.0f), glm::quat(1.0f, 0.0f, 0.0f, 0.0f));
        REQUIRE(grenade.has_value());
        f.physics.removeBody(*grenade);
        CHECK(f.creator.registerPhysics(*grenade));
        CHECK(approxEqual(f.physics.find(*grenade)->velocity, glm::vec3(0.0f)));
    }

    TEST_CASE("unknown templates") {
        CreatorFixture f;
        CHECK_FALSE(f.creator.create(4242, glm::vec3(0.0f), glm::quat(1.0f, 0.0f, 0.0f, 0.0f)).has_value());
        CHECK_FALSE(f.creator.createByName("nothing", glm::vec3(0.0f), glm::quat(1.0f, 0.0f, 0.0f, 0.0f)).has_value());
        CHECK(f.creator.createByName("crate", glm::vec3(0.0f), glm::quat(1.0f, 0.0f, 0.0f, 0.0f)).has_value());
        CHECK(f.world.entityCount() == 1);
    }
}

TEST_SUITE("CreatureDefinitions") {
    TEST_CASE("joint map and hit-boxes") {
        auto defs = CreatureDefinitions::loadFromString(R"({
          "creatures": [
            { "type": 2, "name": "Turret", "actor_type": 5, "joint_map": [0, 3, -1],
              "hit_boxes": [ { "joint": 1, "half_extents": [1, 2, 1] }, { "joint": 2 } ] } ] })");
        REQUIRE(defs.has_value());
        const auto* turret = defs->find(2);
        REQUIRE(turret != nullptr);
        CHECK(turret->actorType == 5);
        CHECK(turret->mappedJoint(1) == std::optional<JointId>(3));
        CHECK_FALSE(turret->mappedJoint(2).has_value());
        CHECK_FALSE(turret->mappedJoint(3).has_value());
        CHECK_FALSE(turret->mappedJoint(-1).has_value());
        REQUIRE(turret->hitBoxes.size() == 2);
        CHECK(approxEqual(turret->hitBoxes[0].halfExtents, glm::vec3(1.0f, 2.0f, 1.0f)));
        CHECK(approxEqual(turret->hitBoxes[1].halfExtents, glm::vec3(0.25f)));
        CHECK(defs->find(99) == nullptr);
    }

    TEST_CASE("duplicate types replace") {
        CreatureDefinitions defs;
        defs.add(CreatureDefinition{1, "first"});
        defs.add(CreatureDefinition{1, "second"});
        CHECK(defs.size() == 1);
        CHECK(defs.find(1)->name == "second");
    }
}

TEST_SUITE("HeldItemState") {
    TEST_CASE("capture snapshots the held entities") {
        ecs::World world;
        EntityId wrench = world.createEntity();
        world.set(wrench, TemplateId{-50});
        world.set(wrench, HitPoints{5});
        EntityId untemplated = world.createEntity();
        world.player().leftHand = wrench;
        world.player().rightHand = untemplated;

        HeldItemState state = HeldItemState::capture(world);
        REQUIRE(state.leftHand.has_value());
        CHECK(state.leftHand->templateId == -50);
        CHECK(state.leftHand->properties["HitPoints"] == 5);
        CHECK_FALSE(state.rightHand.has_value());
        CHECK_FALSE(state.inventory.has_value());
        CHECK_FALSE(state.empty());
    }

    TEST_CASE("json form") {
        HeldItemState state;
        state.rightHand = HeldItem{-12, json{{"KeyCard", "red"}}};
        json j = state.toJson();
        CHECK(j["left_hand"].is_null());
        CHECK(j["right_hand"]["template_id"] == -12);

        auto back = HeldItemState::fromJson(j);
        REQUIRE(back.has_value());
        REQUIRE(back->rightHand.has_value());
        CHECK(back->rightHand->properties["KeyCard"] == "red");
        CHECK_FALSE(back->leftHand.has_value());

        CHECK_FALSE(HeldItemState::fromJson(json{{"left_hand", {{"properties", {}}}}}).has_value());
    }

    TEST_CASE("file save and load") {
        auto path = (std::filesystem::temp_directory_path() / "darkcore_held_items_test.json").string();
        HeldItemState state;
        state.inventory = HeldItem{-3, json::object()};
        REQUIRE(state.saveToFile(path));
        auto loaded = HeldItemState::loadFromFile(path);
        std::remove(path.c_str());
        REQUIRE(loaded.has_value());
        REQUIRE(loaded->inventory.has_value());
        CHECK(loaded->inventory->templateId == -3);

        CHECK_FALSE(HeldItemState::loadFromFile("/nonexistent/held.json").has_value());
    }
}

TEST_SUITE("ParticleEmitter") {
    TEST_CASE("releases particles over the launch time") {
        ParticleGroup group;
        group.count = 4;
        group.launchTime = 1.0f;
        ParticleLaunchInfo launch;
        ParticleEmitter emitter(group, launch);

        CHECK(emitter.aliveCount() == 0);
        emitter.update(0.1f, glm::mat4(1.0f));
        CHECK(emitter.aliveCount() == 1);
        emitter.update(0.2f, glm::mat4(1.0f));
        CHECK(emitter.aliveCount() == 2);
        emitter.update(1.0f, glm::mat4(1.0f));
        CHECK(emitter.aliveCount() == 4);
    }

    TEST_CASE("positions follow the entity transform") {
        ParticleGroup group;
        group.count = 3;
        ParticleLaunchInfo launch;
        launch.locMin = launch.locMax = glm::vec3(2.5f, 0.0f, 0.0f);
        launch.minTime = launch.maxTime = 10.0f;
        ParticleEmitter emitter(group, launch);

        emitter.update(0.1f, glm::translate(glm::mat4(1.0f), glm::vec3(0.0f, 1.0f, 0.0f)));
        REQUIRE(emitter.worldPositions().size() == 3);
        for (const auto& p : emitter.worldPositions()) {
            CHECK(approxEqual(p, glm::vec3(1.0f, 1.0f, 0.0f)));
        }
    }

    TEST_CASE("gravity accelerates live particles") {
        ParticleGroup group;
        group.count = 1;
        group.gravity = glm::vec3(0.0f, -25.0f, 0.0f);
        ParticleLaunchInfo launch;
        launch.minTime = launch.maxTime = 10.0f;
        ParticleEmitter emitter(group, launch);

        emitter.update(0.1f, glm::mat4(1.0f));
        emitter.update(0.5f, glm::mat4(1.0f));
        const Particle& p = emitter.particles().front();
        CHECK(p.velocity.y == doctest::Approx(-5.0f));
        CHECK(p.position.y == doctest::Approx(-2.5f));
    }

    TEST_CASE("expired particles are relaunched") {
        ParticleGroup group;
        group.count = 1;
        ParticleLaunchInfo launch;
        launch.minTime = launch.maxTime = 0.5f;
        ParticleEmitter emitter(group, launch);

        emitter.update(0.1f, glm::mat4(1.0f));
        emitter.update(0.4f, glm::mat4(1.0f));
        CHECK(emitter.particles().front().age == doctest::Approx(0.4f));
        emitter.update(0.2f, glm::mat4(1.0f));
        CHECK(emitter.particles().front().age == doctest::Approx(0.0f));
        CHECK(emitter.aliveCount() == 1);
    }

    TEST_CASE("alpha fades at the end of life") {
        ParticleGroup group;
        group.alpha = 255;
        group.fadeTime = 0.5f;
        group.size = 1.25f;
        ParticleEmitter emitter(group, ParticleLaunchInfo{});
        CHECK(emitter.particleSize() == doctest::Approx(1.0f));

        Particle p;
        p.lifetime = 1.0f;
        p.age = 0.75f;
        CHECK(emitter.alphaFor(p) == doctest::Approx(0.5f));
        p.age = 0.1f;
        CHECK(emitter.alphaFor(p) == doctest::Approx(1.0f));
    }
}

TEST_SUITE("HitBoxManager") {
    TEST_CASE("spawn, follow joints and remove") {
        ecs::World world;
        FakePhysicsWorld physics;
        HitBoxManager hitBoxes(world, physics);

        EntityId owner = world.createEntity();
        world.set(owner, Position{glm::vec3(0.0f, 0.0f, 5.0f)});

        CreatureDefinition def;
        def.name = "drone";
        def.hitBoxes = {HitBoxSpec{1, glm::vec3(2.5f)}, HitBoxSpec{static_cast<JointId>(MAX_JOINTS + 3), glm::vec3(1.0f)}};

        hitBoxes.spawn(owner, def);
        hitBoxes.spawn(owner, def);
        const auto* boxes = hitBoxes.hitBoxes(owner);
        REQUIRE(boxes != nullptr);
        REQUIRE(boxes->size() == 1);
        CHECK(hitBoxes.ownerCount() == 1);
        CHECK(physics.bodyCount() == 1);

        EntityId box = boxes->front();
        CHECK(hitBoxes.isHitBox(box));
        CHECK_FALSE(hitBoxes.isHitBox(owner));
        const auto* body = physics.find(box);
        REQUIRE(body != nullptr);
        CHECK(body->desc.motion == BodyMotion::Kinematic);
        CHECK(body->desc.group == CollisionGroup::HITBOX);
        CHECK(approxEqual(body->desc.halfExtents, glm::vec3(1.0f)));
        CHECK(approxEqual(body->position, glm::vec3(0.0f, 0.0f, 5.0f)));

        JointTransforms joints;
        joints.fill(glm::mat4(1.0f));
        joints[1] = glm::translate(glm::mat4(1.0f), glm::vec3(0.0f, 2.0f, 0.0f));
        hitBoxes.update(owner, glm::translate(glm::mat4(1.0f), glm::vec3(0.0f, 0.0f, 5.0f)), joints);
        CHECK(approxEqual(physics.find(box)->position, glm::vec3(0.0f, 2.0f, 5.0f)));
        CHECK(approxEqual(world.tryGet<Position>(box)->position, glm::vec3(0.0f, 2.0f, 5.0f)));

        hitBoxes.remove(owner);
        CHECK(physics.bodyCount() == 0);
        CHECK_FALSE(world.valid(box));
        CHECK(hitBoxes.hitBoxes(owner) == nullptr);
        hitBoxes.remove(owner);
    }
}
