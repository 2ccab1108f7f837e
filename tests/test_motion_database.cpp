#include <doctest/doctest.h>

#include "animation/MotionDatabase.h"

static const char* MOTION_DB_JSON = R"({
    "schemas": [
        {"actor_type": 0, "tags": ["Stand"], "motions": ["stand_a"]},
        {"actor_type": 0, "tags": ["stand", "search"], "motions": ["look_left", "look_right"]},
        {"actor_type": 0, "tags": ["locourgent"], "motions": ["run"]},
        {"actor_type": 2, "tags": ["stand"], "motions": ["spider_idle"]},
        {"actor_type": 0, "tags": ["broken"]}
    ],
    "motions": [
        {"name": "Stand_A", "frame_count": 30, "fps": 15, "blend_length_ms": 100,
         "flags": [{"frame": 5, "flags": ["fire", "bogus"]}]},
        {"name": "run", "frame_count": 20, "translation": [10, 0, 0], "end_direction": 45}
    ]
})";

static MotionDatabase loadDatabase() {
    auto db = MotionDatabase::loadFromString(MOTION_DB_JSON);
    REQUIRE(db.has_value());
    return *db;
}

TEST_SUITE("MotionDatabase") {
    TEST_CASE("schemas without motions are skipped") {
        MotionDatabase db = loadDatabase();
        CHECK(db.schemaCount() == 4);
        CHECK(db.motionCount() == 2);
    }

    TEST_CASE("required tags filter by actor type") {
        MotionDatabase db = loadDatabase();

        MotionQuery query;
        query.actorType = 2;
        query.items = {MotionQueryItem::required("stand")};
        CHECK(db.query(query) == std::optional<std::string>("spider_idle"));

        query.actorType = 0;
        query.items = {MotionQueryItem::required("LocoUrgent")};
        CHECK(db.query(query) == std::optional<std::string>("run"));

        query.items = {MotionQueryItem::required("swim")};
        CHECK_FALSE(db.query(query).has_value());
    }

    TEST_CASE("preferred tags rank matching schemas") {
        MotionDatabase db = loadDatabase();

        MotionQuery query;
        query.items = {MotionQueryItem::required("stand"), MotionQueryItem::preferred("search")};
        query.selection = MotionSelection::sequential(0);
        CHECK(db.query(query) == std::optional<std::string>("look_left"));
        query.selection = MotionSelection::sequential(1);
        CHECK(db.query(query) == std::optional<std::string>("look_right"));
        query.selection = MotionSelection::sequential(2);
        CHECK(db.query(query) == std::optional<std::string>("look_left"));

        // Without the preference all three stand motions tie
        query.items = {MotionQueryItem::required("stand")};
        query.selection = MotionSelection::sequential(0);
        CHECK(db.query(query) == std::optional<std::string>("stand_a"));
    }

    TEST_CASE("random selection stays within the best ranked motions") {
        MotionDatabase db = loadDatabase();
        MotionQuery query;
        query.items = {MotionQueryItem::required("stand"), MotionQueryItem::preferred("search")};
        for (int i = 0; i < 20; ++i) {
            auto motion = db.query(query);
            REQUIRE(motion.has_value());
            CHECK((*motion == "look_left" || *motion == "look_right"));
        }
    }

    TEST_CASE("motion info is looked up case-insensitively") {
        MotionDatabase db = loadDatabase();
        const MotionInfo* info = db.motionInfo("STAND_A");
        REQUIRE(info != nullptr);
        CHECK(info->fps == doctest::Approx(15.0f));
        CHECK(info->blendLength == doctest::Approx(0.1f));
        REQUIRE(info->flags.size() == 1);
        CHECK(info->flags[0].frame == 5);
        CHECK(info->flags[0].flags == MotionFlag::Fire);

        const MotionInfo* run = db.motionInfo("run");
        REQUIRE(run != nullptr);
        CHECK(run->translation.x == doctest::Approx(10.0f));
        CHECK(run->endDirection == doctest::Approx(45.0f));
        CHECK(run->blendLength == doctest::Approx(AnimationClip::DEFAULT_BLEND_LENGTH));
    }

    TEST_CASE("malformed JSON is rejected") {
        CHECK_FALSE(MotionDatabase::loadFromString("{ not json").has_value());
    }
}
