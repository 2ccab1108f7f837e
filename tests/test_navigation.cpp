#include <doctest/doctest.h>
#include <cstring>

#include "navigation/PathDatabase.h"
#include "navigation/PathfindingService.h"

namespace {

// Little-endian builder for hand-made AIPATH chunks
class ChunkWriter {
public:
    template<typename T>
    void put(T value) {
        uint8_t raw[sizeof(T)];
        std::memcpy(raw, &value, sizeof(T));
        bytes.insert(bytes.end(), raw, raw + sizeof(T));
    }

    void u8(uint8_t v) { put(v); }
    void u16(uint16_t v) { put(v); }
    void u32(uint32_t v) { put(v); }
    void f32(float v) { put(v); }
    void vec3(const glm::vec3& v) { f32(v.x); f32(v.y); f32(v.z); }
    void zeros(size_t count) { bytes.insert(bytes.end(), count, 0); }

    void cell(uint16_t firstVertex, uint8_t vertexCount, uint16_t firstLink, uint8_t linkCount,
              const glm::vec3& center, uint8_t flags = 0) {
        u16(firstVertex);
        u16(firstLink);
        u16(0);     // plane
        u16(0);     // next
        u16(0);     // best neighbor
        u16(0);     // link from neighbor
        u8(vertexCount);
        u8(flags);
        u8(linkCount);
        u8(0);      // wrap flags
        vec3(center);
        u32(0);     // bitfield
    }

    void link(uint16_t dest, uint16_t v1, uint16_t v2, uint8_t okBits, uint8_t cost) {
        u16(dest);
        u16(v1);
        u16(v2);
        u8(okBits);
        u8(cost);
    }

    std::vector<uint8_t> bytes;
};

// Three quads along X: [0,1] [1,2] [2,3] in XZ, each 1 unit deep.
// Cell 0 links to 1 (walk), cell 1 links to 2 (fly only) and back to 0.
std::vector<uint8_t> corridorChunk() {
    ChunkWriter w;
    w.u32(1);                       // pathfind inited
    w.u32(0);
    w.u32(2);                       // 3 cells
    w.cell(0, 4, 0, 1, glm::vec3(0.5f, 0.0f, 0.5f));
    w.cell(4, 4, 1, 2, glm::vec3(1.5f, 0.0f, 0.5f));
    w.cell(8, 4, 3, 0, glm::vec3(2.5f, 0.0f, 0.5f));
    w.u32(0);                       // 1 plane
    w.zeros(16);
    w.u32(7);                       // 8 vertices
    for (int x = 0; x <= 3; ++x) {
        w.vec3(glm::vec3(static_cast<float>(x), 0.0f, 0.0f));
        w.u32(0);
        w.vec3(glm::vec3(static_cast<float>(x), 0.0f, 1.0f));
        w.u32(0);
    }
    w.u32(2);                       // 3 links
    w.link(1, 2, 3, MovementBits::Walk, 10);
    w.link(2, 4, 5, MovementBits::Fly, 10);
    w.link(0, 2, 3, MovementBits::Walk, 10);
    w.u32(11);                      // 12 cell-vertex entries
    const uint32_t polygons[] = {0, 2, 3, 1, 2, 4, 5, 3, 4, 6, 7, 5};
    for (uint32_t v : polygons) w.u32(v);
    return w.bytes;
}

}  // namespace

TEST_SUITE("PathDatabase") {
    TEST_CASE("parses a crafted chunk with stored count minus one") {
        ChunkWriter w;
        w.u32(1);
        w.u32(0);
        w.u32(2);   // 3 cells
        w.cell(0, 4, 0, 1, glm::vec3(0.0f));
        w.cell(4, 4, 1, 1, glm::vec3(1.0f));
        w.cell(8, 4, 2, 0, glm::vec3(2.0f));
        w.u32(0);   // 1 plane
        w.zeros(16);
        w.u32(3);   // 4 vertices
        for (int i = 0; i < 4; ++i) {
            w.vec3(glm::vec3(static_cast<float>(i), 0.0f, 0.0f));
            w.u32(0);
        }
        w.u32(1);   // 2 links
        w.link(1, 0, 1, MovementBits::Walk, 1);
        w.link(2, 1, 2, MovementBits::Walk, 1);
        w.u32(11);  // 12 cell-vertex entries
        for (uint32_t i = 0; i < 12; ++i) w.u32(i % 4);

        auto db = PathDatabase::parse(w.bytes);
        REQUIRE(db.has_value());
        CHECK(db->cells.size() == 3);
        CHECK(db->vertices.size() == 4);
        REQUIRE(db->links.size() == 2);
        for (const auto& cell : db->cells) {
            CHECK(cell.vertexIndices.size() == 4);
        }
        CHECK(db->links[0].fromCell == 0);
        CHECK(db->links[1].fromCell == 1);
        CHECK(db->links[1].toCell == 2);
    }

    TEST_CASE("links to missing cells keep their slot") {
        ChunkWriter w;
        w.u32(1);
        w.u32(0);
        w.u32(1);   // 2 cells
        w.cell(0, 4, 0, 2, glm::vec3(0.5f, 0.0f, 0.5f));
        w.cell(4, 4, 2, 1, glm::vec3(1.5f, 0.0f, 0.5f));
        w.u32(0);   // 1 plane
        w.zeros(16);
        w.u32(5);   // 6 vertices
        for (int x = 0; x <= 2; ++x) {
            w.vec3(glm::vec3(static_cast<float>(x), 0.0f, 0.0f));
            w.u32(0);
            w.vec3(glm::vec3(static_cast<float>(x), 0.0f, 1.0f));
            w.u32(0);
        }
        w.u32(2);   // 3 links
        w.link(99, 2, 3, MovementBits::Walk, 1);
        w.link(1, 2, 3, MovementBits::Walk, 1);
        w.link(0, 2, 3, MovementBits::Walk, 1);
        w.u32(7);   // 8 cell-vertex entries
        const uint32_t polygons[] = {0, 2, 3, 1, 2, 4, 5, 3};
        for (uint32_t v : polygons) w.u32(v);

        auto db = PathDatabase::parse(w.bytes);
        REQUIRE(db.has_value());
        REQUIRE(db->links.size() == 3);
        CHECK(db->links[0].toCell == 99);
        CHECK_FALSE(db->isUsable(db->links[0]));
        CHECK(db->links[1].toCell == 1);
        CHECK(db->links[1].fromCell == 0);
        CHECK(db->links[2].fromCell == 1);

        PathfindingService service(std::make_shared<const PathDatabase>(std::move(*db)));
        auto path = service.findPath(glm::vec3(0.5f, 0.0f, 0.5f), glm::vec3(1.5f, 0.0f, 0.5f), MovementBits::Walk);
        REQUIRE(path.has_value());
        CHECK(path->size() == 2);
    }

    TEST_CASE("uninitialized pathfinding yields nothing") {
        ChunkWriter w;
        w.u32(0);
        CHECK_FALSE(PathDatabase::parse(w.bytes).has_value());
        CHECK_FALSE(PathDatabase::parse({}).has_value());
    }

    TEST_CASE("unreasonable cell counts are rejected") {
        ChunkWriter w;
        w.u32(1);
        w.u32(0);
        w.u32(PathDatabase::MAX_CELLS + 10);
        CHECK_FALSE(PathDatabase::parse(w.bytes).has_value());
    }

    TEST_CASE("truncated cell table is rejected") {
        ChunkWriter w;
        w.u32(1);
        w.u32(0);
        w.u32(4);   // 5 cells, only one present
        w.cell(0, 0, 0, 0, glm::vec3(0.0f));
        CHECK_FALSE(PathDatabase::parse(w.bytes).has_value());
    }

    TEST_CASE("short cell-vertex table keeps the graph") {
        std::vector<uint8_t> bytes = corridorChunk();
        bytes.resize(bytes.size() - 8);
        auto db = PathDatabase::parse(bytes);
        REQUIRE(db.has_value());
        CHECK(db->links.size() == 3);
        for (const auto& cell : db->cells) {
            CHECK(cell.vertexIndices.empty());
        }
    }
}

TEST_SUITE("PathfindingService") {
    TEST_CASE("cell lookup tests containment on the XZ plane") {
        auto db = PathDatabase::parse(corridorChunk());
        REQUIRE(db.has_value());
        PathfindingService service(std::make_shared<const PathDatabase>(std::move(*db)));

        CHECK(service.cellFromPosition(glm::vec3(0.5f, 3.0f, 0.5f)) == std::optional<uint32_t>(0));
        CHECK(service.cellFromPosition(glm::vec3(2.5f, 0.0f, 0.2f)) == std::optional<uint32_t>(2));
        CHECK_FALSE(service.cellFromPosition(glm::vec3(5.0f, 0.0f, 0.5f)).has_value());
    }

    TEST_CASE("paths respect movement bits") {
        auto db = PathDatabase::parse(corridorChunk());
        REQUIRE(db.has_value());
        PathfindingService service(std::make_shared<const PathDatabase>(std::move(*db)));

        glm::vec3 start(0.5f, 0.0f, 0.5f);
        glm::vec3 middle(1.5f, 0.0f, 0.5f);
        glm::vec3 end(2.5f, 0.0f, 0.5f);

        auto walk = service.findPath(start, middle, MovementBits::Walk);
        REQUIRE(walk.has_value());
        CHECK(walk->size() == 2);

        CHECK_FALSE(service.findPath(start, end, MovementBits::Walk).has_value());

        auto flyWalk = service.findPath(start, end, MovementBits::Walk | MovementBits::Fly);
        REQUIRE(flyWalk.has_value());
        CHECK(flyWalk->size() == 3);
        CHECK(flyWalk->back().x == doctest::Approx(2.5f));
    }

    TEST_CASE("closest reachable cell stops at blocked links") {
        auto db = PathDatabase::parse(corridorChunk());
        REQUIRE(db.has_value());
        PathfindingService service(std::make_shared<const PathDatabase>(std::move(*db)));

        auto closest = service.findClosestReachableCell(glm::vec3(0.5f, 0.0f, 0.5f),
                                                        glm::vec3(10.0f, 0.0f, 0.5f), MovementBits::Walk);
        CHECK(closest == std::optional<uint32_t>(1));
    }
}
