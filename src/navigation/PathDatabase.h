#pragma once

#include <glm/glm.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace PathCellFlags {
    constexpr uint32_t Unpathable    = 0x01;
    constexpr uint32_t BelowDoor     = 0x02;
    constexpr uint32_t BlockingOBB   = 0x04;
    constexpr uint32_t MovingTerrain = 0x08;
    constexpr uint32_t All           = 0x0F;
}

namespace MovementBits {
    constexpr uint32_t Walk          = 0x01;
    constexpr uint32_t Fly           = 0x02;
    constexpr uint32_t Swim          = 0x04;
    constexpr uint32_t SmallCreature = 0x08;
    constexpr uint32_t All           = 0x0F;
}

struct PathCell {
    uint32_t id = 0;
    glm::vec3 center{0.0f};
    std::vector<uint32_t> vertexIndices;   // into PathDatabase::vertices
    uint32_t flags = 0;                    // PathCellFlags
};

struct PathCellLink {
    uint32_t fromCell = 0;
    uint32_t toCell = 0;
    uint32_t edgeVertexA = 0;
    uint32_t edgeVertexB = 0;
    uint32_t okBits = 0;                   // MovementBits
    uint8_t cost = 0;
};

// Navigation graph from the AIPATH chunk of a mission file
struct PathDatabase {
    static constexpr uint32_t MAX_CELLS = 50000;
    static constexpr uint32_t MAX_PLANES = 50000;
    static constexpr uint32_t MAX_VERTICES = 100000;

    std::vector<PathCell> cells;
    std::vector<glm::vec3> vertices;
    std::vector<PathCellLink> links;    // file order, including links to missing cells

    // False for links whose cells or edge vertices are out of range
    bool isUsable(const PathCellLink& link) const;

    // Returns nullopt when pathfinding was never initialized for the level,
    // the counts exceed the limits above, or the chunk is truncated
    static std::optional<PathDatabase> parse(const std::vector<uint8_t>& chunk);
    static std::optional<PathDatabase> load(const std::string& path);
};
