#include "PathDatabase.h"
#include "BinaryReader.h"
#include <SDL3/SDL_log.h>
#include <algorithm>

namespace {

struct CellRanges {
    uint32_t firstVertex = 0;
    uint32_t vertexCount = 0;
    uint32_t firstLink = 0;
    uint32_t linkCount = 0;
};

constexpr size_t CELL_RECORD_SIZE = 32;
constexpr size_t PLANE_RECORD_SIZE = 16;
constexpr size_t VERTEX_RECORD_SIZE = 16;
constexpr size_t LINK_RECORD_SIZE = 8;

// Counts are stored as (count - 1)
bool readCount(BinaryReader& reader, const char* what, uint32_t limit, uint32_t& count) {
    uint32_t raw = 0;
    if (!reader.readU32(raw)) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "PathDatabase: Truncated %s count", what);
        return false;
    }
    count = raw + 1;
    if (raw == UINT32_MAX || count > limit) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
            "PathDatabase: %s count %u seems unreasonably large", what, raw);
        return false;
    }
    return true;
}

bool readCell(BinaryReader& reader, uint32_t index, PathCell& cell, CellRanges& ranges) {
    uint16_t firstVertex = 0, firstCell = 0, plane = 0, next = 0, bestNeighbor = 0, linkFromNeighbor = 0;
    uint8_t vertexCount = 0, pathFlags = 0, cellCount = 0, wrapFlags = 0;
    glm::vec3 center;
    uint32_t bitfield = 0;

    bool ok = reader.readU16(firstVertex) && reader.readU16(firstCell) &&
              reader.readU16(plane) && reader.readU16(next) &&
              reader.readU16(bestNeighbor) && reader.readU16(linkFromNeighbor) &&
              reader.readU8(vertexCount) && reader.readU8(pathFlags) &&
              reader.readU8(cellCount) && reader.readU8(wrapFlags) &&
              reader.readVec3(center) && reader.readU32(bitfield);
    if (!ok) {
        return false;
    }

    cell.id = index;
    cell.center = center;
    cell.flags = pathFlags & PathCellFlags::All;

    ranges.firstVertex = firstVertex;
    ranges.vertexCount = vertexCount;
    ranges.firstLink = firstCell;
    ranges.linkCount = cellCount;
    return true;
}

} // anonymous namespace

std::optional<PathDatabase> PathDatabase::parse(const std::vector<uint8_t>& chunk) {
    BinaryReader reader(chunk);

    uint32_t pathfindInited = 0;
    if (!reader.readU32(pathfindInited)) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "PathDatabase: Empty AIPATH chunk");
        return std::nullopt;
    }
    if (pathfindInited == 0) {
        SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "PathDatabase: Pathfinding not initialized");
        return std::nullopt;
    }

    uint32_t unknown = 0;
    if (!reader.readU32(unknown)) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "PathDatabase: Truncated header");
        return std::nullopt;
    }

    PathDatabase db;

    uint32_t numCells = 0;
    if (!readCount(reader, "Cell", MAX_CELLS, numCells)) {
        return std::nullopt;
    }
    if (static_cast<size_t>(numCells) * CELL_RECORD_SIZE > reader.remaining()) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "PathDatabase: Truncated cell table (%u cells)", numCells);
        return std::nullopt;
    }

    std::vector<CellRanges> ranges(numCells);
    db.cells.resize(numCells);
    for (uint32_t i = 0; i < numCells; ++i) {
        readCell(reader, i, db.cells[i], ranges[i]);
    }

    uint32_t numPlanes = 0;
    if (!readCount(reader, "Plane", MAX_PLANES, numPlanes)) {
        return std::nullopt;
    }
    if (!reader.skip(static_cast<size_t>(numPlanes) * PLANE_RECORD_SIZE)) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "PathDatabase: Truncated plane table");
        return std::nullopt;
    }

    uint32_t numVertices = 0;
    if (!readCount(reader, "Vertex", MAX_VERTICES, numVertices)) {
        return std::nullopt;
    }
    if (static_cast<size_t>(numVertices) * VERTEX_RECORD_SIZE > reader.remaining()) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "PathDatabase: Truncated vertex table");
        return std::nullopt;
    }
    db.vertices.reserve(numVertices);
    for (uint32_t i = 0; i < numVertices; ++i) {
        glm::vec3 v;
        uint32_t ptInfo = 0;
        reader.readVec3(v);
        reader.readU32(ptInfo);
        db.vertices.push_back(v);
    }

    uint32_t rawLinks = 0;
    if (!reader.readU32(rawLinks) || rawLinks == UINT32_MAX) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "PathDatabase: Truncated link count");
        return std::nullopt;
    }
    const uint32_t numLinks = rawLinks + 1;
    if (static_cast<size_t>(numLinks) * LINK_RECORD_SIZE > reader.remaining()) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "PathDatabase: Truncated link table (%u links)", numLinks);
        return std::nullopt;
    }
    db.links.reserve(numLinks);
    for (uint32_t i = 0; i < numLinks; ++i) {
        uint16_t dest = 0, v1 = 0, v2 = 0;
        uint8_t okBits = 0, cost = 0;
        reader.readU16(dest);
        reader.readU16(v1);
        reader.readU16(v2);
        reader.readU8(okBits);
        reader.readU8(cost);

        PathCellLink link;
        link.toCell = dest;
        link.edgeVertexA = v1;
        link.edgeVertexB = v2;
        link.okBits = okBits & MovementBits::All;
        link.cost = cost;
        db.links.push_back(link);
    }

    // A short cell-vertex table leaves the cells without polygons but keeps the graph
    std::vector<uint32_t> cellVertexLinks;
    uint32_t rawCellVertices = 0;
    if (!reader.readU32(rawCellVertices) || rawCellVertices == UINT32_MAX) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "PathDatabase: Missing cell-vertex table");
    } else {
        const uint32_t numCellVertices = rawCellVertices + 1;
        if (static_cast<size_t>(numCellVertices) * 4 > reader.remaining()) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                "PathDatabase: Not enough bytes for cell-vertex links: need %zu but only have %zu",
                static_cast<size_t>(numCellVertices) * 4, reader.remaining());
        } else {
            cellVertexLinks.resize(numCellVertices);
            for (auto& vertexId : cellVertexLinks) {
                reader.readU32(vertexId);
            }
        }
    }

    for (uint32_t cellIndex = 0; cellIndex < numCells; ++cellIndex) {
        const CellRanges& r = ranges[cellIndex];

        size_t linkEnd = std::min<size_t>(static_cast<size_t>(r.firstLink) + r.linkCount, db.links.size());
        for (size_t l = r.firstLink; l < linkEnd; ++l) {
            db.links[l].fromCell = cellIndex;
        }

        size_t vertexEnd = std::min<size_t>(static_cast<size_t>(r.firstVertex) + r.vertexCount,
                                            cellVertexLinks.size());
        for (size_t v = r.firstVertex; v < vertexEnd; ++v) {
            uint32_t vertexId = cellVertexLinks[v];
            if (vertexId < db.vertices.size()) {
                db.cells[cellIndex].vertexIndices.push_back(vertexId);
            }
        }
    }

    // Bad links stay in place so link indices keep matching the file
    const size_t invalid = std::count_if(db.links.begin(), db.links.end(),
                                         [&](const PathCellLink& link) { return !db.isUsable(link); });
    if (invalid > 0) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
            "PathDatabase: %zu links have out-of-range cells or vertices", invalid);
    }

    SDL_Log("PathDatabase: Loaded %zu cells, %zu vertices, %zu links, %zu cell-vertex links",
            db.cells.size(), db.vertices.size(), db.links.size(), cellVertexLinks.size());
    return db;
}

std::optional<PathDatabase> PathDatabase::load(const std::string& path) {
    auto bytes = readFileBytes(path);
    if (!bytes) {
        return std::nullopt;
    }
    return parse(*bytes);
}

bool PathDatabase::isUsable(const PathCellLink& link) const {
    return link.fromCell < cells.size() && link.toCell < cells.size() &&
           link.edgeVertexA < vertices.size() && link.edgeVertexB < vertices.size();
}
