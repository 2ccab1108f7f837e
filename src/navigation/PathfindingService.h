#pragma once

#include "PathDatabase.h"
#include <glm/glm.hpp>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

// Cell-graph queries over a shared PathDatabase. Positions are in the same frame as the
// database (cell containment is tested on the XZ plane).
class PathfindingService {
public:
    explicit PathfindingService(std::shared_ptr<const PathDatabase> database);

    std::optional<uint32_t> cellFromPosition(const glm::vec3& position) const;

    // A* over links usable with `movement`; returns the centers of the visited cells
    std::optional<std::vector<glm::vec3>> findPath(const glm::vec3& start, const glm::vec3& goal,
                                                   uint32_t movement) const;

    // Reachable cell closest to `goal`, or the start cell when nothing is closer
    std::optional<uint32_t> findClosestReachableCell(const glm::vec3& start, const glm::vec3& goal,
                                                     uint32_t movement) const;

    const PathDatabase& database() const { return *database_; }

private:
    std::vector<std::pair<uint32_t, uint32_t>> successors(uint32_t cell, uint32_t movement) const;
    uint32_t heuristic(uint32_t from, uint32_t to) const;
    bool pointInCell(const glm::vec3& point, const PathCell& cell) const;

    std::shared_ptr<const PathDatabase> database_;
    std::vector<std::vector<size_t>> outgoing_;   // cell -> link indices
};
