#include "PathfindingService.h"
#include "Profiling.h"

#include <algorithm>
#include <cmath>
#include <functional>
#include <limits>
#include <queue>
#include <unordered_map>

PathfindingService::PathfindingService(std::shared_ptr<const PathDatabase> database)
    : database_(std::move(database)) {
    outgoing_.resize(database_->cells.size());
    for (size_t i = 0; i < database_->links.size(); ++i) {
        const PathCellLink& link = database_->links[i];
        if (database_->isUsable(link)) {
            outgoing_[link.fromCell].push_back(i);
        }
    }
}

std::optional<uint32_t> PathfindingService::cellFromPosition(const glm::vec3& position) const {
    for (size_t i = 0; i < database_->cells.size(); ++i) {
        if (pointInCell(position, database_->cells[i])) {
            return static_cast<uint32_t>(i);
        }
    }
    return std::nullopt;
}

std::optional<std::vector<glm::vec3>> PathfindingService::findPath(const glm::vec3& start,
                                                                   const glm::vec3& goal,
                                                                   uint32_t movement) const {
    DARKCORE_ZONE_SCOPED_N("Pathfinding::findPath");
    auto startCell = cellFromPosition(start);
    auto goalCell = cellFromPosition(goal);
    if (!startCell || !goalCell) {
        return std::nullopt;
    }

    using Entry = std::pair<uint32_t, uint32_t>;  // (f score, cell)
    std::priority_queue<Entry, std::vector<Entry>, std::greater<Entry>> open;
    std::unordered_map<uint32_t, uint32_t> gScore;
    std::unordered_map<uint32_t, uint32_t> cameFrom;

    gScore[*startCell] = 0;
    open.push({heuristic(*startCell, *goalCell), *startCell});

    while (!open.empty()) {
        auto [f, current] = open.top();
        open.pop();

        if (current == *goalCell) {
            std::vector<glm::vec3> waypoints;
            uint32_t cell = current;
            waypoints.push_back(database_->cells[cell].center);
            while (cell != *startCell) {
                cell = cameFrom[cell];
                waypoints.push_back(database_->cells[cell].center);
            }
            std::reverse(waypoints.begin(), waypoints.end());
            return waypoints;
        }

        const uint32_t currentG = gScore[current];
        if (f > currentG + heuristic(current, *goalCell)) {
            continue;  // stale entry
        }

        for (const auto& [next, cost] : successors(current, movement)) {
            uint32_t tentative = currentG + cost;
            auto it = gScore.find(next);
            if (it == gScore.end() || tentative < it->second) {
                gScore[next] = tentative;
                cameFrom[next] = current;
                open.push({tentative + heuristic(next, *goalCell), next});
            }
        }
    }

    return std::nullopt;
}

std::optional<uint32_t> PathfindingService::findClosestReachableCell(const glm::vec3& start,
                                                                     const glm::vec3& goal,
                                                                     uint32_t movement) const {
    auto startCell = cellFromPosition(start);
    if (!startCell) {
        return std::nullopt;
    }

    using Entry = std::pair<uint32_t, uint32_t>;  // (distance, cell)
    std::priority_queue<Entry, std::vector<Entry>, std::greater<Entry>> open;
    std::unordered_map<uint32_t, uint32_t> distance;
    distance[*startCell] = 0;
    open.push({0, *startCell});

    uint32_t closest = *startCell;
    float closestDistance = glm::length(goal - database_->cells[*startCell].center);

    while (!open.empty()) {
        auto [d, current] = open.top();
        open.pop();
        if (d > distance[current]) {
            continue;
        }

        float toGoal = glm::length(goal - database_->cells[current].center);
        if (toGoal < closestDistance) {
            closestDistance = toGoal;
            closest = current;
        }

        for (const auto& [next, cost] : successors(current, movement)) {
            uint32_t candidate = d + cost;
            auto it = distance.find(next);
            if (it == distance.end() || candidate < it->second) {
                distance[next] = candidate;
                open.push({candidate, next});
            }
        }
    }

    return closest;
}

std::vector<std::pair<uint32_t, uint32_t>> PathfindingService::successors(uint32_t cell, uint32_t movement) const {
    std::vector<std::pair<uint32_t, uint32_t>> result;
    if (cell >= outgoing_.size()) {
        return result;
    }
    for (size_t linkIndex : outgoing_[cell]) {
        const PathCellLink& link = database_->links[linkIndex];
        if ((link.okBits & movement) != 0) {
            result.emplace_back(link.toCell, link.cost);
        }
    }
    return result;
}

uint32_t PathfindingService::heuristic(uint32_t from, uint32_t to) const {
    glm::vec3 delta = database_->cells[from].center - database_->cells[to].center;
    return static_cast<uint32_t>(glm::length(delta));
}

bool PathfindingService::pointInCell(const glm::vec3& point, const PathCell& cell) const {
    if (cell.vertexIndices.size() < 3) {
        return false;
    }

    const auto& vertices = database_->vertices;
    std::optional<bool> sign;
    const size_t count = cell.vertexIndices.size();
    for (size_t i = 0; i < count; ++i) {
        const glm::vec3& a = vertices[cell.vertexIndices[i]];
        const glm::vec3& b = vertices[cell.vertexIndices[(i + 1) % count]];

        float cross = (b.x - a.x) * (point.z - a.z) - (b.z - a.z) * (point.x - a.x);
        if (std::abs(cross) < std::numeric_limits<float>::epsilon()) {
            continue;  // on the edge
        }
        bool positive = cross > 0.0f;
        if (!sign) {
            sign = positive;
        } else if (*sign != positive) {
            return false;
        }
    }
    return true;
}
