#pragma once

#include <glm/glm.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "Skeleton.h"

// One hit-box body that follows a joint of the creature skeleton
struct HitBoxSpec {
    JointId joint = 0;
    glm::vec3 halfExtents{0.25f};   // asset units
};

// Per-species data: the motion actor type plus the remap from the
// engine's abstract joint numbers (AIProjectile links, etc) to skeleton joints
struct CreatureDefinition {
    uint32_t type = 0;
    std::string name;
    uint32_t actorType = 0;
    std::vector<int32_t> jointMap;
    std::vector<HitBoxSpec> hitBoxes;

    // nullopt when the abstract joint is unmapped or mapped to -1
    std::optional<JointId> mappedJoint(int32_t abstractJoint) const;
};

class CreatureDefinitions {
public:
    // Reads the "creatures" array of gamesys.json
    static std::optional<CreatureDefinitions> loadFromString(const std::string& jsonText);

    void add(CreatureDefinition definition);
    const CreatureDefinition* find(uint32_t type) const;

    size_t size() const { return definitions_.size(); }

private:
    std::vector<CreatureDefinition> definitions_;
};
