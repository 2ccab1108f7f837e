#pragma once

#include <glm/glm.hpp>
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "Skeleton.h"

constexpr size_t CAL_MAX_FIXED_JOINTS = 16;
constexpr size_t CAL_MAX_SEGMENTS = 16;

struct CalTorso {
    int32_t joint = 0;
    int32_t parent = -1;     // index into the torso array, -1 for the root torso
    int32_t fixedCount = 0;
    std::array<int32_t, CAL_MAX_FIXED_JOINTS> fixedJoints{};
    std::array<glm::vec3, CAL_MAX_FIXED_JOINTS> fixedOffsets{};
};

struct CalLimb {
    int32_t torsoIndex = 0;
    int32_t bend = 0;
    int32_t numSegments = 0;
    int16_t attachmentJoint = 0;
    std::array<int16_t, CAL_MAX_SEGMENTS + 1> segments{};
    std::array<glm::vec3, CAL_MAX_SEGMENTS> segmentDirections{};
    std::array<float, CAL_MAX_SEGMENTS> segmentLengths{};
};

struct CalFile {
    int32_t version = 0;
    std::vector<CalTorso> torsos;
    std::vector<CalLimb> limbs;
};

// Decoder for .cal skeleton files
namespace CalLoader {

    std::optional<CalFile> parse(const std::vector<uint8_t>& bytes);

    std::optional<CalFile> load(const std::string& path);

    // Torsos form the upper hierarchy (each rotated 90 degrees about Y); fixed joints and
    // limb segments hang off them as pure translations scaled by 1/SCALE_FACTOR
    Skeleton createSkeleton(const CalFile& cal);

}  // namespace CalLoader
