#include "CalLoader.h"
#include "BinaryReader.h"
#include "RotationUtils.h"
#include <SDL3/SDL_log.h>
#include <glm/gtc/matrix_transform.hpp>
#include <algorithm>

namespace CalLoader {

namespace {

bool readTorso(BinaryReader& reader, CalTorso& torso) {
    if (!reader.readI32(torso.joint) || !reader.readI32(torso.parent) || !reader.readI32(torso.fixedCount)) {
        return false;
    }
    for (auto& joint : torso.fixedJoints) {
        if (!reader.readI32(joint)) return false;
    }
    for (auto& offset : torso.fixedOffsets) {
        if (!reader.readVec3(offset)) return false;
    }
    return true;
}

bool readLimb(BinaryReader& reader, CalLimb& limb) {
    if (!reader.readI32(limb.torsoIndex) || !reader.readI32(limb.bend) ||
        !reader.readI32(limb.numSegments) || !reader.readI16(limb.attachmentJoint)) {
        return false;
    }
    for (auto& segment : limb.segments) {
        if (!reader.readI16(segment)) return false;
    }
    for (auto& direction : limb.segmentDirections) {
        if (!reader.readVec3(direction)) return false;
    }
    for (auto& length : limb.segmentLengths) {
        if (!reader.readF32(length)) return false;
    }
    return true;
}

} // anonymous namespace

std::optional<CalFile> parse(const std::vector<uint8_t>& bytes) {
    BinaryReader reader(bytes);
    CalFile cal;

    int32_t numTorsos = 0;
    int32_t numLimbs = 0;
    if (!reader.readI32(cal.version) || !reader.readI32(numTorsos) || !reader.readI32(numLimbs)) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "CalLoader: Truncated header");
        return std::nullopt;
    }
    if (numTorsos < 0 || numLimbs < 0) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
            "CalLoader: Negative counts (torsos=%d, limbs=%d)", numTorsos, numLimbs);
        return std::nullopt;
    }

    cal.torsos.resize(static_cast<size_t>(numTorsos));
    for (size_t i = 0; i < cal.torsos.size(); ++i) {
        if (!readTorso(reader, cal.torsos[i])) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "CalLoader: Truncated torso %zu", i);
            return std::nullopt;
        }
    }

    cal.limbs.resize(static_cast<size_t>(numLimbs));
    for (size_t i = 0; i < cal.limbs.size(); ++i) {
        if (!readLimb(reader, cal.limbs[i])) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "CalLoader: Truncated limb %zu", i);
            return std::nullopt;
        }
    }

    return cal;
}

std::optional<CalFile> load(const std::string& path) {
    auto bytes = readFileBytes(path);
    if (!bytes) {
        return std::nullopt;
    }
    auto cal = parse(*bytes);
    if (!cal) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "CalLoader: Failed to decode '%s'", path.c_str());
    }
    return cal;
}

Skeleton createSkeleton(const CalFile& cal) {
    if (cal.torsos.empty()) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "CalLoader: CAL file has no torsos");
        return Skeleton::empty();
    }

    if (cal.torsos[0].parent != -1) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
            "CalLoader: First torso has parent %d, expected -1", cal.torsos[0].parent);
    }

    std::vector<Bone> bones;
    const glm::mat4 torsoLocal = RotationUtils::rotationYMatrix(90.0f);

    for (size_t i = 0; i < cal.torsos.size(); ++i) {
        const CalTorso& torso = cal.torsos[i];

        std::optional<JointId> parentId;
        if (torso.parent >= 0 && static_cast<size_t>(torso.parent) < cal.torsos.size()) {
            parentId = static_cast<JointId>(cal.torsos[torso.parent].joint);
        } else if (torso.parent != -1) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                "CalLoader: Invalid torso parent index %d for torso %zu, treating as root",
                torso.parent, i);
        }

        bones.push_back(Bone{static_cast<JointId>(torso.joint), parentId, torsoLocal});

        int32_t fixedCount = std::clamp<int32_t>(torso.fixedCount, 0, CAL_MAX_FIXED_JOINTS);
        for (int32_t j = 0; j < fixedCount; ++j) {
            glm::vec3 offset = torso.fixedOffsets[j] / SCALE_FACTOR;
            bones.push_back(Bone{
                static_cast<JointId>(torso.fixedJoints[j]),
                static_cast<JointId>(torso.joint),
                glm::translate(glm::mat4(1.0f), offset)
            });
        }
    }

    for (const auto& limb : cal.limbs) {
        JointId parent = static_cast<JointId>(limb.attachmentJoint);
        int32_t numSegments = std::clamp<int32_t>(limb.numSegments, 0, CAL_MAX_SEGMENTS);
        for (int32_t s = 0; s < numSegments; ++s) {
            JointId joint = static_cast<JointId>(limb.segments[s]);
            glm::vec3 offset = limb.segmentDirections[s] * (limb.segmentLengths[s] / SCALE_FACTOR);
            bones.push_back(Bone{joint, parent, glm::translate(glm::mat4(1.0f), offset)});
            parent = joint;
        }
    }

    return Skeleton::fromBones(std::move(bones));
}

}  // namespace CalLoader
