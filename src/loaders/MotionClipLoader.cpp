#include "MotionClipLoader.h"
#include "BinaryReader.h"
#include "DarkConstants.h"
#include <SDL3/SDL_log.h>
#include <glm/gtc/matrix_transform.hpp>
#include <cmath>

namespace MotionClipLoader {

std::optional<AnimationClip> decode(const std::vector<uint8_t>& bytes, const MotionInfo& info) {
    BinaryReader reader(bytes);

    uint32_t numJoints = 0;
    if (!reader.readU32(numJoints)) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "MotionClipLoader: Truncated header for '%s'",
                    info.name.c_str());
        return std::nullopt;
    }
    if (numJoints == 0 || static_cast<size_t>(numJoints) * 4 > reader.remaining()) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
            "MotionClipLoader: Invalid joint count %u for '%s'", numJoints, info.name.c_str());
        return std::nullopt;
    }

    std::vector<uint32_t> offsets(numJoints);
    for (auto& offset : offsets) {
        reader.readU32(offset);
    }

    const uint32_t numFrames = info.frameCount > 0.0f
        ? static_cast<uint32_t>(std::floor(info.frameCount)) : 0;

    AnimationClip clip;
    clip.name = info.name;
    clip.numFrames = numFrames;
    clip.timePerFrame = info.fps > 0.0f ? 1.0f / info.fps : 1.0f / 30.0f;
    clip.duration = info.duration > 0.0f ? info.duration : clip.timePerFrame * numFrames;
    clip.blendLength = info.blendLength;
    clip.endRotation = info.endDirection;
    clip.translation = info.translation / SCALE_FACTOR;
    if (info.duration > 0.0f) {
        clip.slidingVelocity = clip.translation / info.duration;
    }
    clip.motionFlags = info.flags;

    // Joint 0 only carries the vertical bob; horizontal root motion is applied
    // through the sliding velocity instead
    if (!reader.seek(offsets[0])) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
            "MotionClipLoader: Root offset %u out of range in '%s'", offsets[0], info.name.c_str());
        return std::nullopt;
    }
    clip.rootTransforms.reserve(numFrames);
    for (uint32_t frame = 0; frame < numFrames; ++frame) {
        glm::vec3 translation;
        if (!reader.readVec3(translation)) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                "MotionClipLoader: Truncated root track in '%s' at frame %u", info.name.c_str(), frame);
            return std::nullopt;
        }
        clip.rootTransforms.push_back(
            glm::translate(glm::mat4(1.0f), glm::vec3(0.0f, translation.y / SCALE_FACTOR, 0.0f)));
    }
    clip.jointToFrame[0] = std::vector<glm::mat4>(numFrames, glm::mat4(1.0f));

    for (uint32_t joint = 1; joint < numJoints; ++joint) {
        if (!reader.seek(offsets[joint])) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                "MotionClipLoader: Joint %u offset %u out of range in '%s'",
                joint, offsets[joint], info.name.c_str());
            return std::nullopt;
        }

        std::vector<glm::mat4> frames;
        frames.reserve(numFrames);
        for (uint32_t frame = 0; frame < numFrames; ++frame) {
            glm::quat rotation;
            if (!reader.readQuat(rotation)) {
                SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                    "MotionClipLoader: Truncated track for joint %u in '%s'", joint, info.name.c_str());
                return std::nullopt;
            }
            frames.push_back(glm::mat4_cast(rotation));
        }
        clip.jointToFrame[joint] = std::move(frames);
    }

    return clip;
}

std::optional<AnimationClip> load(const std::string& path, const MotionInfo& info) {
    auto bytes = readFileBytes(path);
    if (!bytes) {
        return std::nullopt;
    }
    return decode(*bytes, info);
}

}  // namespace MotionClipLoader
