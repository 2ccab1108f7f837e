#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "AnimationClip.h"
#include "MotionDatabase.h"

// Decoder for .mc motion clips. The raw file carries per-joint rotation tracks only;
// timing, flags and root motion metadata come from the motion database entry.
namespace MotionClipLoader {

    std::optional<AnimationClip> decode(const std::vector<uint8_t>& bytes, const MotionInfo& info);

    std::optional<AnimationClip> load(const std::string& path, const MotionInfo& info);

}  // namespace MotionClipLoader
