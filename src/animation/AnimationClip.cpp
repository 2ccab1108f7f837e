#include "AnimationClip.h"
#include <SDL3/SDL_log.h>
#include <algorithm>
#include <cctype>

namespace MotionFlag {

uint32_t fromName(const std::string& name) {
    std::string key = name;
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (key == "standing") return Standing;
    if (key == "left_footfall") return LeftFootfall;
    if (key == "right_footfall") return RightFootfall;
    if (key == "left_foot_up") return LeftFootUp;
    if (key == "right_foot_up") return RightFootUp;
    if (key == "fire") return Fire;
    if (key == "fire_release") return FireRelease;
    if (key == "can_interrupt") return CanInterrupt;
    if (key == "start_motion_here") return StartMotionHere;
    if (key == "end_motion_here") return EndMotionHere;
    if (key == "end_of_attack") return EndOfAttack;
    if (key == "death") return Death;
    return 0;
}

} // namespace MotionFlag

bool AnimationClip::sanitize() {
    bool clean = true;
    const char* clipName = name ? name->c_str() : "<unnamed>";

    for (auto it = jointToFrame.begin(); it != jointToFrame.end();) {
        if (it->second.size() < numFrames) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                "AnimationClip: '%s' joint %u has %zu frames, expected %u; dropping track",
                clipName, it->first, it->second.size(), numFrames);
            it = jointToFrame.erase(it);
            clean = false;
        } else {
            ++it;
        }
    }

    if (!rootTransforms.empty() && rootTransforms.size() < numFrames) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
            "AnimationClip: '%s' has %zu root transforms, expected %u; using identity",
            clipName, rootTransforms.size(), numFrames);
        rootTransforms.clear();
        clean = false;
    }

    return clean;
}
