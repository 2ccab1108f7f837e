#include "AssetCache.h"
#include "CalLoader.h"
#include "GLTFLoader.h"
#include "MotionClipLoader.h"
#include "StringUtils.h"

#include <SDL3/SDL_log.h>
#include <filesystem>

using StringUtils::toLower;

AssetCache::AssetCache(std::string assetRoot, std::shared_ptr<const MotionDatabase> motionDb)
    : assetRoot_(std::move(assetRoot)), motionDb_(std::move(motionDb)) {}

std::string AssetCache::path(const std::string& relative) const {
    return (std::filesystem::path(assetRoot_) / relative).string();
}

SkeletonHandle AssetCache::skeleton(const std::string& modelName) {
    const std::string key = toLower(modelName);
    if (auto it = skeletons_.find(key); it != skeletons_.end()) {
        return it->second;
    }

    SkeletonHandle result;
    const std::string calPath = path(key + ".cal");
    const std::string glbPath = path(key + ".glb");
    if (std::filesystem::exists(calPath)) {
        if (auto cal = CalLoader::load(calPath)) {
            result = std::make_shared<const Skeleton>(CalLoader::createSkeleton(*cal));
        }
    } else if (std::filesystem::exists(glbPath)) {
        if (auto set = GLTFLoader::loadAnimations(glbPath); set && set->skeleton) {
            result = std::make_shared<const Skeleton>(*set->skeleton);
            for (auto& clip : set->clips) {
                if (clip.name) {
                    std::string clipName = toLower(*clip.name);
                    clips_.emplace(clipName, std::make_shared<const AnimationClip>(std::move(clip)));
                }
            }
        }
    }

    if (!result) {
        SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "AssetCache: no skeleton for model '%s'", modelName.c_str());
    }
    skeletons_[key] = result;
    return result;
}

ClipHandle AssetCache::clip(const std::string& motionName) {
    const std::string key = toLower(motionName);
    if (auto it = clips_.find(key); it != clips_.end()) {
        return it->second;
    }

    ClipHandle result;
    const MotionInfo* info = motionDb_ ? motionDb_->motionInfo(motionName) : nullptr;
    if (!info) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "AssetCache: motion '%s' has no database entry", motionName.c_str());
    } else if (auto clip = MotionClipLoader::load(path("motions/" + key + ".mc"), *info)) {
        result = std::make_shared<const AnimationClip>(std::move(*clip));
    } else {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "AssetCache: failed to load motion '%s'", motionName.c_str());
    }
    clips_[key] = result;
    return result;
}

void AssetCache::registerSkeleton(const std::string& modelName, SkeletonHandle skeleton) {
    skeletons_[toLower(modelName)] = std::move(skeleton);
}

void AssetCache::registerClip(const std::string& motionName, ClipHandle clip) {
    clips_[toLower(motionName)] = std::move(clip);
}

const std::vector<glm::vec3>* AssetCache::vhots(const std::string& modelName) const {
    auto it = vhots_.find(toLower(modelName));
    return it != vhots_.end() ? &it->second : nullptr;
}

void AssetCache::registerVhots(const std::string& modelName, std::vector<glm::vec3> offsets) {
    vhots_[toLower(modelName)] = std::move(offsets);
}
