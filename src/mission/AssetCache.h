#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "AnimationPlayer.h"
#include "MotionDatabase.h"
#include "Skeleton.h"

using SkeletonHandle = std::shared_ptr<const Skeleton>;

// Name-keyed cache of skeletons and clips under the asset root. Failed loads are
// remembered so a missing asset warns once. Loads may block; the tick expects
// assets to be warm.
class AssetCache {
public:
    AssetCache(std::string assetRoot, std::shared_ptr<const MotionDatabase> motionDb);

    // <root>/<name>.cal, else the skin of <root>/<name>.glb (whose clips are registered too)
    SkeletonHandle skeleton(const std::string& modelName);

    // Registered clip, else <root>/motions/<name>.mc decoded with its motion database entry
    ClipHandle clip(const std::string& motionName);

    // Attachment points are only known for object meshes registered here; CAL and GLB
    // models have none
    const std::vector<glm::vec3>* vhots(const std::string& modelName) const;
    void registerVhots(const std::string& modelName, std::vector<glm::vec3> offsets);

    void registerSkeleton(const std::string& modelName, SkeletonHandle skeleton);
    void registerClip(const std::string& motionName, ClipHandle clip);

    size_t skeletonCount() const { return skeletons_.size(); }
    size_t clipCount() const { return clips_.size(); }

private:
    std::string path(const std::string& relative) const;

    std::string assetRoot_;
    std::shared_ptr<const MotionDatabase> motionDb_;
    std::unordered_map<std::string, SkeletonHandle> skeletons_;   // lowercase names; null = failed
    std::unordered_map<std::string, ClipHandle> clips_;
    std::unordered_map<std::string, std::vector<glm::vec3>> vhots_;
};
