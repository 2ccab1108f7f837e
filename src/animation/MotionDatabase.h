#pragma once

#include <glm/glm.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "AnimationClip.h"

struct MotionQueryItem {
    std::string tag;
    bool optional = false;

    static MotionQueryItem required(const std::string& tag) { return {tag, false}; }
    static MotionQueryItem preferred(const std::string& tag) { return {tag, true}; }
};

// How to choose among equally ranked matches
struct MotionSelection {
    enum class Kind { Random, Sequential };

    Kind kind = Kind::Random;
    uint32_t counter = 0;

    static MotionSelection random() { return {Kind::Random, 0}; }
    static MotionSelection sequential(uint32_t n) { return {Kind::Sequential, n}; }
};

struct MotionQuery {
    uint32_t actorType = 0;
    std::vector<MotionQueryItem> items;
    MotionSelection selection;
};

// Per-motion metadata needed to turn a raw .mc file into an AnimationClip
struct MotionInfo {
    std::string name;
    float frameCount = 0.0f;
    float fps = 30.0f;
    float endDirection = 0.0f;          // degrees
    glm::vec3 translation{0.0f};        // asset units over the whole motion
    float duration = 0.0f;              // seconds
    float blendLength = AnimationClip::DEFAULT_BLEND_LENGTH;
    std::vector<MotionFlagFrame> flags;
};

struct MotionSchema {
    uint32_t actorType = 0;
    std::vector<std::string> tags;
    std::vector<std::string> motions;
};

// Tag-indexed lookup from (actor type, tags) to motion names.
// Loaded once from motiondb.json and shared read-only.
class MotionDatabase {
public:
    static std::optional<MotionDatabase> loadFromFile(const std::string& path);
    static std::optional<MotionDatabase> loadFromString(const std::string& jsonText);

    void addSchema(MotionSchema schema);
    void addMotion(MotionInfo info);

    // Required items must all be present on a schema; preferred items rank the survivors.
    // Ties between the best ranked motions are broken by the query's selection.
    std::optional<std::string> query(const MotionQuery& query) const;

    const MotionInfo* motionInfo(const std::string& name) const;

    size_t schemaCount() const { return schemas_.size(); }
    size_t motionCount() const { return motions_.size(); }

private:
    std::vector<MotionSchema> schemas_;
    std::unordered_map<std::string, MotionInfo> motions_;
};
