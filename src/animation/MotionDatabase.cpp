#include "MotionDatabase.h"
#include "Random.h"
#include "StringUtils.h"
#include <nlohmann/json.hpp>
#include <SDL3/SDL_log.h>
#include <algorithm>
#include <cctype>
#include <fstream>

using json = nlohmann::json;

namespace {

using StringUtils::toLower;

glm::vec3 readVec3(const json& j) {
    if (!j.is_array() || j.size() != 3) return glm::vec3(0.0f);
    return glm::vec3(j[0].get<float>(), j[1].get<float>(), j[2].get<float>());
}

void parseSchemas(const json& schemasArray, MotionDatabase& db) {
    for (const auto& schemaJson : schemasArray) {
        if (!schemaJson.contains("motions")) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                "MotionDatabase: Schema missing 'motions' field, skipping");
            continue;
        }

        MotionSchema schema;
        schema.actorType = schemaJson.value("actor_type", 0u);
        if (schemaJson.contains("tags")) {
            for (const auto& tag : schemaJson["tags"]) {
                schema.tags.push_back(toLower(tag.get<std::string>()));
            }
        }
        for (const auto& motion : schemaJson["motions"]) {
            schema.motions.push_back(toLower(motion.get<std::string>()));
        }
        db.addSchema(std::move(schema));
    }
}

void parseMotions(const json& motionsArray, MotionDatabase& db) {
    for (const auto& motionJson : motionsArray) {
        if (!motionJson.contains("name")) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                "MotionDatabase: Motion missing 'name' field, skipping");
            continue;
        }

        MotionInfo info;
        info.name = toLower(motionJson["name"].get<std::string>());
        info.frameCount = motionJson.value("frame_count", 0.0f);
        info.fps = motionJson.value("fps", 30.0f);
        info.endDirection = motionJson.value("end_direction", 0.0f);
        info.duration = motionJson.value("duration", 0.0f);
        if (motionJson.contains("translation")) {
            info.translation = readVec3(motionJson["translation"]);
        }
        if (motionJson.contains("blend_length_ms")) {
            info.blendLength = motionJson["blend_length_ms"].get<float>() / 1000.0f;
        }

        if (motionJson.contains("flags")) {
            for (const auto& flagJson : motionJson["flags"]) {
                MotionFlagFrame flagFrame;
                flagFrame.frame = flagJson.value("frame", 0u);
                for (const auto& name : flagJson.value("flags", json::array())) {
                    uint32_t bit = MotionFlag::fromName(name.get<std::string>());
                    if (bit == 0) {
                        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                            "MotionDatabase: Unknown motion flag '%s' on '%s'",
                            name.get<std::string>().c_str(), info.name.c_str());
                    }
                    flagFrame.flags |= bit;
                }
                info.flags.push_back(flagFrame);
            }
        }

        db.addMotion(std::move(info));
    }
}

} // anonymous namespace

std::optional<MotionDatabase> MotionDatabase::loadFromString(const std::string& jsonText) {
    try {
        json root = json::parse(jsonText);
        MotionDatabase db;
        if (root.contains("schemas") && root["schemas"].is_array()) {
            parseSchemas(root["schemas"], db);
        }
        if (root.contains("motions") && root["motions"].is_array()) {
            parseMotions(root["motions"], db);
        }
        return db;
    } catch (const json::exception& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
            "MotionDatabase: JSON parse error: %s", e.what());
        return std::nullopt;
    }
}

std::optional<MotionDatabase> MotionDatabase::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
            "MotionDatabase: Failed to open file '%s'", path.c_str());
        return std::nullopt;
    }

    std::string contents((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    auto db = loadFromString(contents);
    if (db) {
        SDL_Log("MotionDatabase: Loaded %zu schemas and %zu motions from '%s'",
                db->schemaCount(), db->motionCount(), path.c_str());
    }
    return db;
}

void MotionDatabase::addSchema(MotionSchema schema) {
    schemas_.push_back(std::move(schema));
}

void MotionDatabase::addMotion(MotionInfo info) {
    std::string key = info.name;
    motions_[key] = std::move(info);
}

std::optional<std::string> MotionDatabase::query(const MotionQuery& query) const {
    std::vector<const std::string*> best;
    int bestScore = -1;

    for (const auto& schema : schemas_) {
        if (schema.actorType != query.actorType || schema.motions.empty()) {
            continue;
        }

        bool matches = true;
        int score = 0;
        for (const auto& item : query.items) {
            std::string tag = toLower(item.tag);
            bool present = std::find(schema.tags.begin(), schema.tags.end(), tag) != schema.tags.end();
            if (!present && !item.optional) {
                matches = false;
                break;
            }
            if (present && item.optional) {
                ++score;
            }
        }
        if (!matches) continue;

        if (score > bestScore) {
            bestScore = score;
            best.clear();
        }
        if (score == bestScore) {
            for (const auto& motion : schema.motions) {
                best.push_back(&motion);
            }
        }
    }

    if (best.empty()) {
        return std::nullopt;
    }

    size_t pick = query.selection.kind == MotionSelection::Kind::Sequential
        ? query.selection.counter % best.size()
        : Random::index(best.size());
    return *best[pick];
}

const MotionInfo* MotionDatabase::motionInfo(const std::string& name) const {
    auto it = motions_.find(toLower(name));
    return it != motions_.end() ? &it->second : nullptr;
}
