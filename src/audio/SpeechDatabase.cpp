#include "SpeechDatabase.h"
#include "Random.h"
#include "StringUtils.h"

#include <nlohmann/json.hpp>
#include <SDL3/SDL_log.h>
#include <fstream>
#include <sstream>

using json = nlohmann::json;
using StringUtils::toLower;

std::optional<SpeechDatabase> SpeechDatabase::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "SpeechDatabase: could not open %s", path.c_str());
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return loadFromString(buffer.str());
}

std::optional<SpeechDatabase> SpeechDatabase::loadFromString(const std::string& jsonText) {
    SpeechDatabase db;
    try {
        json j = json::parse(jsonText);

        // Declared order fixes the concept indices
        for (const auto& speechConcept : j.value("concepts", json::array())) {
            db.addConcept(speechConcept.get<std::string>());
        }

        for (const auto& v : j.value("voices", json::array())) {
            size_t voiceIndex = db.addVoice(v.value("label", std::string()));
            for (const auto& [speechConcept, entries] : v.value("concepts", json::object()).items()) {
                for (const auto& e : entries) {
                    TagDatabase::Entry entry;
                    entry.dataId = e.at("schema").get<int32_t>();
                    for (const auto& [key, value] : e.value("tags", json::object()).items()) {
                        entry.tags[toLower(key)] = toLower(value.get<std::string>());
                    }
                    db.addEntry(voiceIndex, speechConcept, std::move(entry));
                }
            }
        }
    } catch (const json::exception& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "SpeechDatabase: JSON parse error: %s", e.what());
        return std::nullopt;
    }

    SDL_Log("SpeechDatabase: loaded %zu voices, %zu concepts", db.voices_.size(), db.concepts_.size());
    return db;
}

size_t SpeechDatabase::addConcept(const std::string& speechConcept) {
    std::string key = toLower(speechConcept);
    auto it = conceptIndex_.find(key);
    if (it != conceptIndex_.end()) {
        return it->second;
    }
    size_t index = concepts_.size();
    concepts_.push_back(key);
    conceptIndex_[key] = index;
    return index;
}

std::optional<size_t> SpeechDatabase::conceptIndex(const std::string& speechConcept) const {
    auto it = conceptIndex_.find(toLower(speechConcept));
    if (it == conceptIndex_.end()) return std::nullopt;
    return it->second;
}

size_t SpeechDatabase::addVoice(const std::string& label) {
    voices_.push_back(Voice{toLower(label), {}});
    return voices_.size() - 1;
}

void SpeechDatabase::addEntry(size_t voiceIndex, const std::string& speechConcept, TagDatabase::Entry entry) {
    if (voiceIndex >= voices_.size()) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "SpeechDatabase: voice %zu out of range", voiceIndex);
        return;
    }
    size_t index = addConcept(speechConcept);
    auto& tagMaps = voices_[voiceIndex].tagMaps;
    if (tagMaps.size() <= index) {
        tagMaps.resize(index + 1);
    }
    tagMaps[index].add(std::move(entry));
}

std::optional<std::string> resolveSpeechSample(const SpeechDatabase& speech, const SoundSchema& sounds,
                                               size_t voiceIndex, const std::string& speechConcept,
                                               const std::vector<std::pair<std::string, std::string>>& tags) {
    if (voiceIndex >= speech.voices().size()) {
        return std::nullopt;
    }
    auto conceptIdx = speech.conceptIndex(speechConcept);
    if (!conceptIdx) {
        return std::nullopt;
    }

    const auto& voice = speech.voices()[voiceIndex];
    if (*conceptIdx >= voice.tagMaps.size()) {
        return std::nullopt;
    }
    const TagDatabase& tagDb = voice.tagMaps[*conceptIdx];

    TagQuery query;
    for (const auto& [tag, value] : tags) {
        if (tag.empty() || value.empty()) continue;
        query.push_back({toLower(tag), toLower(value), false});
    }

    std::vector<int32_t> candidates = query.empty() ? tagDb.collectAllDataIds() : tagDb.queryMatchAll(query);
    if (candidates.empty()) {
        return std::nullopt;
    }

    int32_t schemaId = candidates[Random::index(candidates.size())];
    return sounds.randomSampleOf(schemaId);
}
