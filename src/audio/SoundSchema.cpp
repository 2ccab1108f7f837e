#include "SoundSchema.h"
#include "Random.h"
#include "StringUtils.h"

#include <nlohmann/json.hpp>
#include <SDL3/SDL_log.h>
#include <algorithm>
#include <fstream>
#include <random>
#include <sstream>

using json = nlohmann::json;

std::optional<SoundSchema> SoundSchema::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "SoundSchema: could not open %s", path.c_str());
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return loadFromString(buffer.str());
}

std::optional<SoundSchema> SoundSchema::loadFromString(const std::string& jsonText) {
    SoundSchema schema;
    try {
        json j = json::parse(jsonText);

        for (const auto& s : j.value("schemas", json::array())) {
            std::vector<SoundSample> samples;
            for (const auto& sample : s.value("samples", json::array())) {
                samples.push_back({StringUtils::toLower(sample.at("name").get<std::string>()),
                                   sample.value("frequency", 1u)});
            }
            schema.addSchema(s.at("id").get<int32_t>(), s.value("name", std::string()), std::move(samples));
        }

        for (const auto& e : j.value("environmental", json::array())) {
            TagDatabase::Entry entry;
            entry.dataId = e.at("schema").get<int32_t>();
            for (const auto& [key, value] : e.value("tags", json::object()).items()) {
                entry.tags[StringUtils::toLower(key)] = StringUtils::toLower(value.get<std::string>());
            }
            schema.addEnvironmentalSound(std::move(entry));
        }
    } catch (const json::exception& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "SoundSchema: JSON parse error: %s", e.what());
        return std::nullopt;
    }

    SDL_Log("SoundSchema: loaded %zu schemas, %zu environmental entries",
            schema.samples_.size(), schema.environmental_.size());
    return schema;
}

void SoundSchema::addSchema(int32_t id, const std::string& name, std::vector<SoundSample> samples) {
    samples_[id] = std::move(samples);
    if (!name.empty()) {
        nameToId_[StringUtils::toLower(name)] = id;
    }
}

void SoundSchema::addEnvironmentalSound(TagDatabase::Entry entry) {
    environmental_.add(std::move(entry));
}

const std::vector<SoundSample>* SoundSchema::samples(int32_t schemaId) const {
    auto it = samples_.find(schemaId);
    return it != samples_.end() ? &it->second : nullptr;
}

std::optional<int32_t> SoundSchema::schemaId(const std::string& name) const {
    auto it = nameToId_.find(StringUtils::toLower(name));
    if (it == nameToId_.end()) return std::nullopt;
    return it->second;
}

std::optional<std::string> SoundSchema::randomSample(const std::string& schemaName) const {
    auto id = schemaId(schemaName);
    if (!id) return std::nullopt;
    return randomSampleOf(*id);
}

std::optional<std::string> SoundSchema::randomSampleOf(int32_t schemaId) const {
    const auto* list = samples(schemaId);
    if (!list || list->empty()) return std::nullopt;
    return (*list)[pickWeightedSample(*list)].name;
}

std::optional<std::string> SoundSchema::randomEnvironmentalSound(const TagQuery& query) const {
    std::vector<int32_t> candidates = environmental_.queryBestMatches(query);
    if (candidates.empty()) return std::nullopt;
    return randomSampleOf(candidates[Random::index(candidates.size())]);
}

size_t pickWeightedSample(const std::vector<SoundSample>& samples) {
    std::vector<double> weights;
    weights.reserve(samples.size());
    for (const auto& sample : samples) {
        weights.push_back(static_cast<double>(std::max<uint32_t>(sample.frequency, 1)));
    }
    std::discrete_distribution<size_t> dist(weights.begin(), weights.end());
    return dist(Random::generator());
}
