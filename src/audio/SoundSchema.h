#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "TagDatabase.h"

struct SoundSample {
    std::string name;
    uint32_t frequency = 1;
};

// Named groups of interchangeable samples plus the environmental sound tag table.
// Loaded from schemas.json:
//   { "schemas": [ { "id", "name", "samples": [ { "name", "frequency" } ] } ],
//     "environmental": [ { "tags": { "event": "death", ... }, "schema": id } ] }
class SoundSchema {
public:
    static std::optional<SoundSchema> loadFromFile(const std::string& path);
    static std::optional<SoundSchema> loadFromString(const std::string& jsonText);

    void addSchema(int32_t id, const std::string& name, std::vector<SoundSample> samples);
    void addEnvironmentalSound(TagDatabase::Entry entry);

    const std::vector<SoundSample>* samples(int32_t schemaId) const;
    std::optional<int32_t> schemaId(const std::string& name) const;

    // Sample picked by frequency weight; nullopt for unknown names
    std::optional<std::string> randomSample(const std::string& schemaName) const;
    std::optional<std::string> randomSampleOf(int32_t schemaId) const;

    // Random sample from a random schema among the best matches of the query
    std::optional<std::string> randomEnvironmentalSound(const TagQuery& query) const;

    size_t schemaCount() const { return samples_.size(); }

private:
    std::unordered_map<int32_t, std::vector<SoundSample>> samples_;
    std::unordered_map<std::string, int32_t> nameToId_;
    TagDatabase environmental_;
};

// Index of one sample, weighted by max(frequency, 1)
size_t pickWeightedSample(const std::vector<SoundSample>& samples);
