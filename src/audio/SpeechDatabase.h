#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "SoundSchema.h"
#include "TagDatabase.h"

// Per-voice speech tables. Loaded from speech.json:
//   { "concepts": [ "tolevelone", ... ],
//     "voices": [ { "label": "vcamera",
//                   "concepts": { "tolevelone": [ { "tags": { "alertlevel": "one" }, "schema": 101 } ] } } ] }
class SpeechDatabase {
public:
    struct Voice {
        std::string label;
        std::vector<TagDatabase> tagMaps;   // indexed by concept
    };

    static std::optional<SpeechDatabase> loadFromFile(const std::string& path);
    static std::optional<SpeechDatabase> loadFromString(const std::string& jsonText);

    // Returns the concept index, adding the concept if it is new
    size_t addConcept(const std::string& speechConcept);
    std::optional<size_t> conceptIndex(const std::string& speechConcept) const;

    size_t addVoice(const std::string& label);
    void addEntry(size_t voiceIndex, const std::string& speechConcept, TagDatabase::Entry entry);

    const std::vector<Voice>& voices() const { return voices_; }
    size_t conceptCount() const { return concepts_.size(); }

private:
    std::vector<std::string> concepts_;
    std::unordered_map<std::string, size_t> conceptIndex_;
    std::vector<Voice> voices_;
};

// Walks voice -> concept tag map -> matching schemas, then picks a schema at random
// and a sample weighted by frequency. Tags that do not parse are ignored; no usable
// tags means every schema of the concept is a candidate.
std::optional<std::string> resolveSpeechSample(const SpeechDatabase& speech, const SoundSchema& sounds,
                                               size_t voiceIndex, const std::string& speechConcept,
                                               const std::vector<std::pair<std::string, std::string>>& tags);
