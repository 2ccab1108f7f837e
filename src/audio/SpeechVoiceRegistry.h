#pragma once

#include <optional>
#include <string>
#include <unordered_map>

#include "EntityId.h"

namespace ecs { class World; }

// Case-insensitive voice label -> voice index ("vcamera" -> 3)
class SpeechVoiceRegistry {
public:
    void insert(const std::string& label, size_t index);
    std::optional<size_t> lookup(const std::string& label) const;

    size_t size() const { return labelToIndex_.size(); }

private:
    std::unordered_map<std::string, size_t> labelToIndex_;
};

// Voice of an entity: its VoiceIndex when non-negative, else its SpeechVoice label,
// else "v" + its creaturetype class tag.
std::optional<size_t> resolveEntityVoiceIndex(const ecs::World& world, const SpeechVoiceRegistry& registry,
                                              EntityId entity);
