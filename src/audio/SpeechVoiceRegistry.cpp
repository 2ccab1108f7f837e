#include "SpeechVoiceRegistry.h"
#include "StringUtils.h"
#include "World.h"

#include <SDL3/SDL_log.h>

void SpeechVoiceRegistry::insert(const std::string& label, size_t index) {
    labelToIndex_[StringUtils::toLower(label)] = index;
}

std::optional<size_t> SpeechVoiceRegistry::lookup(const std::string& label) const {
    auto it = labelToIndex_.find(StringUtils::toLower(label));
    if (it == labelToIndex_.end()) return std::nullopt;
    return it->second;
}

std::optional<size_t> resolveEntityVoiceIndex(const ecs::World& world, const SpeechVoiceRegistry& registry,
                                              EntityId entity) {
    if (const auto* voiceIndex = world.tryGet<VoiceIndex>(entity); voiceIndex && voiceIndex->index >= 0) {
        return static_cast<size_t>(voiceIndex->index);
    }

    if (const auto* voice = world.tryGet<SpeechVoice>(entity)) {
        if (auto index = registry.lookup(voice->label)) {
            return index;
        }
        SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "SpeechVoiceRegistry: entity %u has unknown voice '%s'",
                     entityToInt(entity), voice->label.c_str());
    }

    if (const auto* classTags = world.tryGet<ClassTags>(entity)) {
        for (const auto& [tag, value] : classTags->tags) {
            if (StringUtils::equalsIgnoreCase(tag, "creaturetype")) {
                return registry.lookup("v" + value);
            }
        }
    }
    return std::nullopt;
}
