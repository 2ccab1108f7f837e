#pragma once

#include <memory>
#include <string>

#include "CreatureDefinitions.h"
#include "MotionDatabase.h"
#include "PathfindingService.h"
#include "SoundSchema.h"
#include "SpeechDatabase.h"
#include "SpeechVoiceRegistry.h"
#include "TemplateLibrary.h"

// Game-wide data loaded once and shared read-only by every mission and tick
struct GlobalContext {
    std::string assetRoot;
    std::shared_ptr<const MotionDatabase> motionDb;
    std::shared_ptr<const TemplateLibrary> templates;
    std::shared_ptr<const CreatureDefinitions> creatures;
    std::shared_ptr<const SoundSchema> sounds;
    std::shared_ptr<const SpeechDatabase> speech;
    std::shared_ptr<const SpeechVoiceRegistry> voices;

    // Per mission; null when the level has no navigation data
    std::shared_ptr<const PathfindingService> pathfinding;

    const CreatureDefinition* creatureDefinition(uint32_t type) const {
        return creatures ? creatures->find(type) : nullptr;
    }
};

// Reads motiondb.json, gamesys.json (templates and creatures), schemas.json and
// speech.json from the asset root. Missing files leave that part empty with a warning.
GlobalContext loadGlobalContext(const std::string& assetRoot);
