#include "GlobalContext.h"

#include <SDL3/SDL_log.h>
#include <filesystem>
#include <fstream>

namespace {

std::optional<std::string> readText(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "GlobalContext: missing '%s'", path.string().c_str());
        return std::nullopt;
    }
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

}  // namespace

GlobalContext loadGlobalContext(const std::string& assetRoot) {
    const std::filesystem::path root(assetRoot);
    GlobalContext global;
    global.assetRoot = assetRoot;

    auto motionDb = MotionDatabase::loadFromFile((root / "motiondb.json").string());
    global.motionDb = std::make_shared<const MotionDatabase>(motionDb ? std::move(*motionDb) : MotionDatabase());

    std::optional<TemplateLibrary> templates;
    std::optional<CreatureDefinitions> creatures;
    if (auto gamesys = readText(root / "gamesys.json")) {
        templates = TemplateLibrary::loadFromString(*gamesys);
        creatures = CreatureDefinitions::loadFromString(*gamesys);
    }
    global.templates = std::make_shared<const TemplateLibrary>(templates ? std::move(*templates) : TemplateLibrary());
    global.creatures = std::make_shared<const CreatureDefinitions>(creatures ? std::move(*creatures) : CreatureDefinitions());

    auto sounds = SoundSchema::loadFromFile((root / "schemas.json").string());
    global.sounds = std::make_shared<const SoundSchema>(sounds ? std::move(*sounds) : SoundSchema());

    auto speech = SpeechDatabase::loadFromFile((root / "speech.json").string());
    auto voices = std::make_shared<SpeechVoiceRegistry>();
    if (speech) {
        for (size_t i = 0; i < speech->voices().size(); ++i) {
            voices->insert(speech->voices()[i].label, i);
        }
    }
    global.speech = std::make_shared<const SpeechDatabase>(speech ? std::move(*speech) : SpeechDatabase());
    global.voices = voices;

    SDL_Log("GlobalContext: %zu templates, %zu creatures, %zu sound schemas, %zu voices from '%s'",
            global.templates->size(), global.creatures->size(), global.sounds->schemaCount(),
            global.voices->size(), assetRoot.c_str());
    return global;
}
