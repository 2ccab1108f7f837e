#include "HealthServer.h"
#include "JoltPhysicsWorld.h"
#include "MissionCore.h"
#include "Profiling.h"
#include "RuntimeConfig.h"
#include "RuntimeSnapshot.h"

#include <SDL3/SDL.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <string>
#include <thread>
#include <vector>

namespace {

std::atomic<bool> g_stopRequested{false};

void onSignal(int) {
    g_stopRequested = true;
}

std::unique_ptr<MissionCore> loadMission(const RuntimeConfig& config, const GlobalContext& global,
                                         const std::string& name, const SpawnLocation& spawn,
                                         const HeldItemState* heldItems) {
    auto description = MissionLoader::load(config.assetRoot, name);
    if (!description) {
        return nullptr;
    }
    auto physics = JoltPhysicsWorld::create();
    if (!physics) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Runtime: Failed to create physics world");
        return nullptr;
    }

    MissionOptions options;
    options.experimental = config.experimental;
    auto mission = std::make_unique<MissionCore>(name, global, std::move(physics),
                                                 std::make_shared<LoggingAudioSink>(), options);
    auto& debug = mission->world().debugOptions();
    debug.debugPhysics = config.debugPhysics;
    debug.debugPortals = config.debugPortals;
    debug.debugDraw = config.debugDraw;
    debug.showIds = config.debugShowIds;

    mission->populate(*description, spawn);
    if (heldItems && !heldItems->empty()) {
        mission->restoreHeldItems(*heldItems);
    }
    return mission;
}

}  // namespace

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);
    CommandLine commandLine = parseCommandLine(args);
    if (commandLine.showHelp) {
        printUsage(argv[0]);
        return 0;
    }
    if (!commandLine.ok()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "%s", commandLine.error.c_str());
        printUsage(argv[0]);
        return 2;
    }
    const RuntimeConfig& config = commandLine.config;
    if (config.verbose) {
        SDL_SetLogPriority(SDL_LOG_CATEGORY_APPLICATION, SDL_LOG_PRIORITY_DEBUG);
    }

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    GlobalContext global = loadGlobalContext(config.assetRoot);

    std::optional<HeldItemState> heldItems;
    if (config.saveFile) {
        heldItems = HeldItemState::loadFromFile(*config.saveFile);
    }

    auto mission = loadMission(config, global, config.mission, config.spawn, heldItems ? &*heldItems : nullptr);
    if (!mission) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Runtime: Unable to load mission '%s'", config.mission.c_str());
        return 1;
    }

    RuntimeSnapshot snapshot;
    HealthServer server(snapshot);
    if (!server.start(config.port)) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Runtime: Continuing without the health endpoint");
    }

    const float tickRate = config.tickRateHz > 0.0f ? config.tickRateHz : 30.0f;
    const float deltaTime = 1.0f / tickRate;
    const auto tickDuration = std::chrono::duration<double>(deltaTime);
    double elapsed = 0.0;
    uint64_t ticks = 0;

    SDL_Log("Runtime: Running '%s' at %.0f Hz", mission->name().c_str(), tickRate);
    auto nextTick = std::chrono::steady_clock::now();
    while (!g_stopRequested && (config.ticks == 0 || ticks < config.ticks)) {
        TickResult result = mission->tick(deltaTime);
        DARKCORE_FRAME_MARK;
        ++ticks;
        elapsed += deltaTime;

        for (const auto& effect : result.globalEffects) {
            if (const auto* transition = std::get_if<GlobalEffects::TransitionLevel>(&effect)) {
                SDL_Log("Runtime: Transitioning to '%s'", transition->mission.c_str());
                HeldItemState carried = mission->captureHeldItems();
                auto next = loadMission(config, global, transition->mission, transition->spawn, &carried);
                if (next) {
                    mission = std::move(next);
                } else {
                    SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Runtime: Staying in '%s'", mission->name().c_str());
                }
                break;
            } else if (const auto* save = std::get_if<GlobalEffects::Save>(&effect)) {
                if (!mission->captureHeldItems().saveToFile(save->path)) {
                    SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Runtime: Save request dropped");
                }
            } else if (std::holds_alternative<GlobalEffects::Quit>(effect)) {
                g_stopRequested = true;
            }
        }

        snapshot.publish(RuntimeStats{mission->name(), mission->frame(), elapsed,
                                      mission->world().entityCount(), mission->world().player().position});

        nextTick += std::chrono::duration_cast<std::chrono::steady_clock::duration>(tickDuration);
        std::this_thread::sleep_until(nextTick);
    }

    SDL_Log("Runtime: Stopping after %llu ticks", static_cast<unsigned long long>(ticks));
    int exitCode = 0;
    if (config.saveFile && !mission->captureHeldItems().saveToFile(*config.saveFile)) {
        exitCode = 1;
    }
    server.stop();
    return exitCode;
}
