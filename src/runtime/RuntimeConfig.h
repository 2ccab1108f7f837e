#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "Effect.h"

// Settings of the debug runtime. Defaults, then the --config file, then CLI flags.
struct RuntimeConfig {
    std::string assetRoot = "assets";
    std::string mission = "earth";
    SpawnLocation spawn;
    uint16_t port = 8080;
    float tickRateHz = 30.0f;
    uint64_t ticks = 0;                 // 0 runs until signalled
    std::optional<std::string> saveFile;
    std::set<std::string> experimental;
    bool verbose = false;
    bool debugPhysics = false;
    bool debugPortals = false;
    bool debugDraw = false;
    bool debugShowIds = false;

    // Applies the keys present in a JSON config file
    //   { "asset_root", "tick_rate_hz", "health_port", "experimental": [...] }
    bool mergeFromJson(const std::string& jsonText);
    bool mergeFromFile(const std::string& path);
};

struct MissionArgument {
    std::string mission;
    SpawnLocation spawn;
};

// name | name:default | name:x,y,z
std::optional<MissionArgument> parseMissionArgument(const std::string& text);

struct CommandLine {
    RuntimeConfig config;
    bool showHelp = false;
    std::string error;                  // non-empty when parsing failed

    bool ok() const { return error.empty(); }
};

CommandLine parseCommandLine(const std::vector<std::string>& args);

void printUsage(const char* program);
