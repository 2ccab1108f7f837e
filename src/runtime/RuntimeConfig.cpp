#include "RuntimeConfig.h"
#include "StringUtils.h"

#include <SDL3/SDL_log.h>
#include <nlohmann/json.hpp>
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

bool RuntimeConfig::mergeFromJson(const std::string& jsonText) {
    try {
        json j = json::parse(jsonText);
        assetRoot = j.value("asset_root", assetRoot);
        tickRateHz = j.value("tick_rate_hz", tickRateHz);
        port = j.value("health_port", port);
        if (j.contains("experimental")) {
            for (const auto& flag : j.at("experimental")) {
                experimental.insert(flag.get<std::string>());
            }
        }
        return true;
    } catch (const json::exception& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "RuntimeConfig: Failed to parse config: %s", e.what());
        return false;
    }
}

bool RuntimeConfig::mergeFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "RuntimeConfig: Failed to open config '%s'", path.c_str());
        return false;
    }
    std::string contents((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    return mergeFromJson(contents);
}

namespace {

std::optional<float> parseFloat(const std::string& text) {
    try {
        size_t used = 0;
        float value = std::stof(text, &used);
        if (used != text.size()) {
            return std::nullopt;
        }
        return value;
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
}

std::optional<unsigned long long> parseUnsigned(const std::string& text) {
    if (text.empty() || text[0] == '-') {
        return std::nullopt;
    }
    try {
        size_t used = 0;
        unsigned long long value = std::stoull(text, &used);
        if (used != text.size()) {
            return std::nullopt;
        }
        return value;
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
}

}  // namespace

std::optional<MissionArgument> parseMissionArgument(const std::string& text) {
    auto colon = text.find(':');
    if (colon == std::string::npos) {
        if (text.empty()) {
            return std::nullopt;
        }
        return MissionArgument{text, SpawnLocation::mapDefault()};
    }

    std::string name = text.substr(0, colon);
    std::string spawn = text.substr(colon + 1);
    if (name.empty()) {
        return std::nullopt;
    }
    if (spawn == "default") {
        return MissionArgument{name, SpawnLocation::mapDefault()};
    }

    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        auto comma = spawn.find(',', start);
        parts.push_back(spawn.substr(start, comma == std::string::npos ? std::string::npos : comma - start));
        if (comma == std::string::npos) break;
        start = comma + 1;
    }
    if (parts.size() != 3) {
        return std::nullopt;
    }
    auto x = parseFloat(parts[0]);
    auto y = parseFloat(parts[1]);
    auto z = parseFloat(parts[2]);
    if (!x || !y || !z) {
        return std::nullopt;
    }
    return MissionArgument{name, SpawnLocation::at(glm::vec3(*x, *y, *z))};
}

CommandLine parseCommandLine(const std::vector<std::string>& args) {
    CommandLine result;
    RuntimeConfig& config = result.config;

    // The config file is applied first so flags can override it
    for (size_t i = 0; i + 1 < args.size(); ++i) {
        if (args[i] == "--config") {
            if (!config.mergeFromFile(args[i + 1])) {
                result.error = "Unable to load config file " + args[i + 1];
                return result;
            }
        }
    }

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        const bool hasValue = i + 1 < args.size();

        if (arg == "--help" || arg == "-h") {
            result.showHelp = true;
        } else if (arg == "--config" && hasValue) {
            ++i;
        } else if (arg == "--mission" && hasValue) {
            auto mission = parseMissionArgument(args[++i]);
            if (!mission) {
                result.error = "Unable to parse mission argument: " + args[i];
                return result;
            }
            config.mission = mission->mission;
            config.spawn = mission->spawn;
        } else if (arg == "--port" && hasValue) {
            auto port = parseUnsigned(args[++i]);
            if (!port || *port > 65535) {
                result.error = "Invalid port: " + args[i];
                return result;
            }
            config.port = static_cast<uint16_t>(*port);
        } else if (arg == "--assets" && hasValue) {
            config.assetRoot = args[++i];
        } else if (arg == "--ticks" && hasValue) {
            auto ticks = parseUnsigned(args[++i]);
            if (!ticks) {
                result.error = "Invalid tick count: " + args[i];
                return result;
            }
            config.ticks = *ticks;
        } else if (arg == "--save-file" && hasValue) {
            config.saveFile = args[++i];
        } else if (arg == "--experimental" && hasValue) {
            for (const auto& flag : StringUtils::split(args[++i], ',')) {
                config.experimental.insert(flag);
            }
        } else if (arg == "--verbose") {
            config.verbose = true;
        } else if (arg == "--debug-physics") {
            config.debugPhysics = true;
        } else if (arg == "--debug-portals") {
            config.debugPortals = true;
        } else if (arg == "--debug-draw") {
            config.debugDraw = true;
        } else if (arg == "--debug-show-ids") {
            config.debugShowIds = true;
        } else {
            result.error = "Unknown or incomplete argument: " + arg;
            return result;
        }
    }
    return result;
}

void printUsage(const char* program) {
    SDL_Log("Usage: %s [options]", program);
    SDL_Log("");
    SDL_Log("  --mission <name[:spawn]>  Mission to load; spawn is 'default' or x,y,z");
    SDL_Log("  --assets <dir>            Asset root (default: assets)");
    SDL_Log("  --config <path>           JSON config applied before the flags");
    SDL_Log("  --port <n>                Health endpoint port on 127.0.0.1 (default: 8080)");
    SDL_Log("  --ticks <n>               Run n ticks then exit (default: until signalled)");
    SDL_Log("  --save-file <path>        Held-item state loaded on start and saved on exit");
    SDL_Log("  --experimental <a,b>      Enable experimental features (e.g. gui)");
    SDL_Log("  --debug-physics, --debug-portals, --debug-draw, --debug-show-ids");
    SDL_Log("  --verbose                 Debug level logging");
}
