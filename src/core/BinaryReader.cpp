#include "BinaryReader.h"
#include <SDL3/SDL_log.h>
#include <fstream>

std::optional<std::vector<uint8_t>> readFileBytes(const std::string& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "BinaryReader: Failed to open '%s'", path.c_str());
        return std::nullopt;
    }

    std::streamsize size = file.tellg();
    file.seekg(0, std::ios::beg);

    std::vector<uint8_t> bytes(static_cast<size_t>(size));
    if (size > 0 && !file.read(reinterpret_cast<char*>(bytes.data()), size)) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "BinaryReader: Short read on '%s'", path.c_str());
        return std::nullopt;
    }
    return bytes;
}
