#include "AudioSink.h"

#include <SDL3/SDL_log.h>

void LoggingAudioSink::play(AudioHandle handle, const std::string& sample) {
    ++playCount_;
    SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "Audio: play %s.wav (handle %llu)",
                 sample.c_str(), static_cast<unsigned long long>(handle.id));
}

void LoggingAudioSink::playSpatial(AudioHandle handle, const std::string& sample, const glm::vec3& position) {
    ++playCount_;
    SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "Audio: play %s.wav at (%.2f, %.2f, %.2f) (handle %llu)",
                 sample.c_str(), position.x, position.y, position.z,
                 static_cast<unsigned long long>(handle.id));
}

void LoggingAudioSink::stop(AudioHandle handle) {
    SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "Audio: stop handle %llu",
                 static_cast<unsigned long long>(handle.id));
}
