#pragma once

#include <glm/glm.hpp>
#include <string>

#include "AudioHandle.h"

// Audio playback collaborator. Samples are named without extension; the sink
// owns loading and mixing on its own thread.
class AudioSink {
public:
    virtual ~AudioSink() = default;

    virtual void play(AudioHandle handle, const std::string& sample) = 0;
    virtual void playSpatial(AudioHandle handle, const std::string& sample, const glm::vec3& position) = 0;
    virtual void stop(AudioHandle handle) = 0;
};

// Sink used by the headless runtime: logs what would be played
class LoggingAudioSink final : public AudioSink {
public:
    void play(AudioHandle handle, const std::string& sample) override;
    void playSpatial(AudioHandle handle, const std::string& sample, const glm::vec3& position) override;
    void stop(AudioHandle handle) override;

    size_t playCount() const { return playCount_; }

private:
    size_t playCount_ = 0;
};
