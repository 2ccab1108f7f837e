#pragma once

#include <glm/glm.hpp>
#include <cstdint>
#include <mutex>
#include <string>

// Aggregate view of the running mission, published by the tick thread and read
// by the debug server
struct RuntimeStats {
    std::string mission;
    uint64_t frame = 0;
    double elapsedSeconds = 0.0;
    size_t entityCount = 0;
    glm::vec3 playerPosition{0.0f};
};

class RuntimeSnapshot {
public:
    void publish(const RuntimeStats& stats) {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_ = stats;
    }

    RuntimeStats read() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stats_;
    }

private:
    mutable std::mutex mutex_;
    RuntimeStats stats_;
};
