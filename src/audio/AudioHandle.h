#pragma once

#include <atomic>
#include <cstdint>

// Identifies one playing sound so it can be stopped later
struct AudioHandle {
    uint64_t id = 0;

    static AudioHandle next() {
        static std::atomic<uint64_t> counter{1};
        return AudioHandle{counter.fetch_add(1)};
    }

    bool operator==(const AudioHandle& other) const { return id == other.id; }
};
