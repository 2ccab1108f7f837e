#pragma once

#include <cstddef>
#include <random>

// Process-wide generator for gameplay randomness (motion variants, speech picks)
namespace Random {

inline std::mt19937& generator() {
    static std::random_device rd;
    static std::mt19937 gen(rd());
    return gen;
}

// Uniform index in [0, count); count must be > 0
inline size_t index(size_t count) {
    std::uniform_int_distribution<size_t> dist(0, count - 1);
    return dist(generator());
}

inline float unit() {
    std::uniform_real_distribution<float> dist(0.0f, 1.0f);
    return dist(generator());
}

inline bool chance() {
    return unit() < 0.5f;
}

}  // namespace Random
