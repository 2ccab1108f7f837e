#pragma once

#include <cstddef>

// Asset data is authored in Dark engine units; runtime space is asset units / SCALE_FACTOR
constexpr float SCALE_FACTOR = 2.5f;

// Bone budget of the target game. Matrix exports are fixed at this size.
constexpr size_t MAX_JOINTS = 40;
