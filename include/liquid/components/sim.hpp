#pragma once

#include <cstdint>

#include "liquid/math/vector_math.hpp"

namespace Components {
    struct SimulatorState {
        std::uint64_t tickCount = 0;

        explicit SimulatorState(std::uint64_t ticks = 0)
            : tickCount(ticks) {}
    };

    // Pointer input written by the host each frame, in world units
    struct SpawnInput {
        Vector pointer;
        bool spawnRequested = false;
    };
}
