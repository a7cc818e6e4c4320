/**
 * @file scenario_config.hpp
 * @brief Configuration a scenario hands to the simulator
 */

#pragma once

#include <vector>

#include "liquid/core/system_config.hpp"
#include "liquid/math/vector_math.hpp"
#include "liquid/systems/fluid/fluid_config.hpp"

/**
 * @brief A batch of particles spawned once when the scenario starts
 */
struct SpawnBurst {
    Position origin;
    int count = 0;
};

/**
 * @struct ScenarioConfig
 * @brief Complete configuration for a scenario: shared and fluid parameters
 * plus the initial fluid
 */
struct ScenarioConfig {
    SystemConfig systemConfig;
    Systems::FluidConfig fluidConfig;
    std::vector<SpawnBurst> initialBursts;
};
