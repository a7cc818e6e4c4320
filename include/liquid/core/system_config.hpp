#pragma once

/**
 * @struct SystemConfig
 * @brief Parameters shared by every system in the simulation.
 */
struct SystemConfig {
    double SecondsPerTick = 1.0 / 60.0;
    double UniverseWidthMeters = 32.0;
    double UniverseHeightMeters = 24.0;
};
