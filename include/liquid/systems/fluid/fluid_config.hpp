/**
 * @file fluid_config.hpp
 * @brief Tunables of the particle fluid
 *
 * Distances come in two spaces. World space is what positions, cellSize and
 * radius are measured in. The pressure model works in a scaled space where
 * the interaction cutoff is idealRadius; multiplier() maps world to scaled.
 */

#pragma once

#include <cstdint>

#include "liquid/math/vector_math.hpp"

namespace Systems {

/**
 * @struct FluidConfig
 * @brief Configuration parameters specific to the fluid simulation
 */
struct FluidConfig {
    // Pool and per-particle bounds
    int maxParticles = 20000;
    int maxNeighbors = 75;
    int maxFixturesPerParticle = 20;

    // Spatial hashing
    double cellSize = 0.6;          // world units

    // Pressure model
    double radius = 0.9;            // world-space interaction radius
    double idealRadius = 50.0;      // same radius in scaled space
    double restDensity = 5.0;       // in normalized pressure units
    double viscosity = 0.004;
    double minDistance = 1e-4;      // scaled-space floor for the force divisor

    // Time stepping
    double dt = 1.0 / 60.0;
    Vector gravity{0.0, 9.8};       // world units / s^2, y grows downward

    // Rigid shape collisions
    bool collisionsEnabled = true;
    double collisionEpsilon = 0.05; // push-out distance past the surface
    double restitution = 0.2;
    double friction = 0.85;

    // Spawning
    int spawnPerTick = 4;
    std::uint32_t randomSeed = 0;   // 0 seeds from the clock

    // Parallelism
    int workerThreads = 0;          // 0 picks hardware_concurrency() - 1

    double multiplier() const { return idealRadius / radius; }
};

/**
 * @brief Rejects configurations the solver cannot run with.
 *
 * @throws std::invalid_argument naming the offending field
 */
void validateFluidConfig(const FluidConfig& config);

} // namespace Systems
