#include "liquid/systems/fluid/fluid_config.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace Systems {

static void requirePositive(double value, const char* name) {
    if (!(value > 0.0) || !std::isfinite(value)) {
        throw std::invalid_argument(std::string("FluidConfig.") + name + " must be positive and finite");
    }
}

void validateFluidConfig(const FluidConfig& config) {
    if (config.maxParticles <= 0) {
        throw std::invalid_argument("FluidConfig.maxParticles must be positive");
    }
    if (config.maxNeighbors < 0) {
        throw std::invalid_argument("FluidConfig.maxNeighbors must not be negative");
    }
    if (config.maxFixturesPerParticle < 0) {
        throw std::invalid_argument("FluidConfig.maxFixturesPerParticle must not be negative");
    }
    if (config.spawnPerTick < 0) {
        throw std::invalid_argument("FluidConfig.spawnPerTick must not be negative");
    }
    if (config.workerThreads < 0) {
        throw std::invalid_argument("FluidConfig.workerThreads must not be negative");
    }
    requirePositive(config.cellSize, "cellSize");
    requirePositive(config.radius, "radius");
    requirePositive(config.idealRadius, "idealRadius");
    requirePositive(config.dt, "dt");
    requirePositive(config.minDistance, "minDistance");
}

} // namespace Systems
