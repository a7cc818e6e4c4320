/**
 * @file particle_pool.hpp
 * @brief Fixed-capacity particle arena with a compact active list
 */

#pragma once

#include <cstdint>
#include <functional>
#include <random>
#include <vector>

#include "liquid/systems/fluid/fluid_config.hpp"
#include "liquid/systems/fluid/particle.hpp"
#include "liquid/systems/fluid/spatial_grid.hpp"

namespace Systems {
namespace Fluid {

/**
 * @brief Random spawn offset: x in [-1, 1), y in [-0.5, 0.5) world units.
 *
 * A seed of 0 seeds from the clock.
 */
class SpawnJitter {
public:
    explicit SpawnJitter(std::uint32_t seed);

    Vector operator()();

private:
    std::default_random_engine engine;
    std::uniform_real_distribution<double> xDist{-1.0, 1.0};
    std::uniform_real_distribution<double> yDist{-0.5, 0.5};
};

class ParticlePool {
public:
    using JitterFn = std::function<Vector()>;

    explicit ParticlePool(const FluidConfig& config);

    /**
     * @brief Activates up to count dead particles around origin.
     *
     * Lowest free indices go first. Each new particle starts at rest at
     * origin + jitter(), is inserted into the grid and appended to the active
     * list. A full pool spawns nothing.
     *
     * @return Number of particles actually activated
     */
    int spawn(const Position& origin, int count, const JitterFn& jitter, SpatialGrid& grid);

    Particle& operator[](int index) { return particles[static_cast<std::size_t>(index)]; }
    const Particle& operator[](int index) const { return particles[static_cast<std::size_t>(index)]; }

    const std::vector<int>& getActive() const { return active; }
    int activeCount() const { return static_cast<int>(active.size()); }
    int capacity() const { return static_cast<int>(particles.size()); }
    bool full() const { return activeCount() >= capacity(); }

private:
    std::vector<Particle> particles;
    std::vector<int> active;
    int firstFree = 0;  // no index below this is dead
};

} // namespace Fluid
} // namespace Systems
