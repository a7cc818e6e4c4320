#pragma once

#include <cstddef>
#include <vector>

#include "liquid/systems/fluid/neighbor_finder.hpp"
#include "liquid/systems/fluid/particle_pool.hpp"

namespace TestHelpers {

/**
 * @brief Pool and grid holding particles at exact positions
 */
struct FluidFixture {
    Systems::FluidConfig config;
    Systems::Fluid::ParticlePool pool;
    Systems::Fluid::SpatialGrid grid;

    explicit FluidFixture(const Systems::FluidConfig& cfg)
        : config(cfg), pool(cfg), grid(cfg.cellSize) {}

    /** Spawns one particle per position, no jitter */
    void place(const std::vector<Position>& positions) {
        for (const auto& p : positions) {
            pool.spawn(p, 1, [] { return Vector(0.0, 0.0); }, grid);
        }
    }

    /** Neighbor search and scaled state, as the prepare phase does it */
    void prepare() {
        double const m = config.multiplier();
        for (int idx : pool.getActive()) {
            Systems::Fluid::Particle& p = pool[idx];
            Systems::Fluid::findNeighbors(p, grid, config.maxNeighbors);
            p.scaledPosition = Vector(p.position) * m;
            p.scaledVelocity = p.velocity * m;
            p.pressure = 0.0;
            p.nearPressure = 0.0;
            p.pendingShapeCount = 0;
        }
    }

    std::vector<Vector> zeroBuffer() const {
        return std::vector<Vector>(static_cast<std::size_t>(pool.capacity()), Vector(0.0, 0.0));
    }
};

} // namespace TestHelpers
