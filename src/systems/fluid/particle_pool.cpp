#include "liquid/systems/fluid/particle_pool.hpp"

#include <chrono>

namespace Systems {
namespace Fluid {

static std::uint32_t resolveSeed(std::uint32_t seed) {
    if (seed != 0) {
        return seed;
    }
    return static_cast<std::uint32_t>(
        std::chrono::steady_clock::now().time_since_epoch().count());
}

SpawnJitter::SpawnJitter(std::uint32_t seed)
    : engine(resolveSeed(seed))
{
}

Vector SpawnJitter::operator()() {
    double const x = xDist(engine);
    double const y = yDist(engine);
    return Vector(x, y);
}

ParticlePool::ParticlePool(const FluidConfig& config)
    : particles(static_cast<std::size_t>(config.maxParticles))
{
    active.reserve(particles.size());
    for (std::size_t i = 0; i < particles.size(); ++i) {
        Particle& p = particles[i];
        p.index = static_cast<int>(i);
        p.neighbors.resize(static_cast<std::size_t>(config.maxNeighbors));
        p.distances.resize(static_cast<std::size_t>(config.maxNeighbors));
        p.pendingShapes.resize(static_cast<std::size_t>(config.maxFixturesPerParticle));
    }
}

int ParticlePool::spawn(const Position& origin, int count, const JitterFn& jitter, SpatialGrid& grid) {
    int spawned = 0;
    int const cap = capacity();

    while (spawned < count && firstFree < cap) {
        Particle& p = particles[static_cast<std::size_t>(firstFree)];
        ++firstFree;
        if (p.alive) {
            continue;
        }

        p.alive = true;
        p.position = origin + jitter();
        p.oldPosition = p.position;
        p.velocity = Vector(0.0, 0.0);
        p.neighborCount = 0;
        p.pendingShapeCount = 0;
        p.pressure = 0.0;
        p.nearPressure = 0.0;

        Cell const cell = grid.cellOf(p.position);
        p.cellX = cell.x;
        p.cellY = cell.y;
        grid.insert(p.index, cell.x, cell.y);

        active.push_back(p.index);
        ++spawned;
    }

    return spawned;
}

} // namespace Fluid
} // namespace Systems
