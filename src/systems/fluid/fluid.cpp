/**
 * @file fluid.cpp
 * @brief FluidSystem tick orchestration
 */

#include "liquid/systems/fluid/fluid.hpp"

#include <numeric>

#include "liquid/components/sim.hpp"
#include "liquid/core/debug.hpp"
#include "liquid/core/profile.hpp"
#include "liquid/systems/fluid/collision_resolver.hpp"
#include "liquid/systems/fluid/force_accumulator.hpp"
#include "liquid/systems/fluid/integrator.hpp"
#include "liquid/systems/fluid/neighbor_finder.hpp"
#include "liquid/systems/fluid/pressure_solver.hpp"

namespace Systems {

FluidSystem::FluidSystem()
    : FluidSystem(FluidConfig{})
{
}

FluidSystem::FluidSystem(const FluidConfig& config) {
    setSpecificConfig(config);
}

void FluidSystem::setSpecificConfig(const FluidConfig& config) {
    validateFluidConfig(config);
    specificConfig = config;
    rebuild();
}

void FluidSystem::rebuild() {
    const FluidConfig& cfg = specificConfig;

    grid = std::make_unique<Fluid::SpatialGrid>(cfg.cellSize);
    pool = std::make_unique<Fluid::ParticlePool>(cfg);
    jitter = std::make_unique<Fluid::SpawnJitter>(cfg.randomSeed);

    int const workerCount = cfg.workerThreads > 0
        ? cfg.workerThreads
        : Parallel::WorkerPool::defaultWorkerCount();
    workers = std::make_unique<Parallel::WorkerPool>(workerCount);

    std::size_t const capacity = static_cast<std::size_t>(cfg.maxParticles);
    delta.assign(capacity, Vector(0.0, 0.0));
    scratch.assign(static_cast<std::size_t>(workers->size()),
                   std::vector<Vector>(capacity, Vector(0.0, 0.0)));
    fixtures.clear();

    LIQUID_DEBUG_MSG(LIQUID_DEBUG_LEVEL_BASIC,
        "FluidSystem: capacity " << cfg.maxParticles
        << ", " << workers->size() << " worker(s)\n");
}

int FluidSystem::spawn(const Position& origin, int count) {
    return spawn(origin, count, [this] { return (*jitter)(); });
}

int FluidSystem::spawn(const Position& origin, int count, const Fluid::ParticlePool::JitterFn& jitterFn) {
    if (count <= 0) {
        return 0;
    }
    int const spawned = pool->spawn(origin, count, jitterFn, *grid);
    DebugStats::recordSpawned(static_cast<std::size_t>(spawned));
    return spawned;
}

void FluidSystem::update(entt::registry& registry) {
    auto inputView = registry.view<Components::SpawnInput>();
    for (auto [entity, input] : inputView.each()) {
        (void)entity;
        if (input.spawnRequested) {
            spawn(Position(input.pointer), specificConfig.spawnPerTick);
        }
    }

    if (specificConfig.collisionsEnabled) {
        RigidFluid::RegistryRigidWorld const world(registry);
        step(&world);
    } else {
        step(nullptr);
    }
}

void FluidSystem::step(const RigidFluid::IRigidWorld* world) {
    if (pool->activeCount() == 0) {
        return;
    }

    LIQUID_PROFILE_SCOPE("FluidSystem::step");
    DebugStats::recordActive(static_cast<std::size_t>(pool->activeCount()));

    prepare();

    if (world && specificConfig.collisionsEnabled) {
        LIQUID_PROFILE_SCOPE("BroadPhase");
        Fluid::broadPhase(*pool, *grid, *world, specificConfig, fixtures);
    } else {
        fixtures.clear();
    }
    DebugStats::recordFixtures(fixtures.size());

    computePressures();
    computeForces();

    if (!fixtures.empty()) {
        resolveCollisions();
    }

    integrateAll();

    DebugStats::printStepStats();
}

void FluidSystem::prepare() {
    LIQUID_PROFILE_SCOPE("Prepare");

    const auto& active = pool->getActive();
    double const multiplier = specificConfig.multiplier();
    int const maxNeighbors = specificConfig.maxNeighbors;

    workers->parallelFor(active.size(), [&](std::size_t begin, std::size_t end, int) {
        for (std::size_t k = begin; k < end; ++k) {
            int const idx = active[k];
            Fluid::Particle& p = (*pool)[idx];

            Fluid::findNeighbors(p, *grid, maxNeighbors);
            p.scaledPosition = Vector(p.position) * multiplier;
            p.scaledVelocity = p.velocity * multiplier;
            p.pressure = 0.0;
            p.nearPressure = 0.0;
            p.pendingShapeCount = 0;
            delta[static_cast<std::size_t>(idx)] = Vector(0.0, 0.0);
        }
    });
}

void FluidSystem::computePressures() {
    LIQUID_PROFILE_SCOPE("Pressure");

    const auto& active = pool->getActive();
    workers->parallelFor(active.size(), [&](std::size_t begin, std::size_t end, int) {
        for (std::size_t k = begin; k < end; ++k) {
            Fluid::computePressure((*pool)[active[k]], *pool, specificConfig);
        }
    });
}

void FluidSystem::computeForces() {
    LIQUID_PROFILE_SCOPE("Forces");

    const auto& active = pool->getActive();
    workers->parallelFor(active.size(), [&](std::size_t begin, std::size_t end, int worker) {
        std::vector<Vector>& buffer = scratch[static_cast<std::size_t>(worker)];

        for (std::size_t k = begin; k < end; ++k) {
            Fluid::Particle& p = (*pool)[active[k]];
            Fluid::accumulateForces(p, *pool, specificConfig, buffer);
            Fluid::applyGravity(p, specificConfig);
        }

        // Fan-in: fold this worker's buffer into delta and leave it zeroed
        std::lock_guard<std::mutex> lock(mergeMutex);
        for (int idx : active) {
            std::size_t const i = static_cast<std::size_t>(idx);
            delta[i] += buffer[i];
            buffer[i] = Vector(0.0, 0.0);
        }
    });
}

void FluidSystem::resolveCollisions() {
    LIQUID_PROFILE_SCOPE("Collisions");

    const auto& active = pool->getActive();
    std::vector<int> contacts(static_cast<std::size_t>(workers->size()), 0);

    workers->parallelFor(active.size(), [&](std::size_t begin, std::size_t end, int worker) {
        int found = 0;
        for (std::size_t k = begin; k < end; ++k) {
            int const idx = active[k];
            found += Fluid::resolveCollisions((*pool)[idx], delta[static_cast<std::size_t>(idx)],
                                              fixtures, specificConfig);
        }
        contacts[static_cast<std::size_t>(worker)] = found;
    });

    DebugStats::recordCollisions(static_cast<std::size_t>(
        std::accumulate(contacts.begin(), contacts.end(), 0)));
}

void FluidSystem::integrateAll() {
    LIQUID_PROFILE_SCOPE("Integrate");

    for (int idx : pool->getActive()) {
        Fluid::Particle& p = (*pool)[idx];
        Fluid::integrate(p, delta[static_cast<std::size_t>(idx)], *grid, specificConfig);
        DebugStats::updateSpeed(p.velocity.length());
    }
}

} // namespace Systems
