/**
 * @file fluid.hpp
 * @brief Particle fluid system: double-density relaxation over a hash grid,
 * with optional collisions against rigid fixtures.
 *
 * Each tick runs a fixed sequence of phases, every one a full barrier:
 *  - prepare (parallel): neighbor search, scaled state, scratch reset
 *  - broad phase (sequential, collision mode): stamp nearby fixtures
 *  - pressure (parallel)
 *  - force (parallel): per-worker scratch buffers merged into delta
 *  - collision resolve (parallel, when fixtures were found)
 *  - integrate (sequential): velocity/position update and re-gridding
 *
 * The grid is only mutated by spawning and by the integrate phase.
 */

#pragma once

#include <memory>
#include <mutex>
#include <vector>

#include <entt/entt.hpp>

#include "liquid/core/worker_pool.hpp"
#include "liquid/systems/i_system.hpp"
#include "liquid/systems/fluid/fluid_config.hpp"
#include "liquid/systems/fluid/particle_pool.hpp"
#include "liquid/systems/fluid/spatial_grid.hpp"
#include "liquid/systems/rigid_fluid/rigid_world.hpp"

namespace Systems {

/**
 * @class FluidSystem
 * @brief Owns the particle pool, grid and worker pool, and steps them.
 */
class FluidSystem : public ConfigurableSystem<FluidConfig> {
public:
    /**
     * @throws std::invalid_argument if the configuration is unusable
     */
    FluidSystem();
    explicit FluidSystem(const FluidConfig& config);
    ~FluidSystem() override = default;

    /**
     * @brief Replaces the configuration and rebuilds all fluid state.
     *
     * Existing particles are discarded.
     *
     * @throws std::invalid_argument if the configuration is unusable
     */
    void setSpecificConfig(const FluidConfig& config) override;

    /**
     * @brief ECS entry point.
     *
     * Spawns spawnPerTick particles at the SpawnInput pointer when requested,
     * then steps against the registry's rigid shapes (collision mode) or
     * without collisions.
     */
    void update(entt::registry& registry) override;

    /**
     * @brief Runs one tick.
     *
     * @param world Rigid shapes to collide with; nullptr or collisionsEnabled
     *        == false skips the collision phases. A tick with no active
     *        particles does nothing.
     */
    void step(const RigidFluid::IRigidWorld* world = nullptr);

    /**
     * @brief Activates up to count particles around origin with the default jitter.
     * @return Number of particles activated
     */
    int spawn(const Position& origin, int count);
    int spawn(const Position& origin, int count, const Fluid::ParticlePool::JitterFn& jitter);

    /** @brief Switches collision mode without discarding particles */
    void setCollisionsEnabled(bool enabled) { specificConfig.collisionsEnabled = enabled; }
    bool collisionsEnabled() const { return specificConfig.collisionsEnabled; }

    const Fluid::ParticlePool& getPool() const { return *pool; }
    Fluid::ParticlePool& getPool() { return *pool; }
    const Fluid::SpatialGrid& getGrid() const { return *grid; }
    const std::vector<Vector>& getDelta() const { return delta; }
    const std::vector<RigidFluid::Fixture>& getFixtures() const { return fixtures; }
    int getWorkerCount() const { return workers->size(); }

private:
    void rebuild();

    void prepare();
    void computePressures();
    void computeForces();
    void resolveCollisions();
    void integrateAll();

    std::unique_ptr<Fluid::ParticlePool> pool;
    std::unique_ptr<Fluid::SpatialGrid> grid;
    std::unique_ptr<Parallel::WorkerPool> workers;
    std::unique_ptr<Fluid::SpawnJitter> jitter;

    std::vector<Vector> delta;                  // scaled impulse per particle
    std::vector<std::vector<Vector>> scratch;   // one per worker
    std::mutex mergeMutex;

    std::vector<RigidFluid::Fixture> fixtures;  // this tick's broad-phase result
};

} // namespace Systems
