#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include "liquid/components/basic.hpp"
#include "liquid/components/sim.hpp"
#include "liquid/math/polygon.hpp"
#include "liquid/systems/fluid/fluid.hpp"

using namespace Systems;
using namespace Systems::Fluid;
using namespace Systems::RigidFluid;

class FluidSystemTest : public ::testing::Test {
protected:
    FluidConfig config;

    void SetUp() override {
        config.maxParticles = 256;
        config.workerThreads = 1;
        config.randomSeed = 1234;
    }

    static Vector noJitter() { return Vector(0.0, 0.0); }

    static double separation(const FluidSystem& fluid) {
        const auto& pool = fluid.getPool();
        return pool[0].position.dist(pool[1].position);
    }

    // Every alive particle sits in the bucket addressed by floor(position / cellSize)
    static void expectGridConsistent(const FluidSystem& fluid) {
        const auto& pool = fluid.getPool();
        const auto& grid = fluid.getGrid();
        for (int idx : pool.getActive()) {
            const Particle& p = pool[idx];
            Cell const expected = grid.cellOf(p.position);
            EXPECT_EQ(p.cellX, expected.x) << "particle " << idx;
            EXPECT_EQ(p.cellY, expected.y) << "particle " << idx;

            const auto* bucket = grid.bucket(p.cellX, p.cellY);
            ASSERT_NE(bucket, nullptr);
            EXPECT_NE(std::find(bucket->begin(), bucket->end(), idx), bucket->end());
        }
        EXPECT_EQ(grid.size(), static_cast<std::size_t>(pool.activeCount()));
    }
};

TEST_F(FluidSystemTest, RejectsInvalidConfig) {
    FluidConfig bad = config;
    bad.cellSize = 0.0;
    EXPECT_THROW(FluidSystem{bad}, std::invalid_argument);

    bad = config;
    bad.maxParticles = 0;
    EXPECT_THROW(FluidSystem{bad}, std::invalid_argument);

    bad = config;
    bad.radius = -1.0;
    EXPECT_THROW(FluidSystem{bad}, std::invalid_argument);

    bad = config;
    bad.maxNeighbors = -1;
    EXPECT_THROW(FluidSystem{bad}, std::invalid_argument);

    FluidSystem fluid(config);
    bad = config;
    bad.dt = 0.0;
    EXPECT_THROW(fluid.setSpecificConfig(bad), std::invalid_argument);
}

TEST_F(FluidSystemTest, EmptyTickChangesNothing) {
    FluidSystem fluid(config);

    FixtureListWorld world;
    world.add(makeCircleFixture(Position(0.0, 0.0), 5.0));

    fluid.step(&world);
    fluid.step(nullptr);

    EXPECT_EQ(fluid.getPool().activeCount(), 0);
    EXPECT_EQ(fluid.getGrid().bucketCount(), 0u);
    EXPECT_TRUE(fluid.getFixtures().empty());
    for (const auto& d : fluid.getDelta()) {
        EXPECT_DOUBLE_EQ(d.x, 0.0);
        EXPECT_DOUBLE_EQ(d.y, 0.0);
    }
}

TEST_F(FluidSystemTest, SpawnStopsAtCapacity) {
    config.maxParticles = 4;
    FluidSystem fluid(config);

    EXPECT_EQ(fluid.spawn(Position(5.0, 5.0), 4), 4);
    EXPECT_EQ(fluid.spawn(Position(5.0, 5.0), 4), 0);
    EXPECT_EQ(fluid.getPool().activeCount(), 4);
}

TEST_F(FluidSystemTest, RepulsivePairSeparates) {
    config.restDensity = 0.0;
    config.gravity = Vector(0.0, 0.0);
    FluidSystem fluid(config);

    double const gap = 0.5 * config.idealRadius / config.multiplier();
    fluid.spawn(Position(3.0, 3.0), 1, noJitter);
    fluid.spawn(Position(3.0 + gap, 3.0), 1, noJitter);

    double const before = separation(fluid);
    fluid.step();
    EXPECT_GT(separation(fluid), before);
}

TEST_F(FluidSystemTest, IsolatedPairAtDefaultRestDensityContracts) {
    config.gravity = Vector(0.0, 0.0);
    FluidSystem fluid(config);

    double const gap = 0.5 * config.idealRadius / config.multiplier();
    fluid.spawn(Position(3.0, 3.0), 1, noJitter);
    fluid.spawn(Position(3.0 + gap, 3.0), 1, noJitter);

    double const before = separation(fluid);
    fluid.step();
    EXPECT_LT(separation(fluid), before);
}

TEST_F(FluidSystemTest, ParticleBouncesOffFloor) {
    FluidSystem fluid(config);
    fluid.spawn(Position(5.0, 4.95), 1, noJitter);
    fluid.getPool()[0].velocity = Vector(0.0, 6.0);

    FixtureListWorld world;
    world.add(makePolygonFixture({Vector(0.0, 5.0), Vector(10.0, 5.0), Vector(10.0, 6.0), Vector(0.0, 6.0)}));

    fluid.step(&world);

    const Particle& p = fluid.getPool()[0];
    EXPECT_LT(p.position.y, 5.0);
    EXPECT_FALSE(containsPoint(world.getFixtures().front(), p.position));

    // Normal (y) velocity flipped and reduced
    double const incoming = 6.0 + config.gravity.y * config.dt;
    EXPECT_LT(p.velocity.y, 0.0);
    EXPECT_LT(std::abs(p.velocity.y), 6.0);
    EXPECT_NEAR(p.velocity.y, -config.restitution * config.friction * incoming, 1e-9);
    expectGridConsistent(fluid);
}

TEST_F(FluidSystemTest, CollisionsDisabledIgnoresWorld) {
    config.collisionsEnabled = false;
    FluidSystem fluid(config);
    fluid.spawn(Position(5.0, 4.95), 1, noJitter);
    fluid.getPool()[0].velocity = Vector(0.0, 6.0);

    FixtureListWorld world;
    world.add(makePolygonFixture({Vector(0.0, 5.0), Vector(10.0, 5.0), Vector(10.0, 6.0), Vector(0.0, 6.0)}));

    fluid.step(&world);
    EXPECT_TRUE(fluid.getFixtures().empty());
    EXPECT_GT(fluid.getPool()[0].position.y, 5.0);
}

TEST_F(FluidSystemTest, GridStaysConsistentOverManyTicks) {
    config.workerThreads = 3;
    FluidSystem fluid(config);

    FixtureListWorld world;
    world.add(makePolygonFixture({Vector(-5.0, 8.0), Vector(15.0, 8.0), Vector(15.0, 12.0), Vector(-5.0, 12.0)}));
    world.add(makeCircleFixture(Position(6.0, 6.0), 1.0));

    for (int tick = 0; tick < 120; ++tick) {
        if (tick < 40) {
            fluid.spawn(Position(5.0, 2.0), config.spawnPerTick);
        }
        fluid.step(&world);
    }

    EXPECT_EQ(fluid.getPool().activeCount(), 160);
    expectGridConsistent(fluid);

    for (int idx : fluid.getPool().getActive()) {
        const Particle& p = fluid.getPool()[idx];
        EXPECT_TRUE(Vector(p.position).isFinite());
        EXPECT_TRUE(p.velocity.isFinite());
        // Nothing tunnels through the floor slab
        EXPECT_LT(p.position.y, 8.0 + config.collisionEpsilon);
    }
}

TEST_F(FluidSystemTest, WorkerCountDoesNotChangeResult) {
    FluidConfig serialConfig = config;
    FluidConfig parallelConfig = config;
    parallelConfig.workerThreads = 4;

    FluidSystem serial(serialConfig);
    FluidSystem parallel(parallelConfig);
    ASSERT_EQ(parallel.getWorkerCount(), 4);

    // Same seed, same spawn sequence
    for (int i = 0; i < 10; ++i) {
        serial.spawn(Position(4.0, 4.0), 4);
        parallel.spawn(Position(4.0, 4.0), 4);
    }

    for (int tick = 0; tick < 5; ++tick) {
        serial.step();
        parallel.step();
    }

    for (int idx : serial.getPool().getActive()) {
        const Particle& a = serial.getPool()[idx];
        const Particle& b = parallel.getPool()[idx];
        EXPECT_NEAR(a.position.x, b.position.x, 1e-6);
        EXPECT_NEAR(a.position.y, b.position.y, 1e-6);
    }
}

TEST_F(FluidSystemTest, ReconfigureDiscardsParticles) {
    FluidSystem fluid(config);
    fluid.spawn(Position(1.0, 1.0), 4);
    ASSERT_EQ(fluid.getPool().activeCount(), 4);

    FluidConfig next = config;
    next.maxParticles = 32;
    fluid.setSpecificConfig(next);
    EXPECT_EQ(fluid.getPool().activeCount(), 0);
    EXPECT_EQ(fluid.getPool().capacity(), 32);
    EXPECT_EQ(fluid.getGrid().bucketCount(), 0u);
}

class FluidSystemRegistryTest : public FluidSystemTest {
protected:
    entt::registry registry;
    entt::entity state{};

    void SetUp() override {
        FluidSystemTest::SetUp();
        state = registry.create();
        registry.emplace<Components::SimulatorState>(state);
        registry.emplace<Components::SpawnInput>(state);
    }
};

TEST_F(FluidSystemRegistryTest, UpdateSpawnsAtPointerOnlyWhenRequested) {
    config.collisionsEnabled = false;
    FluidSystem fluid(config);

    fluid.update(registry);
    EXPECT_EQ(fluid.getPool().activeCount(), 0);

    auto& input = registry.get<Components::SpawnInput>(state);
    input.pointer = Vector(6.0, 3.0);
    input.spawnRequested = true;

    fluid.update(registry);
    EXPECT_EQ(fluid.getPool().activeCount(), config.spawnPerTick);
    for (int idx : fluid.getPool().getActive()) {
        // Within the jitter box around the pointer, plus one tick of motion
        EXPECT_NEAR(fluid.getPool()[idx].position.x, 6.0, 1.1);
        EXPECT_NEAR(fluid.getPool()[idx].position.y, 3.0, 0.6);
    }
}

TEST_F(FluidSystemRegistryTest, UpdateCollidesWithRegistryShapes) {
    auto floor = registry.create();
    registry.emplace<Components::Position>(floor, 5.0, 6.0);
    PolygonShape slab;
    slab.vertices = {Vector(-5.0, -1.0), Vector(5.0, -1.0), Vector(5.0, 1.0), Vector(-5.0, 1.0)};
    registry.emplace<PolygonShape>(floor, slab);

    FluidSystem fluid(config);
    auto& input = registry.get<Components::SpawnInput>(state);
    input.pointer = Vector(5.0, 2.0);
    input.spawnRequested = true;
    fluid.update(registry);
    input.spawnRequested = false;

    for (int tick = 0; tick < 180; ++tick) {
        fluid.update(registry);
    }

    ASSERT_EQ(fluid.getPool().activeCount(), config.spawnPerTick);
    for (int idx : fluid.getPool().getActive()) {
        // Slab top is at y = 5
        EXPECT_LT(fluid.getPool()[idx].position.y, 5.0 + config.collisionEpsilon);
    }
}
