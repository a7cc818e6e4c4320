/**
 * @file fluid_and_shapes.cpp
 * @brief A block of fluid dropped over a tilted ramp into a box with a round obstacle
 */

#include "liquid/scenarios/fluid_and_shapes.hpp"

#include <iostream>

#include "liquid/core/constants.hpp"
#include "liquid/scenarios/shapes.hpp"

ScenarioConfig FluidAndShapesScenario::getConfig() const
{
    ScenarioConfig config;

    config.systemConfig.UniverseWidthMeters = SimulatorConstants::pixelsToMeters(SimulatorConstants::ScreenWidth);
    config.systemConfig.UniverseHeightMeters = SimulatorConstants::pixelsToMeters(SimulatorConstants::ScreenHeight);
    config.systemConfig.SecondsPerTick = 1.0 / SimulatorConstants::StepsPerSecond;

    config.fluidConfig.dt = config.systemConfig.SecondsPerTick;
    config.fluidConfig.collisionsEnabled = true;

    // Block of fluid above the ramp's upper end
    double const width = config.systemConfig.UniverseWidthMeters;
    double const x0 = width * 0.12;
    double const y0 = 2.5;
    double const spacing = scenarioEntityConfig.burstSpacing;

    for (int row = 0; row < scenarioEntityConfig.burstRows; ++row) {
        for (int col = 0; col < scenarioEntityConfig.burstColumns; ++col) {
            SpawnBurst burst;
            burst.origin = Position(x0 + col * spacing, y0 + row * spacing * 0.5);
            burst.count = scenarioEntityConfig.particlesPerBurst;
            config.initialBursts.push_back(burst);
        }
    }

    return config;
}

void FluidAndShapesScenario::createEntities(entt::registry &registry) const
{
    ScenarioConfig const config = getConfig();
    double const width = config.systemConfig.UniverseWidthMeters;
    double const height = config.systemConfig.UniverseHeightMeters;

    // 1) Bounding walls
    Scenarios::makeEnclosure(registry, width, height, scenarioEntityConfig.wallThickness);

    // 2) Ramp sloping down to the right
    Scenarios::makeBox(registry,
        width * 0.3,
        height * 0.4,
        scenarioEntityConfig.rampHalfLength,
        scenarioEntityConfig.rampHalfThickness,
        scenarioEntityConfig.rampAngle,
        Components::Color(170, 120, 60));

    // 3) Round obstacle the ramp spills onto
    Scenarios::makeCircle(registry,
        width * 0.7,
        height * 0.7,
        scenarioEntityConfig.obstacleRadius,
        Components::Color(60, 160, 90));

    std::cout << "FluidAndShapesScenario: created walls, ramp and obstacle" << std::endl;
}
