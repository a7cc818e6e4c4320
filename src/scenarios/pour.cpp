/**
 * @file pour.cpp
 * @brief An empty box filled from the pointer
 */

#include "liquid/scenarios/pour.hpp"

#include "liquid/core/constants.hpp"
#include "liquid/scenarios/shapes.hpp"

ScenarioConfig PourScenario::getConfig() const
{
    ScenarioConfig config;

    config.systemConfig.UniverseWidthMeters = SimulatorConstants::pixelsToMeters(SimulatorConstants::ScreenWidth);
    config.systemConfig.UniverseHeightMeters = SimulatorConstants::pixelsToMeters(SimulatorConstants::ScreenHeight);
    config.systemConfig.SecondsPerTick = 1.0 / SimulatorConstants::StepsPerSecond;

    config.fluidConfig.maxParticles = scenarioEntityConfig.maxParticles;
    config.fluidConfig.spawnPerTick = scenarioEntityConfig.spawnPerTick;
    config.fluidConfig.dt = config.systemConfig.SecondsPerTick;

    return config;
}

void PourScenario::createEntities(entt::registry &registry) const
{
    ScenarioConfig const config = getConfig();
    Scenarios::makeEnclosure(registry,
        config.systemConfig.UniverseWidthMeters,
        config.systemConfig.UniverseHeightMeters,
        scenarioEntityConfig.wallThickness);
}
