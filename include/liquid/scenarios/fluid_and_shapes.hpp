#pragma once

#include <entt/entt.hpp>

#include "liquid/scenarios/i_scenario.hpp"

/**
 * @struct FluidAndShapesConfig
 * @brief Parameters of the fluid-and-shapes scenario
 */
struct FluidAndShapesConfig {
    // Box
    double wallThickness = 1.0;

    // Ramp (a thin tilted rectangle in the upper left)
    double rampHalfLength = 6.0;
    double rampHalfThickness = 0.3;
    double rampAngle = 0.35;        // radians, clockwise on screen

    // Round obstacle in the lower right
    double obstacleRadius = 2.5;

    // Initial fluid: a block of bursts dropped onto the ramp
    int burstColumns = 12;
    int burstRows = 6;
    int particlesPerBurst = 4;
    double burstSpacing = 0.8;      // meters between burst origins
};

/**
 * @brief Fluid released over a ramp into a box with a round obstacle.
 */
class FluidAndShapesScenario : public IScenario {
public:
    /**
     * @brief Scenario configuration, including the initial block of fluid.
     */
    ScenarioConfig getConfig() const override;

    /**
     * @brief Creates the boundary walls, the ramp and the circular obstacle.
     *
     * @param registry The entt registry into which the entities will be inserted.
     */
    void createEntities(entt::registry &registry) const override;

private:
    FluidAndShapesConfig scenarioEntityConfig;
};
