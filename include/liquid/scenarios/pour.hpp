#pragma once

#include <entt/entt.hpp>

#include "liquid/scenarios/i_scenario.hpp"

/**
 * @struct PourConfig
 * @brief Parameters of the pour scenario
 */
struct PourConfig {
    double wallThickness = 1.0;     // meters
    int maxParticles = 20000;
    int spawnPerTick = 4;
};

/**
 * @brief An empty box; fluid only enters where the pointer pours it.
 */
class PourScenario : public IScenario {
public:
    ScenarioConfig getConfig() const override;
    void createEntities(entt::registry &registry) const override;

private:
    PourConfig scenarioEntityConfig;
};
