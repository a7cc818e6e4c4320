#ifndef LIQUID_I_SCENARIO_HPP
#define LIQUID_I_SCENARIO_HPP

#include <entt/entt.hpp>
#include "liquid/scenarios/scenario_config.hpp"

/**
 * @brief Abstract base class for any simulation scenario
 *
 * Each scenario must provide:
 *  - getConfig() returning ScenarioConfig
 *  - createEntities() that spawns the rigid shapes into the registry
 */
class IScenario {
public:
    virtual ~IScenario() = default;

    /**
     * @brief Returns scenario configuration (world size, fluid tunables, initial fluid)
     */
    virtual ScenarioConfig getConfig() const = 0;

    /**
     * @brief Creates scenario-specific entities in the registry
     */
    virtual void createEntities(entt::registry &registry) const = 0;
};

#endif // LIQUID_I_SCENARIO_HPP
