/**
 * @file simulator.hpp
 * @brief Main simulator class that manages an ECS registry and scenario lifecycle.
 */

#pragma once

#include <memory>
#include <vector>

#include <entt/entt.hpp>

#include "liquid/core/system_config.hpp"
#include "liquid/scenarios/i_scenario.hpp"
#include "liquid/systems/fluid/fluid.hpp"
#include "liquid/systems/i_system.hpp"

/**
 * @class ECSSimulator
 * @brief Owns the registry and the systems, and ticks them in order.
 */
class ECSSimulator {
public:
    ECSSimulator();
    ~ECSSimulator();

    /**
     * @brief Takes ownership of the scenario used by the next reset()
     */
    void loadScenario(std::unique_ptr<IScenario> scenario);

    /**
     * @brief Rebuilds the world from the loaded scenario.
     *
     * Clears the registry, recreates the simulator-state entity (with
     * SimulatorState and SpawnInput), lets the scenario create its entities,
     * rebuilds the systems from the scenario config and spawns the scenario's
     * initial fluid.
     *
     * @throws std::invalid_argument if the scenario's fluid config is unusable
     */
    void reset();

    /**
     * @brief Steps every system once
     */
    void tick();

    entt::registry& getRegistry();
    const entt::registry& getRegistry() const;

    /**
     * @brief The fluid system built by the last reset(); requires a reset first
     */
    Systems::FluidSystem& getFluidSystem();
    const Systems::FluidSystem& getFluidSystem() const;

    bool hasScenario() const { return scenarioPtr != nullptr; }
    IScenario& getCurrentScenario() const;

    const SystemConfig& getSystemConfig() const { return currentConfig; }

private:
    void createSystems(const ScenarioConfig& cfg);

    entt::registry registry;
    std::unique_ptr<IScenario> scenarioPtr;
    std::vector<std::unique_ptr<Systems::ISystem>> systems;
    Systems::FluidSystem* fluidSystem = nullptr;  // owned by systems
    SystemConfig currentConfig;
};
