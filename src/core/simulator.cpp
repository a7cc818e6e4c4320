/**
 * @fileoverview simulator.cpp
 * @brief Implementation of ECSSimulator.
 */

#include "liquid/core/simulator.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

#include "liquid/components/sim.hpp"
#include "liquid/core/debug.hpp"
#include "liquid/core/profile.hpp"

ECSSimulator::ECSSimulator() = default;

ECSSimulator::~ECSSimulator() = default;

void ECSSimulator::loadScenario(std::unique_ptr<IScenario> scenario) {
  scenarioPtr = std::move(scenario);
}

void ECSSimulator::reset() {
  registry.clear();

  auto stateEntity = registry.create();
  registry.emplace<Components::SimulatorState>(stateEntity);
  registry.emplace<Components::SpawnInput>(stateEntity);

  ScenarioConfig cfg;
  if (scenarioPtr) {
    cfg = scenarioPtr->getConfig();
    scenarioPtr->createEntities(registry);
  }

  createSystems(cfg);

  int spawned = 0;
  for (const auto& burst : cfg.initialBursts) {
    spawned += fluidSystem->spawn(burst.origin, burst.count);
  }

  std::cout << "ECSSimulator::reset() spawned " << spawned << " particles" << std::endl;
}

void ECSSimulator::createSystems(const ScenarioConfig& cfg) {
  systems.clear();
  fluidSystem = nullptr;
  currentConfig = cfg.systemConfig;

  auto fluid = std::make_unique<Systems::FluidSystem>(cfg.fluidConfig);
  fluidSystem = fluid.get();
  systems.push_back(std::move(fluid));

  for (auto& system : systems) {
    system->setSystemConfig(currentConfig);
  }
}

void ECSSimulator::tick() {
  LIQUID_PROFILE_SCOPE("ECSSimulator::tick");
  DebugStats::reset();

  for (auto& system : systems) {
    system->update(registry);
  }

  auto stateView = registry.view<Components::SimulatorState>();
  for (auto [entity, state] : stateView.each()) {
    (void)entity;
    ++state.tickCount;
  }
}

entt::registry& ECSSimulator::getRegistry() {
  return registry;
}

const entt::registry& ECSSimulator::getRegistry() const {
  return registry;
}

Systems::FluidSystem& ECSSimulator::getFluidSystem() {
  if (!fluidSystem) {
    throw std::logic_error("ECSSimulator::getFluidSystem() called before reset()");
  }
  return *fluidSystem;
}

const Systems::FluidSystem& ECSSimulator::getFluidSystem() const {
  if (!fluidSystem) {
    throw std::logic_error("ECSSimulator::getFluidSystem() called before reset()");
  }
  return *fluidSystem;
}

IScenario& ECSSimulator::getCurrentScenario() const {
  if (!scenarioPtr) {
    throw std::logic_error("ECSSimulator has no scenario loaded");
  }
  return *scenarioPtr;
}
