/**
 * @file sim_manager.cpp
 * @brief Implementation of SimManager, which orchestrates simulation, input and rendering.
 */

#include <chrono>
#include <iostream>
#include <stdexcept>

#include <SFML/Window/Event.hpp>
#include <SFML/Window/Mouse.hpp>

#include "liquid/components/sim.hpp"
#include "liquid/core/profile.hpp"
#include "liquid/core/sim_manager.hpp"
#include "liquid/scenarios/fluid_and_shapes.hpp"
#include "liquid/scenarios/pour.hpp"

std::unique_ptr<IScenario> makeScenario(SimulatorConstants::SimulationType type)
{
    switch (type) {
        case SimulatorConstants::SimulationType::POUR:
            return std::make_unique<PourScenario>();
        case SimulatorConstants::SimulationType::FLUID_AND_SHAPES:
            return std::make_unique<FluidAndShapesScenario>();
    }
    throw std::invalid_argument("Unknown scenario type");
}

SimManager::SimManager()
    : renderer(SimulatorConstants::ScreenWidth,
               SimulatorConstants::ScreenHeight)
    , simulator()
    , currentScenario(SimulatorConstants::SimulationType::FLUID_AND_SHAPES)
    , running(true)
    , paused(false)
    , stepFrame(false)
{
}

bool SimManager::init()
{
    // Initialize our renderer (creates the SFML window, loads font, etc.)
    if (!renderer.init())
    {
        std::cerr << "Renderer initialization failed." << std::endl;
        return false;
    }

    try
    {
        selectScenario(currentScenario);
    }
    catch (const std::exception& e)
    {
        std::cerr << "Scenario initialization failed: " << e.what() << std::endl;
        return false;
    }

    return true;
}

void SimManager::run()
{
    using Clock = std::chrono::steady_clock;
    auto lastFrame = Clock::now();

    while (handleEvents())
    {
        tick();

        auto const now = Clock::now();
        std::chrono::duration<float> const elapsed = now - lastFrame;
        lastFrame = now;
        float const fps = elapsed.count() > 0.0F ? 1.0F / elapsed.count() : 0.0F;

        render(fps);
    }

    Profiling::Profiler::printStats();
}

bool SimManager::handleEvents()
{
    sf::RenderWindow& window = renderer.getWindow();

    sf::Event event;
    while (window.pollEvent(event))
    {
        if (event.type == sf::Event::Closed)
        {
            running = false;
        }
        else if (event.type == sf::Event::KeyPressed)
        {
            switch (event.key.code)
            {
                case sf::Keyboard::Escape:
                    running = false;
                    break;
                case sf::Keyboard::P: // Pause
                    togglePause();
                    break;
                case sf::Keyboard::Space: // Advance one frame if paused
                    if (paused)
                    {
                        stepOnce();
                    }
                    break;
                case sf::Keyboard::R: // Reset simulator
                    resetSimulator();
                    break;
                case sf::Keyboard::C:
                    toggleCollisions();
                    break;
                case sf::Keyboard::Num1:
                    selectScenario(SimulatorConstants::SimulationType::POUR);
                    break;
                case sf::Keyboard::Num2:
                    selectScenario(SimulatorConstants::SimulationType::FLUID_AND_SHAPES);
                    break;
                default:
                    break;
            }
        }
    }

    updatePointer();

    return running;
}

void SimManager::updatePointer()
{
    sf::RenderWindow& window = renderer.getWindow();
    sf::Vector2i const mouse = sf::Mouse::getPosition(window);
    bool const pressed = window.hasFocus() && sf::Mouse::isButtonPressed(sf::Mouse::Left);

    auto& registry = simulator.getRegistry();
    auto view = registry.view<Components::SpawnInput>();
    for (auto [entity, input] : view.each())
    {
        (void)entity;
        input.pointer = Vector(SimulatorConstants::pixelsToMeters(mouse.x),
                               SimulatorConstants::pixelsToMeters(mouse.y));
        input.spawnRequested = pressed;
    }
}

void SimManager::tick()
{
    // Step the simulation if not paused or stepping one frame
    if (!paused || stepFrame)
    {
        simulator.tick();
        stepFrame = false;
    }
}

void SimManager::render(float fps)
{
    renderer.clear();

    renderer.renderShapes(simulator.getRegistry());

    const auto& fluid = simulator.getFluidSystem();
    renderer.renderFluid(fluid.getPool());

    renderer.renderFPS(fps);
    renderer.renderStatus(fluid.getPool().activeCount(),
                          fluid.getPool().capacity(),
                          paused,
                          fluid.collisionsEnabled(),
                          SimulatorConstants::getScenarioName(currentScenario));

    renderer.present();
}

void SimManager::togglePause()
{
    paused = !paused;
}

void SimManager::toggleCollisions()
{
    auto& fluid = simulator.getFluidSystem();
    fluid.setCollisionsEnabled(!fluid.collisionsEnabled());
    std::cout << "Collisions " << (fluid.collisionsEnabled() ? "enabled" : "disabled") << std::endl;
}

void SimManager::resetSimulator()
{
    simulator.reset();
    paused = false;
}

void SimManager::stepOnce()
{
    stepFrame = true;
}

void SimManager::selectScenario(SimulatorConstants::SimulationType scenario)
{
    currentScenario = scenario;
    simulator.loadScenario(makeScenario(scenario));
    simulator.reset();
    paused = false;

    std::cout << "Loaded scenario: " << SimulatorConstants::getScenarioName(scenario) << std::endl;
}
