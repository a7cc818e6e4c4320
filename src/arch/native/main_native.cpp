/**
 * @file main_native.cpp
 * @brief Main entry point for the native platform.
 *
 * This file creates a SimManager instance, initializes it, and runs the main loop.
 */

#include <iostream>

#include "liquid/core/profile.hpp"
#include "liquid/core/sim_manager.hpp"

int main() {
    SimManager simManager;

    if (!simManager.init()) {
        std::cerr << "Failed to initialize simulation." << std::endl;
        return 1;
    }

    {
        // Profile the entire application run
        LIQUID_PROFILE_SCOPE("main");
        simManager.run();
    }

    return 0;
}
