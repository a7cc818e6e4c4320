#ifndef LIQUID_SIMULATOR_CONSTANTS_HPP
#define LIQUID_SIMULATOR_CONSTANTS_HPP

#include <string>

namespace SimulatorConstants {

    /**
     * @brief The selectable demo scenarios.
     */
    enum class SimulationType {
        POUR,
        FLUID_AND_SHAPES
    };

    // Display constants
    extern const unsigned int ScreenWidth;
    extern const unsigned int ScreenHeight;
    extern const unsigned int StepsPerSecond;
    extern const double PixelsPerMeter;

    // Utility conversions
    double pixelsToMeters(double pixels);
    double metersToPixels(double meters);

    std::string getScenarioName(SimulationType scenario);
}

#endif // LIQUID_SIMULATOR_CONSTANTS_HPP
