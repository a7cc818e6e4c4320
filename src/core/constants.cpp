#include "liquid/core/constants.hpp"

namespace SimulatorConstants {

    // Display
    const unsigned int ScreenWidth    = 1024;
    const unsigned int ScreenHeight   = 768;
    const unsigned int StepsPerSecond = 60;
    const double PixelsPerMeter       = 32.0;

    double pixelsToMeters(double pixels) {
        return pixels / PixelsPerMeter;
    }

    double metersToPixels(double meters) {
        return meters * PixelsPerMeter;
    }

    std::string getScenarioName(SimulationType scenario) {
        switch (scenario) {
            case SimulationType::POUR:             return "POUR";
            case SimulationType::FLUID_AND_SHAPES: return "FLUID_AND_SHAPES";
            default: return "UNKNOWN";
        }
    }

} // namespace SimulatorConstants
