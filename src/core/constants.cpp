#include "diagramsim/core/constants.hpp"

namespace SimulatorConstants {

    const double Pi = 3.14159265358979323846;
    const double DefaultGravity = 9.81;
    const double DefaultTimeStep = 0.016;

    const double DefaultMetersToPixels = 80.0;
    const double FallbackMinPixelsPerMeter = 6.0;
    const double FallbackMaxPixelsPerMeter = 480.0;
    const double DefaultFitPaddingPixels = 24.0;
    const double MinFitExtentMeters = 1e-3;
    const double MinFitAvailablePixels = 8.0;

    const double DefaultColliderHalfExtent = 0.05;
    const double DefaultRestitution = 1.0;
    const double DefaultWheelRadius = 0.1;

    const double DefaultMarginMeters = 0.02;
    const double ContactSeparationEpsilon = 5e-4;
    const std::size_t MaxContactSeparationPasses = 5;

    const double PulleyLengthTolerance = 1e-4;
    const double PulleySpeedTolerance = 1e-5;

    const unsigned int ScreenWidth = 1024;
    const unsigned int ScreenHeight = 768;
    const unsigned int StepsPerSecond = 60;

    double degreesToRadians(double degrees) {
        return degrees * Pi / 180.0;
    }

    std::vector<SimulationType> getAllScenarios() {
        return {
            SimulationType::PULLEY,
            SimulationType::GROUND_BLOCK,
            SimulationType::RAMP_BLOCK
        };
    }

    std::string getScenarioName(SimulationType scenario) {
        switch (scenario) {
            case SimulationType::PULLEY:       return "Fixed Pulley";
            case SimulationType::GROUND_BLOCK: return "Block on Ground";
            case SimulationType::RAMP_BLOCK:   return "Block on Ramp";
        }
        return "Unknown";
    }
}
