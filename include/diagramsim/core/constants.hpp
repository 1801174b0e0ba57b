#ifndef DIAGRAMSIM_CONSTANTS_HPP
#define DIAGRAMSIM_CONSTANTS_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace SimulatorConstants {

    enum class SimulationType {
        PULLEY,
        GROUND_BLOCK,
        RAMP_BLOCK
    };

    // Truly global constants
    extern const double Pi;
    extern const double DefaultGravity;     // m/s^2, applied along -y
    extern const double DefaultTimeStep;    // seconds per tick

    // Canvas transform defaults
    extern const double DefaultMetersToPixels;
    extern const double FallbackMinPixelsPerMeter;
    extern const double FallbackMaxPixelsPerMeter;
    extern const double DefaultFitPaddingPixels;
    extern const double MinFitExtentMeters;
    extern const double MinFitAvailablePixels;

    // Scene geometry defaults
    extern const double DefaultColliderHalfExtent;
    extern const double DefaultRestitution;
    extern const double DefaultWheelRadius;

    // Normalization
    extern const double DefaultMarginMeters;
    extern const double ContactSeparationEpsilon;
    extern const std::size_t MaxContactSeparationPasses;

    // Pulley projection
    extern const double PulleyLengthTolerance;
    extern const double PulleySpeedTolerance;

    // Viewer
    extern const unsigned int ScreenWidth;
    extern const unsigned int ScreenHeight;
    extern const unsigned int StepsPerSecond;

    double degreesToRadians(double degrees);

    std::vector<SimulationType> getAllScenarios();
    std::string getScenarioName(SimulationType scenario);
}

#endif // DIAGRAMSIM_CONSTANTS_HPP
