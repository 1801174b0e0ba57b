#include "diagramsim/analysis/pulley_analytic.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>

#include "diagramsim/core/constants.hpp"

namespace Analysis {

PulleyAnalyticResult simulatePulleyAnalytic(const PulleyAnalyticParams& params) {
    PulleyAnalyticResult result;

    double const m1 = params.m1_kg;
    double const m2 = params.m2_kg;
    double const g = params.g;
    double const dt = (std::isfinite(params.timeStep_s) && params.timeStep_s > 0.0)
                          ? params.timeStep_s
                          : SimulatorConstants::DefaultTimeStep;
    double const totalTime = std::isfinite(params.totalTime_s) ? params.totalTime_s : 0.0;

    double a = 0.0;
    if (m1 + m2 > 0.0) {
        a = (m2 * g - params.mu_k * m1 * g) / (m1 + m2);
    }
    if (!(a > 0.0)) {
        a = 0.0;
        result.staticCondition = true;
    }
    result.acceleration_m_s2 = a;
    result.tension_N = m1 * a + params.mu_k * m1 * g;

    // Semi-implicit Euler on the rope speed, same scheme as the ECS integrator
    double v = 0.0;
    double s = 0.0;
    auto const steps = static_cast<std::size_t>(std::floor(std::max(totalTime, 0.0) / dt + EPSILON));
    result.frames.reserve(steps + 1);
    for (std::size_t i = 0; i <= steps; ++i) {
        Simulation::SimulationFrame frame;
        frame.t = static_cast<double>(i) * dt;
        frame.bodies.push_back({"m1", Position(s, 0.0), Vector(v, 0.0), 0.0, 0.0});
        frame.bodies.push_back({"m2", Position(0.0, -s), Vector(0.0, -v), 0.0, 0.0});
        result.frames.push_back(frame);

        if (!result.staticCondition) {
            v += a * dt;
            s += v * dt;
        }
    }
    return result;
}

} // namespace Analysis
