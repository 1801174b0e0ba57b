/**
 * @file pulley_analytic.hpp
 * @brief Closed-form solution for a block on a table pulled by a hanging mass
 *
 * m1 rests on a horizontal surface with kinetic friction mu_k, m2 hangs from
 * the rope over an ideal fixed pulley:
 *   m1: T - mu_k m1 g = m1 a
 *   m2: m2 g - T      = m2 a
 * giving a = (m2 g - mu_k m1 g) / (m1 + m2) and T = m1 a + mu_k m1 g.
 */

#pragma once

#include <vector>

#include "diagramsim/scene/frame.hpp"

namespace Analysis {

struct PulleyAnalyticParams {
    double m1_kg = 2.0;  ///< Mass on the surface
    double m2_kg = 5.0;  ///< Hanging mass
    double mu_k = 0.0;
    double g = 9.81;
    double timeStep_s = 0.016;
    double totalTime_s = 2.0;
};

struct PulleyAnalyticResult {
    std::vector<Simulation::SimulationFrame> frames;
    double acceleration_m_s2 = 0.0;
    double tension_N = 0.0;

    // The hanging weight cannot overcome friction; nothing moves
    bool staticCondition = false;
};

/**
 * @brief Samples the motion from rest every timeStep_s up to totalTime_s.
 *
 * Frames hold bodies "m1" and "m2" as displacements from their start: m1
 * moves along +x and m2 along -y by the same distance.
 * A non-positive time step falls back to 0.016 s.
 */
PulleyAnalyticResult simulatePulleyAnalytic(const PulleyAnalyticParams& params);

} // namespace Analysis
