/**
 * @file scene_normalizer.hpp
 * @brief Fits a freshly parsed scene inside its source image and separates
 *        bodies that start out overlapping static geometry
 *
 * Diagram parsing places bodies approximately. Before the first simulation
 * tick the movable bodies are:
 * - translated (and optionally shrunk) so their combined AABB lies inside the
 *   image bounds minus a margin
 * - pushed out of any static body they overlap, along the axis of least
 *   penetration
 *
 * Static geometry is never moved. The input scene is never modified; the
 * result carries a corrected copy plus a report of what changed.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "diagramsim/core/constants.hpp"
#include "diagramsim/core/coordinates.hpp"
#include "diagramsim/scene/scene.hpp"

namespace Normalization {

enum class TargetBodies {
    Dynamic,  ///< Every non-static body
    All
};

/**
 * @struct NormalizationOptions
 * @brief Tuning for a normalization run
 */
struct NormalizationOptions {
    // Clearance kept between target bodies and the image edge, in meters
    double margin_m = SimulatorConstants::DefaultMarginMeters;

    Simulation::NormalizationMode mode = Simulation::NormalizationMode::TranslateAndScale;

    TargetBodies targetBodies = TargetBodies::Dynamic;

    // Scale velocities along with positions in the scale pass
    bool scaleVelocities = false;
};

/**
 * @struct NormalizationReport
 * @brief Diagnostic summary of a normalization run
 */
struct NormalizationReport {
    bool applied = false;
    Vector translation_m;
    std::optional<double> scale;               ///< Set only when a shrink was applied
    std::vector<std::string> adjustedBodyIds;  ///< In scene order
    Simulation::NormalizationMode mode = Simulation::NormalizationMode::TranslateAndScale;
    std::vector<std::string> warnings;
};

struct NormalizationResult {
    Simulation::Scene scene;
    NormalizationReport report;
};

/**
 * @class SceneNormalizer
 * @brief Bounds fitting and contact separation for scenes built from images
 */
class SceneNormalizer {
public:
    /**
     * @brief Produces a normalized copy of a scene
     *
     * @param scene Parsed scene; left untouched
     * @param mapping Image pixel to meter mapping of the source image
     * @param image Source image size in pixels
     * @param options Margin, mode, target selection and velocity scaling
     * @return Corrected scene (with meta.normalization filled in) and report
     *
     * @note Non-static bodies without a restitution get 1.0 in the returned
     *       scene even when nothing else changes.
     */
    static NormalizationResult normalize(const Simulation::Scene& scene,
                                         const Simulation::SceneMapping& mapping,
                                         const Simulation::ImageSize& image,
                                         const NormalizationOptions& options = NormalizationOptions());
};

} // namespace Normalization
