/**
 * @file coordinates.hpp
 * @brief Conversions between simulation and display spaces
 *
 * Handles conversion between:
 * - Meters (simulation space, Y up)
 * - Source image pixels (the photographed or sketched diagram, Y down)
 * - Canvas pixels (the on-screen container, Y down, image letterboxed inside)
 *
 * Every function here is total: malformed input degrades to a documented
 * default and the returned transforms are always finite with a positive scale.
 */
#pragma once

#include <optional>
#include <vector>

#include "diagramsim/math/aabb.hpp"
#include "diagramsim/math/vector_math.hpp"
#include "diagramsim/scene/scene.hpp"

namespace Simulation {

/**
 * @brief Width and height in pixels
 */
struct PixelSize {
    double width = 0.0;
    double height = 0.0;

    bool isUsable() const;
};

using ImageSize = PixelSize;
using ContainerSize = PixelSize;

/**
 * @brief Uniform fit of an image inside a container
 */
struct LetterboxFit {
    double scale = 1.0;
    Position offset;
};

/**
 * @brief Per-frame mapping from meters to canvas pixels
 */
struct CanvasTransform {
    bool hasMapping = false;
    Position originPx;              ///< Canvas pixel of meter (0,0)
    double metersToPixels = 80.0;
    double pixelsToMeters = 1.0 / 80.0;
    double letterboxScale = 1.0;
    Position letterboxOffset;
    double imagePxPerMeter = 80.0;  ///< Before letterboxing
    std::optional<SceneMapping> mapping;
};

/**
 * @brief Validates a mapping.
 * @return The mapping if origin is finite and scale is finite and positive
 */
std::optional<SceneMapping> normalizeSceneMapping(const std::optional<SceneMapping>& mapping);

/**
 * @brief Fits image inside container preserving aspect, centered.
 *
 * Missing image, or a non-positive image or container size, gives scale 1
 * and zero offset.
 */
LetterboxFit computeLetterboxFit(const std::optional<ImageSize>& image, const ContainerSize& container);

/**
 * @brief Builds the canvas transform for one frame.
 *
 * With a usable mapping, meters go through the image pixel grid and then the
 * letterbox fit. Without one, a default of 80 px/m (clamped to the fallback
 * range) is centered in the container.
 */
CanvasTransform computeTransform(const std::optional<SceneMapping>& mapping,
                                 const std::optional<ImageSize>& imageSize,
                                 const ContainerSize& containerSize);

/**
 * @brief Auto-frames a box of meters inside the container.
 *
 * @param bounds Region to show, in meters
 * @param containerSize Canvas size in pixels
 * @param padding Pixels kept free on every side
 * @param minPxPerMeter Lower clamp on the resulting scale
 * @param maxPxPerMeter Upper clamp on the resulting scale
 */
CanvasTransform fitTransformToBounds(const Aabb& bounds,
                                     const ContainerSize& containerSize,
                                     double padding = 24.0,
                                     double minPxPerMeter = 6.0,
                                     double maxPxPerMeter = 480.0);

/** @brief Meters to canvas pixels */
Position toCanvas(const Position& pointM, const CanvasTransform& transform);

/** @brief Canvas pixels to meters; exact inverse of toCanvas */
Position toMeters(const Position& pointPx, const CanvasTransform& transform);

/** @brief Meters to source image pixels */
Position metersToImagePixels(const Position& pointM, const SceneMapping& mapping);

/** @brief Source image pixels to meters */
Position imagePixelsToMeters(const Position& pointPx, const SceneMapping& mapping);

/**
 * @brief Region of the world covered by the source image, in meters.
 */
Aabb imageBoundsMeters(const SceneMapping& mapping, const ImageSize& image);

/**
 * @brief Returns preferred if it carries a mapping, otherwise fallback.
 */
const CanvasTransform& combineTransforms(const std::optional<CanvasTransform>& preferred,
                                         const CanvasTransform& fallback);

/**
 * @brief Picks the transform a renderer should use this frame.
 *
 * Mapping transform if the scene has a usable mapping; otherwise a fit to
 * motionBounds when they are known and the container is usable; otherwise
 * the default centered transform.
 */
CanvasTransform selectActiveTransform(const Scene& scene,
                                      const std::optional<ImageSize>& imageSize,
                                      const ContainerSize& containerSize,
                                      const std::optional<Aabb>& motionBounds);

/**
 * @brief Identity-like transform used before any layout is known.
 */
CanvasTransform defaultTransform();

/**
 * @class Coordinates
 * @brief Holds the current canvas transform for a render target
 *
 * Renderers keep one of these and call update() whenever the container is
 * resized or the scene changes.
 */
class Coordinates {
public:
    Coordinates();

    /**
     * @brief Recomputes the transform for the given scene and layout
     */
    void update(const Scene& scene,
                const std::optional<ImageSize>& imageSize,
                const ContainerSize& containerSize,
                const std::optional<Aabb>& motionBounds = std::nullopt);

    Position toCanvas(const Position& pointM) const;
    Position toMeters(const Position& pointPx) const;

    /** @brief Converts a length in meters to pixels */
    double metersToPixels(double meters) const { return meters * transform.metersToPixels; }

    /** @brief Converts a length in pixels to meters */
    double pixelsToMeters(double pixels) const { return pixels * transform.pixelsToMeters; }

    const CanvasTransform& getTransform() const { return transform; }

private:
    CanvasTransform transform;
};

} // namespace Simulation
