/**
 * @file coordinates.cpp
 * @brief Implementation of coordinate conversion utilities
 */

#include "diagramsim/core/coordinates.hpp"

#include <algorithm>
#include <cmath>

#include "diagramsim/core/constants.hpp"

namespace Simulation {

namespace {

double clamp(double value, double lo, double hi) {
    return std::min(std::max(value, lo), hi);
}

double usableScale(double metersToPixels) {
    return (std::isfinite(metersToPixels) && metersToPixels > 0.0) ? metersToPixels : 1.0;
}

ContainerSize sanitize(const ContainerSize& size) {
    return {finiteOr(size.width, 0.0), finiteOr(size.height, 0.0)};
}

CanvasTransform makeUnmappedTransform(const Position& originPx, double metersToPixels) {
    CanvasTransform t;
    t.hasMapping = false;
    t.originPx = originPx;
    t.metersToPixels = metersToPixels;
    t.pixelsToMeters = 1.0 / metersToPixels;
    t.letterboxScale = 1.0;
    t.letterboxOffset = Position(0.0, 0.0);
    t.imagePxPerMeter = metersToPixels;
    return t;
}

CanvasTransform fallbackTransform(const ContainerSize& container) {
    ContainerSize const c = sanitize(container);
    double const metersToPixels = clamp(SimulatorConstants::DefaultMetersToPixels,
                                        SimulatorConstants::FallbackMinPixelsPerMeter,
                                        SimulatorConstants::FallbackMaxPixelsPerMeter);
    return makeUnmappedTransform(Position(c.width / 2.0, c.height / 2.0), metersToPixels);
}

} // namespace

bool PixelSize::isUsable() const {
    return std::isfinite(width) && std::isfinite(height) && width > 0.0 && height > 0.0;
}

std::optional<SceneMapping> normalizeSceneMapping(const std::optional<SceneMapping>& mapping) {
    if (!mapping) {
        return std::nullopt;
    }
    if (!mapping->origin_px.isFinite() ||
        !std::isfinite(mapping->scale_m_per_px) || mapping->scale_m_per_px <= 0.0) {
        return std::nullopt;
    }
    return mapping;
}

LetterboxFit computeLetterboxFit(const std::optional<ImageSize>& image, const ContainerSize& container) {
    LetterboxFit fit;
    if (!image || !image->isUsable() || !container.isUsable()) {
        return fit;
    }

    double const scale = std::min(container.width / image->width, container.height / image->height);
    fit.scale = (std::isfinite(scale) && scale > 0.0) ? scale : 1.0;

    double const renderW = image->width * fit.scale;
    double const renderH = image->height * fit.scale;
    fit.offset = Position((container.width - renderW) / 2.0, (container.height - renderH) / 2.0);
    return fit;
}

CanvasTransform computeTransform(const std::optional<SceneMapping>& mapping,
                                 const std::optional<ImageSize>& imageSize,
                                 const ContainerSize& containerSize) {
    auto const normalized = normalizeSceneMapping(mapping);
    if (!normalized) {
        return fallbackTransform(containerSize);
    }

    LetterboxFit const fit = computeLetterboxFit(imageSize, containerSize);
    double const imagePxPerMeter = 1.0 / normalized->scale_m_per_px;
    double const metersToPixels = imagePxPerMeter * fit.scale;
    Position const originPx(fit.offset.x + normalized->origin_px.x * fit.scale,
                            fit.offset.y + normalized->origin_px.y * fit.scale);

    // Extremely small scales overflow the reciprocal
    if (!std::isfinite(metersToPixels) || metersToPixels <= 0.0 || !originPx.isFinite()) {
        return fallbackTransform(containerSize);
    }

    CanvasTransform t;
    t.hasMapping = true;
    t.originPx = originPx;
    t.metersToPixels = metersToPixels;
    t.pixelsToMeters = 1.0 / metersToPixels;
    t.letterboxScale = fit.scale;
    t.letterboxOffset = fit.offset;
    t.imagePxPerMeter = imagePxPerMeter;
    t.mapping = normalized;
    return t;
}

CanvasTransform fitTransformToBounds(const Aabb& bounds,
                                     const ContainerSize& containerSize,
                                     double padding,
                                     double minPxPerMeter,
                                     double maxPxPerMeter) {
    if (bounds.isEmpty() || !std::isfinite(bounds.minX) || !std::isfinite(bounds.maxX) ||
        !std::isfinite(bounds.minY) || !std::isfinite(bounds.maxY)) {
        return fallbackTransform(containerSize);
    }

    ContainerSize const c = sanitize(containerSize);
    double const pad = std::isfinite(padding) ? std::max(padding, 0.0)
                                              : SimulatorConstants::DefaultFitPaddingPixels;
    double lo = std::isfinite(minPxPerMeter) ? minPxPerMeter : SimulatorConstants::FallbackMinPixelsPerMeter;
    double hi = std::isfinite(maxPxPerMeter) ? maxPxPerMeter : SimulatorConstants::FallbackMaxPixelsPerMeter;
    if (lo <= 0.0) {
        lo = SimulatorConstants::FallbackMinPixelsPerMeter;
    }
    if (hi < lo) {
        hi = lo;
    }

    double const widthM = std::max(bounds.width(), SimulatorConstants::MinFitExtentMeters);
    double const heightM = std::max(bounds.height(), SimulatorConstants::MinFitExtentMeters);
    double const availableW = std::max(c.width - pad * 2.0, SimulatorConstants::MinFitAvailablePixels);
    double const availableH = std::max(c.height - pad * 2.0, SimulatorConstants::MinFitAvailablePixels);

    double const rawScale = std::min(availableW / widthM, availableH / heightM);
    double const metersToPixels = clamp(rawScale, lo, hi);

    // Y is inverted: the top of the box (maxY) lands at the top margin
    Position const originPx(
        (c.width - widthM * metersToPixels) / 2.0 - bounds.minX * metersToPixels,
        (c.height - heightM * metersToPixels) / 2.0 + bounds.maxY * metersToPixels);

    if (!originPx.isFinite()) {
        return fallbackTransform(containerSize);
    }
    return makeUnmappedTransform(originPx, metersToPixels);
}

Position toCanvas(const Position& pointM, const CanvasTransform& transform) {
    double const k = usableScale(transform.metersToPixels);
    return {transform.originPx.x + pointM.x * k,
            transform.originPx.y - pointM.y * k};
}

Position toMeters(const Position& pointPx, const CanvasTransform& transform) {
    double const k = usableScale(transform.metersToPixels);
    return {(pointPx.x - transform.originPx.x) / k,
            (transform.originPx.y - pointPx.y) / k};
}

Position metersToImagePixels(const Position& pointM, const SceneMapping& mapping) {
    double const pxPerMeter = 1.0 / mapping.scale_m_per_px;
    return {mapping.origin_px.x + pointM.x * pxPerMeter,
            mapping.origin_px.y - pointM.y * pxPerMeter};
}

Position imagePixelsToMeters(const Position& pointPx, const SceneMapping& mapping) {
    double const metersPerPx = mapping.scale_m_per_px;
    return {(pointPx.x - mapping.origin_px.x) * metersPerPx,
            (mapping.origin_px.y - pointPx.y) * metersPerPx};
}

Aabb imageBoundsMeters(const SceneMapping& mapping, const ImageSize& image) {
    Aabb bounds;
    bounds.expand(imagePixelsToMeters(Position(0.0, 0.0), mapping));
    bounds.expand(imagePixelsToMeters(Position(image.width, 0.0), mapping));
    bounds.expand(imagePixelsToMeters(Position(image.width, image.height), mapping));
    bounds.expand(imagePixelsToMeters(Position(0.0, image.height), mapping));
    return bounds;
}

const CanvasTransform& combineTransforms(const std::optional<CanvasTransform>& preferred,
                                         const CanvasTransform& fallback) {
    if (preferred && preferred->hasMapping) {
        return *preferred;
    }
    return fallback;
}

CanvasTransform selectActiveTransform(const Scene& scene,
                                      const std::optional<ImageSize>& imageSize,
                                      const ContainerSize& containerSize,
                                      const std::optional<Aabb>& motionBounds) {
    CanvasTransform mapped = computeTransform(scene.mapping, imageSize, containerSize);
    if (mapped.hasMapping) {
        return mapped;
    }
    if (motionBounds && !motionBounds->isEmpty() && containerSize.isUsable()) {
        return fitTransformToBounds(*motionBounds, containerSize,
                                    SimulatorConstants::DefaultFitPaddingPixels);
    }
    return mapped;
}

CanvasTransform defaultTransform() {
    return makeUnmappedTransform(Position(0.0, 0.0), SimulatorConstants::DefaultMetersToPixels);
}

// Coordinates

Coordinates::Coordinates()
    : transform(defaultTransform())
{
}

void Coordinates::update(const Scene& scene,
                         const std::optional<ImageSize>& imageSize,
                         const ContainerSize& containerSize,
                         const std::optional<Aabb>& motionBounds) {
    transform = selectActiveTransform(scene, imageSize, containerSize, motionBounds);
}

Position Coordinates::toCanvas(const Position& pointM) const {
    return Simulation::toCanvas(pointM, transform);
}

Position Coordinates::toMeters(const Position& pointPx) const {
    return Simulation::toMeters(pointPx, transform);
}

} // namespace Simulation
