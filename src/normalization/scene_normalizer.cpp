/**
 * @file scene_normalizer.cpp
 * @brief Bounds fitting and contact separation passes
 */

#include "diagramsim/normalization/scene_normalizer.hpp"

#include <algorithm>
#include <cmath>
#include <set>
#include <sstream>

#include "diagramsim/core/constants.hpp"
#include "diagramsim/core/debug.hpp"
#include "diagramsim/core/profile.hpp"
#include "diagramsim/scene/scene_geometry.hpp"
#include "diagramsim/scene/scene_validation.hpp"

namespace Normalization {

using Simulation::Body;
using Simulation::BodyType;
using Simulation::Constraint;
using Simulation::Scene;

namespace {

// Slack below which a box counts as already inside the allowed area.
// Keeps a second pass over a normalized scene a no-op.
constexpr double kBoundsTolerance = 1e-9;

void warn(NormalizationReport& report, const std::string& message) {
    DIAGRAMSIM_WARN(message);
    report.warnings.push_back(message);
}

std::string joinIds(const std::vector<std::string>& ids) {
    std::ostringstream out;
    for (size_t i = 0; i < ids.size(); ++i) {
        if (i > 0) {
            out << ", ";
        }
        out << ids[i];
    }
    return out.str();
}

void applyRestitutionDefaults(Scene& scene) {
    for (auto& body : scene.bodies) {
        if (body.type == BodyType::Static) {
            continue;
        }
        auto& restitution = body.material.restitution;
        if (!restitution || !std::isfinite(*restitution)) {
            restitution = SimulatorConstants::DefaultRestitution;
        }
    }
}

std::vector<size_t> selectTargets(const Scene& scene, TargetBodies which) {
    std::vector<size_t> targets;
    for (size_t i = 0; i < scene.bodies.size(); ++i) {
        if (which == TargetBodies::All || scene.bodies[i].type != BodyType::Static) {
            targets.push_back(i);
        }
    }
    return targets;
}

std::optional<Aabb> targetsAabb(const Scene& scene, const std::vector<size_t>& targets) {
    Aabb box;
    for (size_t index : targets) {
        if (auto b = Simulation::bodyAabb(scene.bodies[index])) {
            box.merge(*b);
        }
    }
    if (box.isEmpty()) {
        return std::nullopt;
    }
    return box;
}

/**
 * Smallest shift that brings box inside allowed, one axis at a time.
 * The lower bound is applied first so that, when the box is too large, the
 * upper bound wins.
 */
Vector clampIntoBounds(const Aabb& box, const Aabb& allowed) {
    auto shiftAxis = [](double lo, double hi, double allowedLo, double allowedHi) {
        double shift = 0.0;
        if (lo < allowedLo - kBoundsTolerance) {
            shift += allowedLo - lo;
        }
        if (hi + shift > allowedHi + kBoundsTolerance) {
            shift -= (hi + shift) - allowedHi;
        }
        return shift;
    };
    return {shiftAxis(box.minX, box.maxX, allowed.minX, allowed.maxX),
            shiftAxis(box.minY, box.maxY, allowed.minY, allowed.maxY)};
}

/**
 * Flags the constraints whose world-space anchors move with the targets.
 * A constraint follows if every body it names exists and at least one of
 * them is a target. Dangling references are reported and left alone.
 */
std::vector<bool> constraintsFollowingTargets(const Scene& scene,
                                              const std::set<std::string>& targetIds,
                                              NormalizationReport& report) {
    std::vector<bool> follows(scene.constraints.size(), false);
    for (size_t i = 0; i < scene.constraints.size(); ++i) {
        const Constraint& constraint = scene.constraints[i];
        bool dangling = false;
        bool touchesTarget = false;
        for (const auto& id : Simulation::referencedBodies(constraint)) {
            if (!Simulation::findBody(scene, id)) {
                warn(report, "Constraint " + Simulation::constraintId(constraint) +
                             " references unknown body " + id + "; left unchanged");
                dangling = true;
            } else if (targetIds.count(id)) {
                touchesTarget = true;
            }
        }
        follows[i] = !dangling && touchesTarget;
    }
    return follows;
}

void translateTargets(Scene& scene,
                      const std::vector<size_t>& targets,
                      const std::vector<bool>& follows,
                      const Vector& delta) {
    for (size_t index : targets) {
        Simulation::translateBody(scene.bodies[index], delta);
    }
    for (size_t i = 0; i < scene.constraints.size(); ++i) {
        if (follows[i]) {
            Simulation::translateConstraint(scene.constraints[i], delta);
        }
    }
}

void scaleTargets(Scene& scene,
                  const std::vector<size_t>& targets,
                  const std::vector<bool>& follows,
                  const Position& center,
                  double factor,
                  bool scaleVelocities) {
    for (size_t index : targets) {
        Simulation::scaleBody(scene.bodies[index], center, factor, scaleVelocities);
    }
    for (size_t i = 0; i < scene.constraints.size(); ++i) {
        if (follows[i]) {
            Simulation::scaleConstraint(scene.constraints[i], center, factor);
        }
    }
}

bool overlapsAny(const Aabb& box, const Scene& scene, const std::vector<size_t>& statics) {
    for (size_t s : statics) {
        auto other = Simulation::bodyAabb(scene.bodies[s]);
        if (!other) {
            continue;
        }
        Vector const overlap = aabbOverlap(box, *other);
        if (overlap.x > kBoundsTolerance && overlap.y > kBoundsTolerance) {
            return true;
        }
    }
    return false;
}

/**
 * Push that clears one overlap. The preferred push runs along the axis of
 * least penetration, away from the static body's center. If that would take
 * the body outside allowed, the other axis and then the reverse directions
 * are tried; when none stays inside, the preferred push is used.
 */
Vector choosePush(const Aabb& box, const Aabb& other, const Vector& overlap, const Aabb& allowed) {
    double const eps = SimulatorConstants::ContactSeparationEpsilon;
    Position const c = box.center();
    Position const sc = other.center();
    double const awayX = c.x >= sc.x ? 1.0 : -1.0;
    double const awayY = c.y >= sc.y ? 1.0 : -1.0;
    Vector const alongX(awayX * (overlap.x + eps), 0.0);
    Vector const alongY(0.0, awayY * (overlap.y + eps));

    bool const xFirst = overlap.x < overlap.y;
    Vector const candidates[4] = {
        xFirst ? alongX : alongY,
        xFirst ? alongY : alongX,
        xFirst ? -alongX : -alongY,
        xFirst ? -alongY : -alongX,
    };
    for (const auto& push : candidates) {
        if (allowed.contains(box.translated(push.x, push.y), kBoundsTolerance)) {
            return push;
        }
    }
    return candidates[0];
}

/**
 * Pushes each movable target out of every static body it overlaps.
 * Returns the accumulated displacement per separated body, in scene order.
 */
std::vector<Simulation::ContactSeparation> separateContacts(Scene& scene,
                                                            const std::vector<size_t>& targets,
                                                            const Aabb& allowed,
                                                            NormalizationReport& report) {
    std::vector<size_t> movers;
    for (size_t index : targets) {
        if (scene.bodies[index].type != BodyType::Static) {
            movers.push_back(index);
        }
    }
    std::vector<size_t> statics;
    for (size_t i = 0; i < scene.bodies.size(); ++i) {
        if (scene.bodies[i].type == BodyType::Static) {
            statics.push_back(i);
        }
    }

    std::vector<Vector> accumulated(movers.size());
    if (movers.empty() || statics.empty()) {
        return {};
    }

    bool converged = false;
    for (size_t pass = 0; pass < SimulatorConstants::MaxContactSeparationPasses; ++pass) {
        bool moved = false;
        for (size_t m = 0; m < movers.size(); ++m) {
            Body& body = scene.bodies[movers[m]];
            for (size_t s : statics) {
                auto box = Simulation::bodyAabb(body);
                auto other = Simulation::bodyAabb(scene.bodies[s]);
                if (!box || !other) {
                    continue;
                }
                Vector const overlap = aabbOverlap(*box, *other);
                if (overlap.x <= 0.0 || overlap.y <= 0.0) {
                    continue;
                }

                Vector const push = choosePush(*box, *other, overlap, allowed);
                Simulation::translateBody(body, push);
                accumulated[m] = accumulated[m] + push;
                moved = true;
            }
        }
        if (!moved) {
            converged = true;
            break;
        }
    }

    if (!converged) {
        std::vector<std::string> stuck;
        for (size_t index : movers) {
            auto box = Simulation::bodyAabb(scene.bodies[index]);
            if (box && overlapsAny(*box, scene, statics)) {
                stuck.push_back(scene.bodies[index].id);
            }
        }
        if (!stuck.empty()) {
            std::ostringstream msg;
            msg << "Contact separation did not converge after "
                << SimulatorConstants::MaxContactSeparationPasses << " passes for " << joinIds(stuck);
            warn(report, msg.str());
        }
    }

    std::vector<Simulation::ContactSeparation> separations;
    for (size_t m = 0; m < movers.size(); ++m) {
        if (accumulated[m].x == 0.0 && accumulated[m].y == 0.0) {
            continue;
        }
        const Body& body = scene.bodies[movers[m]];
        separations.push_back({body.id, accumulated[m]});

        auto box = Simulation::bodyAabb(body);
        if (box && !allowed.contains(*box, kBoundsTolerance)) {
            warn(report, body.id + " left image bounds after contact separation");
        }
    }
    return separations;
}

} // namespace

NormalizationResult SceneNormalizer::normalize(const Scene& source,
                                               const Simulation::SceneMapping& mapping,
                                               const Simulation::ImageSize& image,
                                               const NormalizationOptions& options) {
    PROFILE_SCOPE("SceneNormalizer");

    NormalizationResult result{source, NormalizationReport()};
    Scene& scene = result.scene;
    NormalizationReport& report = result.report;
    report.mode = options.mode;

    applyRestitutionDefaults(scene);

    double const margin = (std::isfinite(options.margin_m) && options.margin_m >= 0.0)
                              ? options.margin_m
                              : 0.0;

    std::vector<size_t> const targets = selectTargets(scene, options.targetBodies);
    if (targets.empty()) {
        warn(report, "Normalization skipped: no eligible bodies found");
        return result;
    }

    auto const validMapping = Simulation::normalizeSceneMapping(mapping);
    if (!validMapping) {
        warn(report, "Normalization skipped: scene mapping is invalid");
        return result;
    }
    if (!image.isUsable()) {
        warn(report, "Normalization skipped: image size must be positive");
        return result;
    }

    Aabb const allowed = Simulation::imageBoundsMeters(*validMapping, image).inset(margin);
    if (!(allowed.width() > 0.0) || !(allowed.height() > 0.0)) {
        warn(report, "Normalization skipped: margin leaves no room inside the image");
        return result;
    }

    auto aggregate = targetsAabb(scene, targets);
    if (!aggregate) {
        warn(report, "Normalization skipped: no target body has a finite position");
        return result;
    }

    std::set<std::string> targetIds;
    for (size_t index : targets) {
        targetIds.insert(scene.bodies[index].id);
    }
    std::vector<bool> const follows = constraintsFollowingTargets(scene, targetIds, report);

    // Translate into bounds
    Vector translation = clampIntoBounds(*aggregate, allowed);
    if (translation.x != 0.0 || translation.y != 0.0) {
        translateTargets(scene, targets, follows, translation);
    }

    // Shrink about the centroid if the group still does not fit
    double scale = 1.0;
    if (options.mode == Simulation::NormalizationMode::TranslateAndScale) {
        Aabb const box = *targetsAabb(scene, targets);
        bool const tooWide = box.width() > allowed.width() + kBoundsTolerance;
        bool const tooTall = box.height() > allowed.height() + kBoundsTolerance;
        if (tooWide || tooTall) {
            double factor = 1.0;
            if (box.width() > 0.0) {
                factor = std::min(factor, allowed.width() / box.width());
            }
            if (box.height() > 0.0) {
                factor = std::min(factor, allowed.height() / box.height());
            }
            if (factor < 1.0 && factor > 0.0) {
                scale = factor;
                scaleTargets(scene, targets, follows, box.center(), factor, options.scaleVelocities);
                Vector const post = clampIntoBounds(*targetsAabb(scene, targets), allowed);
                if (post.x != 0.0 || post.y != 0.0) {
                    translateTargets(scene, targets, follows, post);
                    translation = translation + post;
                }
            }
        }
    }

    auto separations = separateContacts(scene, targets, allowed, report);
    std::set<std::string> separatedIds;
    for (const auto& s : separations) {
        separatedIds.insert(s.id);
    }
    if (!separations.empty()) {
        std::vector<std::string> ids;
        for (const auto& s : separations) {
            ids.push_back(s.id);
        }
        warn(report, "Contact separation applied to " + joinIds(ids));
    }

    bool const moved = translation.x != 0.0 || translation.y != 0.0 || scale != 1.0;
    for (const auto& body : scene.bodies) {
        bool const shifted = moved && targetIds.count(body.id) && body.position_m.isFinite();
        if (shifted || separatedIds.count(body.id)) {
            report.adjustedBodyIds.push_back(body.id);
        }
    }

    report.applied = moved || !separations.empty();
    report.translation_m = translation;
    if (scale != 1.0) {
        report.scale = scale;
    }

    Simulation::NormalizationMeta meta;
    meta.translation_m = translation;
    meta.scale = scale;
    meta.mode = options.mode;
    meta.margin_m = margin;
    meta.contact_separation = std::move(separations);
    scene.meta.normalization = std::move(meta);

    if (report.applied) {
        DIAGRAMSIM_INFO("Normalized scene: translation (" << translation.x << ", " << translation.y
                        << ") m, scale " << scale << ", " << report.adjustedBodyIds.size()
                        << " bodies adjusted");
    }
    return result;
}

} // namespace Normalization
