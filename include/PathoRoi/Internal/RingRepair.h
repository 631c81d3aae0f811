#pragma once

/**
 * @file RingRepair.h
 * @brief Self-snapping repair of self-intersecting rings
 *
 * Repair steps for a ring that fails the simplicity check:
 * 1. Snap vertices onto earlier vertices closer than the snap tolerance
 * 2. Node the ring: insert every self-intersection point into both edges
 * 3. Split the noded ring at repeated vertices into simple loops
 * 4. Fill loops with the dominant orientation, cut out opposite loops lying
 *    inside them, keep opposite loops lying outside as separate lobes
 *
 * The snap tolerance is proportional to the ring's bounding diameter.
 * Snap and noding candidates come from R-tree queries, so a ring with few
 * crossings is repaired in O(n log n).
 */

#include <PathoRoi/Core/ConverterParams.h>
#include <PathoRoi/Core/Types.h>
#include <PathoRoi/Internal/GeometryTypes.h>

#include <string>
#include <vector>

namespace Patho::Roi::Internal {

// =============================================================================
// Constants
// =============================================================================

/// Relative tolerance on segment parameters when noding
constexpr double NODING_PARAM_TOLERANCE = 1e-12;

/// Tolerance for parallel segment detection (relative to |d1|*|d2|)
constexpr double NODING_PARALLEL_TOLERANCE = 1e-12;

// =============================================================================
// Result Structures
// =============================================================================

/**
 * @brief Intersection of two segments
 */
struct SegmentHit {
    Point2d point;          ///< Intersection point
    double t = 0.0;         ///< Parameter on first segment [0, 1]
    double s = 0.0;         ///< Parameter on second segment [0, 1]
};

/**
 * @brief Result of repairing one ring
 */
struct RingRepairResult {
    BgMultiPolygon polygons;        ///< Repaired, positively oriented geometry
    double areaBefore = 0.0;        ///< |signed area| of the input ring
    double areaAfter = 0.0;         ///< Area of the repaired geometry
    double snapTolerance = 0.0;
    bool approximate = false;       ///< Area change exceeded the tolerance
};

// =============================================================================
// Repair Steps
// =============================================================================

/**
 * @brief Intersections between segments a1-a2 and b1-b2
 *
 * Returns one point for crossing or touching segments and up to two points
 * (the overlap end points) for collinear overlapping segments.
 */
std::vector<SegmentHit> IntersectSegments(const Point2d& a1, const Point2d& a2,
                                          const Point2d& b1, const Point2d& b2);

/// Snap tolerance for a ring: bounding diameter times factor
double ComputeSnapTolerance(const Ring2d& ring, double factor);

/// Move every vertex onto the first earlier vertex within tolerance
Ring2d SnapRingToSelf(const Ring2d& ring, double tolerance);

/// Insert all self-intersection points as vertices
Ring2d NodeRing(const Ring2d& ring, double tolerance);

/// Split a noded ring at repeated vertices into loops (each with >= 3 vertices)
std::vector<Ring2d> SplitIntoLoops(const Ring2d& ring);

/**
 * @brief Repair a self-intersecting ring
 *
 * Never throws for degenerate geometry. If the repair cannot produce a
 * result, the result is empty and flagged approximate.
 */
RingRepairResult RepairRing(const Ring2d& ring, const ConverterParams& params);

} // namespace Patho::Roi::Internal
