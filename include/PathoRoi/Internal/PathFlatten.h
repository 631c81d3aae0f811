#pragma once

/**
 * @file PathFlatten.h
 * @brief Path description of area ROIs and curve flattening
 *
 * This module provides:
 * - RoiPath: MoveTo/LineTo/CubicTo/Close command list of an area ROI
 * - Cubic Bezier flattening by iterative de Casteljau subdivision
 * - Flattening of a path into closed vertex rings with signed areas
 *
 * Used by:
 * - Core/QRoi: ellipse vertex lists
 * - Internal/TopologyBuilder: ROI to geometry conversion
 *
 * Design principles:
 * - Subpath order is preserved (ring order matters to the builder)
 * - Rings with fewer than 3 distinct vertices are dropped silently
 * - No vertex of a straight-line subpath is moved
 */

#include <PathoRoi/Core/Types.h>
#include <PathoRoi/Core/QRoi.h>

#include <cstdint>
#include <vector>

namespace Patho::Roi::Internal {

// =============================================================================
// Path
// =============================================================================

enum class PathCommand : uint8_t {
    MoveTo,
    LineTo,
    CubicTo,
    Close
};

/**
 * @brief One path command
 *
 * MoveTo/LineTo use p1 as target. CubicTo uses p1, p2 as control points and
 * p3 as target. Close carries no points.
 */
struct PathSegment {
    PathCommand command = PathCommand::MoveTo;
    Point2d p1;
    Point2d p2;
    Point2d p3;
};

class RoiPath {
public:
    RoiPath() = default;

    void MoveTo(const Point2d& p);
    void LineTo(const Point2d& p);
    void CubicTo(const Point2d& c1, const Point2d& c2, const Point2d& p);
    void Close();

    const std::vector<PathSegment>& Segments() const { return segments_; }
    size_t Size() const { return segments_.size(); }
    bool Empty() const { return segments_.empty(); }

    /// Number of MoveTo commands
    size_t NumSubpaths() const;

    /// Path with every x multiplied by sx and every y by sy
    RoiPath Scaled(double sx, double sy) const;

private:
    std::vector<PathSegment> segments_;
};

/**
 * @brief Build the path of an area ROI
 *
 * Ellipse: four cubic quadrants starting at the right extreme.
 * Polygon: one subpath. Composite: one subpath per ring in stored order.
 * Empty areas yield an empty path.
 *
 * @throws UnsupportedException for line and point ROIs
 */
RoiPath BuildPath(const QRoi& roi);

// =============================================================================
// Flattening
// =============================================================================

/**
 * @brief Closed ring produced by flattening
 */
struct FlatRing {
    Ring2d points;              ///< Vertices, closing edge implicit
    double signedArea = 0.0;    ///< Shoelace area (positive = counter-clockwise)
};

/**
 * @brief Flatten a cubic Bezier curve
 *
 * Subdivides until both control points lie within flatness of the chord.
 * Appends the curve points after p0 (p0 itself is not appended).
 */
void FlattenCubic(const Point2d& p0, const Point2d& c1, const Point2d& c2, const Point2d& p3,
                  double flatness, std::vector<Point2d>& out);

/**
 * @brief Flatten a path into closed rings
 *
 * An unclosed subpath is closed implicitly at the next MoveTo or at the end.
 *
 * @throws InvalidArgumentException if flatness is not positive
 */
std::vector<FlatRing> FlattenPath(const RoiPath& path, double flatness);

/**
 * @brief Scale and flatten an area ROI
 *
 * The path is scaled by (sx, sy) before flattening so the tolerance applies
 * in the scaled coordinate space.
 */
std::vector<FlatRing> FlattenAreaRoi(const QRoi& roi, double flatness,
                                     double sx = 1.0, double sy = 1.0);

// =============================================================================
// Ring Utilities
// =============================================================================

/// Shoelace signed area (positive = counter-clockwise)
double SignedArea(const Ring2d& ring);

/// Perimeter of a closed ring
double RingPerimeter(const Ring2d& ring);

/// Length of an open polyline
double PolylineLength(const std::vector<Point2d>& points);

/// Remove consecutive duplicate vertices including the closing duplicate
Ring2d RemoveDuplicateVertices(const Ring2d& ring);

} // namespace Patho::Roi::Internal
