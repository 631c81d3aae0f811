#pragma once

/**
 * @file TopologyBuilder.h
 * @brief Validated polygon-with-holes geometry and ROI <-> geometry conversion
 *
 * Build algorithm (single pass over flattened rings):
 * 1. Accumulate each ring's shoelace signed area into a running total
 * 2. Bucket rings by sign (zero-area rings are dropped)
 * 3. Repair rings failing the simplicity check (self-snap, see RingRepair.h)
 * 4. The sign of the total decides which bucket holds the outer rings;
 *    a total of exactly zero yields the empty geometry
 * 5. Union outers, union holes, subtract holes from outers
 * 6. Zero-tolerance simplification (duplicate/collinear vertices removed)
 * 7. Rings produced by overlays start at their lowest vertex; a single valid
 *    ring keeps its own start vertex and winding
 *
 * Used by:
 * - Convert/RoiConvert: single ROI normalization
 * - Combine/RoiCombine: boolean operations
 *
 * Never throws for degenerate geometry. Throws UnsupportedException only for
 * ROI kinds it cannot convert.
 */

#include <PathoRoi/Core/ConverterParams.h>
#include <PathoRoi/Core/QRoi.h>
#include <PathoRoi/Core/Types.h>
#include <PathoRoi/Internal/GeometryTypes.h>
#include <PathoRoi/Internal/PathFlatten.h>

#include <cstdint>
#include <string>
#include <vector>

namespace Patho::Roi::Internal {

// =============================================================================
// Topology Geometry
// =============================================================================

enum class GeometryType : uint8_t {
    Empty,
    Polygonal,      ///< Multi-polygon with holes
    Lineal,         ///< Line string
    Puntal          ///< One or more points
};

/**
 * @brief Validated geometry used inside the engine
 *
 * Polygonal geometry is simple with holes nested in their outer ring, unless
 * IsRepairedApproximate() reports a repair that changed area beyond tolerance.
 */
class TopologyGeometry {
public:
    /// Empty geometry
    TopologyGeometry() = default;

    static TopologyGeometry FromPolygons(BgMultiPolygon polygons, bool repairedApproximate = false);
    static TopologyGeometry FromLine(BgLineString line);
    static TopologyGeometry FromPoints(BgMultiPoint points);

    GeometryType Type() const { return type_; }
    bool IsEmpty() const { return type_ == GeometryType::Empty; }
    bool IsPolygonal() const { return type_ == GeometryType::Polygonal; }
    bool IsLineal() const { return type_ == GeometryType::Lineal; }
    bool IsPuntal() const { return type_ == GeometryType::Puntal; }

    const BgMultiPolygon& Polygons() const { return polygons_; }
    const BgLineString& Line() const { return line_; }
    const BgMultiPoint& Points() const { return points_; }

    double Area() const;

    /// Line length, or total ring perimeter for polygons
    double Length() const;

    /// Number of vertices (closing points not counted)
    size_t NumPoints() const;

    size_t NumPolygons() const { return polygons_.size(); }

    /// Outer rings plus holes
    size_t NumRings() const;

    Point2d Centroid() const;
    Rect2d BoundingBox() const;

    /**
     * @brief Check topological validity
     * @param reason Receives the failure description (may be null)
     */
    bool IsValid(std::string* reason = nullptr) const;

    bool IsRepairedApproximate() const { return repairedApproximate_; }

    /**
     * @brief Rings in storage order: each outer ring followed by its holes
     *
     * Outer rings have positive signed area, holes negative.
     */
    std::vector<FlatRing> Rings() const;

private:
    GeometryType type_ = GeometryType::Empty;
    BgMultiPolygon polygons_;
    BgLineString line_;
    BgMultiPoint points_;
    bool repairedApproximate_ = false;
};

/**
 * @brief Geometry together with its repair diagnostics
 */
struct BuildResult {
    TopologyGeometry geometry;
    ConversionReport report;

    /// Input was one clockwise ring kept as is (stored counter-clockwise)
    bool clockwiseInput = false;
};

// =============================================================================
// Builder
// =============================================================================

/**
 * @brief Build a polygonal geometry from flattened rings
 *
 * Ring order matters: the running signed-area total decides outer/hole roles.
 */
BuildResult BuildTopology(const std::vector<FlatRing>& rings,
                          const ConverterParams& params = DefaultConverterParams());

/// Re-run the builder on a geometry's own rings
BuildResult RebuildTopology(const TopologyGeometry& geometry,
                            const ConverterParams& params = DefaultConverterParams());

/**
 * @brief Polygonal geometry from a multi-polygon produced by an overlay
 *
 * Applies the precision model and zero-tolerance simplification. Rings are
 * rotated to their canonical start vertex unless keepRingStart is set.
 */
TopologyGeometry FinishPolygons(BgMultiPolygon polygons, const ConverterParams& params,
                                bool repairedApproximate = false, bool keepRingStart = false);

// =============================================================================
// ROI Conversion
// =============================================================================

/**
 * @brief Convert a ROI to geometry
 *
 * Areas are flattened and built, lines become line strings, point sets
 * become points. Coordinates are multiplied by the pixel size.
 *
 * @throws UnsupportedException for unknown ROI kinds
 */
BuildResult RoiToGeometry(const QRoi& roi,
                          const ConverterParams& params = DefaultConverterParams());

/**
 * @brief Convert geometry back to a ROI on the given plane
 *
 * Empty -> QRoi::Empty(plane); one point -> Points ROI of size 1; points ->
 * Points ROI; two-point line -> Line; longer line -> Polyline; one polygon
 * without holes -> Polygon; other polygonal geometry -> Composite.
 * Coordinates are divided by the pixel size. With clockwise set, a single
 * polygon is returned in clockwise vertex order (see BuildResult).
 */
QRoi GeometryToRoi(const TopologyGeometry& geometry, const ImagePlane& plane,
                   const ConverterParams& params = DefaultConverterParams(),
                   bool clockwise = false);

} // namespace Patho::Roi::Internal
