#pragma once

/**
 * @file QRoi.h
 * @brief Immutable, plane-tagged region of interest
 *
 * A QRoi is a closed tagged variant over the supported annotation shapes:
 * - Area:   Rectangle, Ellipse, Polygon, Composite (rings with holes)
 * - Line:   Line (two points), Polyline
 * - Points: ordered multiset of points
 *
 * Every ROI is immutable after construction. Transformations return new
 * values. Rectangle and ellipse answer bounds/area queries analytically and
 * are only flattened when converted to topology geometry.
 */

#include <PathoRoi/Core/Export.h>
#include <PathoRoi/Core/Types.h>

#include <cstdint>
#include <variant>
#include <vector>

namespace Patho::Roi {

/**
 * @brief ROI shape kind (values are stable, used by serialization)
 */
enum class RoiKind : uint8_t {
    Rectangle = 1,
    Ellipse   = 2,
    Polygon   = 3,
    Composite = 4,
    Line      = 5,
    Polyline  = 6,
    Points    = 7
};

/// Name of a ROI kind ("Rectangle", "Ellipse", ...)
PATHOROI_API const char* RoiKindName(RoiKind kind);

// =============================================================================
// Shape Payloads
// =============================================================================

/// Axis-aligned rectangle
struct RectangleShape {
    Rect2d bounds;
};

/// Axis-aligned ellipse inscribed in its bounds
struct EllipseShape {
    Rect2d bounds;
};

/// Simple closed polygon given by its vertices (closing edge implicit)
struct PolygonShape {
    Ring2d vertices;
};

/// Area made of several rings: each outer ring followed by its holes
struct CompositeShape {
    std::vector<Ring2d> rings;
};

/// Straight line segment
struct LineShape {
    Point2d start;
    Point2d end;
};

/// Open polyline
struct PolylineShape {
    std::vector<Point2d> vertices;
};

/// Ordered point set
struct PointsShape {
    std::vector<Point2d> points;
};

using RoiShape = std::variant<RectangleShape, EllipseShape, PolygonShape, CompositeShape,
                              LineShape, PolylineShape, PointsShape>;

// =============================================================================
// QRoi
// =============================================================================

class PATHOROI_API QRoi {
public:
    // =========================================================================
    // Factories
    // =========================================================================

    /// Default constructor: the empty ROI on the default plane
    QRoi();

    static QRoi Rectangle(double x, double y, double width, double height,
                          const ImagePlane& plane = ImagePlane::Default());

    /// Ellipse inscribed in the rectangle (x, y, width, height)
    static QRoi Ellipse(double x, double y, double width, double height,
                        const ImagePlane& plane = ImagePlane::Default());

    static QRoi Polygon(const std::vector<Point2d>& vertices,
                        const ImagePlane& plane = ImagePlane::Default());

    /// Composite area; rings are stored as given (outer ring, then its holes)
    static QRoi Composite(const std::vector<Ring2d>& rings,
                          const ImagePlane& plane = ImagePlane::Default());

    static QRoi Line(double x1, double y1, double x2, double y2,
                     const ImagePlane& plane = ImagePlane::Default());

    static QRoi Polyline(const std::vector<Point2d>& vertices,
                         const ImagePlane& plane = ImagePlane::Default());

    static QRoi Points(const std::vector<Point2d>& points,
                       const ImagePlane& plane = ImagePlane::Default());

    /// Explicitly empty ROI: an area with no rings
    static QRoi Empty(const ImagePlane& plane = ImagePlane::Default());

    // =========================================================================
    // Kind and Capability
    // =========================================================================

    RoiKind Kind() const;
    const RoiShape& Shape() const { return shape_; }
    const ImagePlane& Plane() const { return plane_; }

    bool IsArea() const;
    bool IsLine() const;
    bool IsPoint() const;

    /**
     * @brief True if the ROI covers nothing
     *
     * Rectangle/ellipse with non-positive size, polygon with fewer than 3
     * vertices, composite without rings, polyline/points without points.
     */
    bool IsEmpty() const;

    // =========================================================================
    // Shape Queries
    // =========================================================================

    Rect2d BoundingBox() const;

    /// Area in pixels (0 for lines and points)
    double Area() const;

    /// Area after scaling x by pixelWidth and y by pixelHeight
    double ScaledArea(double pixelWidth, double pixelHeight) const;

    /// Line length, or perimeter for areas (0 for points)
    double Length() const;

    double ScaledLength(double pixelWidth, double pixelHeight) const;

    Point2d Centroid() const;

    /// Point-in-area test (always false for lines and points)
    bool Contains(double x, double y) const;

    /**
     * @brief Vertex list of the ROI
     *
     * Rectangle corners, ellipse flattened at DEFAULT_FLATNESS, all composite
     * rings concatenated, line end points, polyline vertices, points.
     */
    std::vector<Point2d> PolygonPoints() const;

    size_t NumPoints() const;

    /// Rings of an area ROI (one ring for polygon/rectangle/ellipse, none for others)
    std::vector<Ring2d> Rings() const;

    // =========================================================================
    // Transformations (return new values)
    // =========================================================================

    QRoi WithPlane(const ImagePlane& plane) const;
    QRoi Translate(double dx, double dy) const;

private:
    QRoi(RoiShape shape, const ImagePlane& plane);

    RoiShape shape_;
    ImagePlane plane_;
};

} // namespace Patho::Roi
