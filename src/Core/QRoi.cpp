#include <PathoRoi/Core/QRoi.h>
#include <PathoRoi/Core/Constants.h>
#include <PathoRoi/Core/Exception.h>
#include <PathoRoi/Internal/PathFlatten.h>

#include <algorithm>
#include <cmath>
#include <utility>

namespace Patho::Roi {

namespace {

Point2d MeanPoint(const std::vector<Point2d>& points) {
    if (points.empty()) {
        return {0.0, 0.0};
    }
    double sumX = 0.0, sumY = 0.0;
    for (const auto& p : points) {
        sumX += p.x;
        sumY += p.y;
    }
    double n = static_cast<double>(points.size());
    return {sumX / n, sumY / n};
}

// Area-weighted centroid over rings with signed areas (holes subtract)
Point2d RingsCentroid(const std::vector<Ring2d>& rings) {
    double cx = 0.0, cy = 0.0, area2 = 0.0;
    for (const auto& ring : rings) {
        size_t n = ring.size();
        if (n < 3) continue;
        for (size_t i = 0; i < n; ++i) {
            const Point2d& a = ring[i];
            const Point2d& b = ring[(i + 1) % n];
            double cross = a.Cross(b);
            area2 += cross;
            cx += (a.x + b.x) * cross;
            cy += (a.y + b.y) * cross;
        }
    }
    if (std::abs(area2) < EPSILON) {
        std::vector<Point2d> all;
        for (const auto& ring : rings) {
            all.insert(all.end(), ring.begin(), ring.end());
        }
        return MeanPoint(all);
    }
    return {cx / (3.0 * area2), cy / (3.0 * area2)};
}

// Ray casting; toggles for every ring so holes are excluded
bool RingsContain(const std::vector<Ring2d>& rings, double x, double y) {
    bool inside = false;
    for (const auto& ring : rings) {
        size_t n = ring.size();
        if (n < 3) continue;
        for (size_t i = 0; i < n; ++i) {
            size_t j = (i + 1) % n;
            double yi = ring[i].y;
            double yj = ring[j].y;
            if ((yi <= y && yj > y) || (yj <= y && yi > y)) {
                double xIntersect = ring[i].x + (y - yi) / (yj - yi) * (ring[j].x - ring[i].x);
                if (x < xIntersect) {
                    inside = !inside;
                }
            }
        }
    }
    return inside;
}

double SignedAreaSum(const std::vector<Ring2d>& rings) {
    double sum = 0.0;
    for (const auto& ring : rings) {
        sum += Internal::SignedArea(ring);
    }
    return sum;
}

// Ramanujan's approximation
double EllipsePerimeter(double a, double b) {
    return PI * (3.0 * (a + b) - std::sqrt((3.0 * a + b) * (a + 3.0 * b)));
}

std::vector<Point2d> ScalePoints(const std::vector<Point2d>& points, double sx, double sy) {
    std::vector<Point2d> result;
    result.reserve(points.size());
    for (const auto& p : points) {
        result.emplace_back(p.x * sx, p.y * sy);
    }
    return result;
}

std::vector<Point2d> TranslatePoints(const std::vector<Point2d>& points, double dx, double dy) {
    std::vector<Point2d> result;
    result.reserve(points.size());
    for (const auto& p : points) {
        result.emplace_back(p.x + dx, p.y + dy);
    }
    return result;
}

} // anonymous namespace

const char* RoiKindName(RoiKind kind) {
    switch (kind) {
        case RoiKind::Rectangle: return "Rectangle";
        case RoiKind::Ellipse:   return "Ellipse";
        case RoiKind::Polygon:   return "Polygon";
        case RoiKind::Composite: return "Composite";
        case RoiKind::Line:      return "Line";
        case RoiKind::Polyline:  return "Polyline";
        case RoiKind::Points:    return "Points";
        default:                 return "Unknown";
    }
}

// =============================================================================
// Factories
// =============================================================================

QRoi::QRoi() : shape_(CompositeShape{}), plane_() {}

QRoi::QRoi(RoiShape shape, const ImagePlane& plane)
    : shape_(std::move(shape)), plane_(plane) {}

QRoi QRoi::Rectangle(double x, double y, double width, double height, const ImagePlane& plane) {
    return QRoi(RectangleShape{Rect2d(x, y, width, height)}, plane);
}

QRoi QRoi::Ellipse(double x, double y, double width, double height, const ImagePlane& plane) {
    return QRoi(EllipseShape{Rect2d(x, y, width, height)}, plane);
}

QRoi QRoi::Polygon(const std::vector<Point2d>& vertices, const ImagePlane& plane) {
    return QRoi(PolygonShape{vertices}, plane);
}

QRoi QRoi::Composite(const std::vector<Ring2d>& rings, const ImagePlane& plane) {
    return QRoi(CompositeShape{rings}, plane);
}

QRoi QRoi::Line(double x1, double y1, double x2, double y2, const ImagePlane& plane) {
    return QRoi(LineShape{Point2d(x1, y1), Point2d(x2, y2)}, plane);
}

QRoi QRoi::Polyline(const std::vector<Point2d>& vertices, const ImagePlane& plane) {
    return QRoi(PolylineShape{vertices}, plane);
}

QRoi QRoi::Points(const std::vector<Point2d>& points, const ImagePlane& plane) {
    return QRoi(PointsShape{points}, plane);
}

QRoi QRoi::Empty(const ImagePlane& plane) {
    return QRoi(CompositeShape{}, plane);
}

// =============================================================================
// Kind and Capability
// =============================================================================

RoiKind QRoi::Kind() const {
    switch (shape_.index()) {
        case 0: return RoiKind::Rectangle;
        case 1: return RoiKind::Ellipse;
        case 2: return RoiKind::Polygon;
        case 3: return RoiKind::Composite;
        case 4: return RoiKind::Line;
        case 5: return RoiKind::Polyline;
        default: return RoiKind::Points;
    }
}

bool QRoi::IsArea() const {
    RoiKind kind = Kind();
    return kind == RoiKind::Rectangle || kind == RoiKind::Ellipse ||
           kind == RoiKind::Polygon || kind == RoiKind::Composite;
}

bool QRoi::IsLine() const {
    RoiKind kind = Kind();
    return kind == RoiKind::Line || kind == RoiKind::Polyline;
}

bool QRoi::IsPoint() const {
    return Kind() == RoiKind::Points;
}

bool QRoi::IsEmpty() const {
    switch (Kind()) {
        case RoiKind::Rectangle: {
            const Rect2d& r = std::get<RectangleShape>(shape_).bounds;
            return !(r.width > 0.0 && r.height > 0.0);
        }
        case RoiKind::Ellipse: {
            const Rect2d& r = std::get<EllipseShape>(shape_).bounds;
            return !(r.width > 0.0 && r.height > 0.0);
        }
        case RoiKind::Polygon:
            return std::get<PolygonShape>(shape_).vertices.size() < 3;
        case RoiKind::Composite:
            return std::get<CompositeShape>(shape_).rings.empty();
        case RoiKind::Line:
            return false;
        case RoiKind::Polyline:
            return std::get<PolylineShape>(shape_).vertices.empty();
        case RoiKind::Points:
            return std::get<PointsShape>(shape_).points.empty();
    }
    return true;
}

// =============================================================================
// Shape Queries
// =============================================================================

Rect2d QRoi::BoundingBox() const {
    switch (Kind()) {
        case RoiKind::Rectangle:
            return std::get<RectangleShape>(shape_).bounds;
        case RoiKind::Ellipse:
            return std::get<EllipseShape>(shape_).bounds;
        default:
            return Rect2d::FromPoints(PolygonPoints());
    }
}

double QRoi::Area() const {
    return ScaledArea(1.0, 1.0);
}

double QRoi::ScaledArea(double pixelWidth, double pixelHeight) const {
    if (IsEmpty()) {
        return 0.0;
    }
    double scale = pixelWidth * pixelHeight;
    switch (Kind()) {
        case RoiKind::Rectangle:
            return std::get<RectangleShape>(shape_).bounds.Area() * scale;
        case RoiKind::Ellipse: {
            const Rect2d& r = std::get<EllipseShape>(shape_).bounds;
            return PI * r.width * r.height * 0.25 * scale;
        }
        case RoiKind::Polygon:
            return std::abs(Internal::SignedArea(std::get<PolygonShape>(shape_).vertices)) * scale;
        case RoiKind::Composite:
            return std::abs(SignedAreaSum(std::get<CompositeShape>(shape_).rings)) * scale;
        default:
            return 0.0;
    }
}

double QRoi::Length() const {
    return ScaledLength(1.0, 1.0);
}

double QRoi::ScaledLength(double pixelWidth, double pixelHeight) const {
    if (IsEmpty()) {
        return 0.0;
    }
    switch (Kind()) {
        case RoiKind::Rectangle: {
            const Rect2d& r = std::get<RectangleShape>(shape_).bounds;
            return 2.0 * (r.width * pixelWidth + r.height * pixelHeight);
        }
        case RoiKind::Ellipse: {
            const Rect2d& r = std::get<EllipseShape>(shape_).bounds;
            return EllipsePerimeter(r.width * pixelWidth * 0.5, r.height * pixelHeight * 0.5);
        }
        case RoiKind::Polygon:
            return Internal::RingPerimeter(
                ScalePoints(std::get<PolygonShape>(shape_).vertices, pixelWidth, pixelHeight));
        case RoiKind::Composite: {
            double length = 0.0;
            for (const auto& ring : std::get<CompositeShape>(shape_).rings) {
                length += Internal::RingPerimeter(ScalePoints(ring, pixelWidth, pixelHeight));
            }
            return length;
        }
        case RoiKind::Line:
        case RoiKind::Polyline:
            return Internal::PolylineLength(ScalePoints(PolygonPoints(), pixelWidth, pixelHeight));
        default:
            return 0.0;
    }
}

Point2d QRoi::Centroid() const {
    switch (Kind()) {
        case RoiKind::Rectangle:
            return std::get<RectangleShape>(shape_).bounds.Center();
        case RoiKind::Ellipse:
            return std::get<EllipseShape>(shape_).bounds.Center();
        case RoiKind::Polygon:
            return RingsCentroid({std::get<PolygonShape>(shape_).vertices});
        case RoiKind::Composite:
            return RingsCentroid(std::get<CompositeShape>(shape_).rings);
        case RoiKind::Line: {
            const auto& line = std::get<LineShape>(shape_);
            return (line.start + line.end) * 0.5;
        }
        default:
            return MeanPoint(PolygonPoints());
    }
}

bool QRoi::Contains(double x, double y) const {
    if (!IsArea() || IsEmpty()) {
        return false;
    }
    switch (Kind()) {
        case RoiKind::Rectangle: {
            const Rect2d& r = std::get<RectangleShape>(shape_).bounds;
            return x >= r.x && x < r.Right() && y >= r.y && y < r.Bottom();
        }
        case RoiKind::Ellipse: {
            const Rect2d& r = std::get<EllipseShape>(shape_).bounds;
            double a = r.width * 0.5;
            double b = r.height * 0.5;
            double dx = (x - (r.x + a)) / a;
            double dy = (y - (r.y + b)) / b;
            return dx * dx + dy * dy <= 1.0;
        }
        default:
            return RingsContain(Rings(), x, y);
    }
}

std::vector<Point2d> QRoi::PolygonPoints() const {
    switch (Kind()) {
        case RoiKind::Rectangle: {
            const Rect2d& r = std::get<RectangleShape>(shape_).bounds;
            return {{r.x, r.y}, {r.Right(), r.y}, {r.Right(), r.Bottom()}, {r.x, r.Bottom()}};
        }
        case RoiKind::Ellipse: {
            std::vector<Point2d> points;
            for (auto& ring : Internal::FlattenAreaRoi(*this, DEFAULT_FLATNESS)) {
                points.insert(points.end(), ring.points.begin(), ring.points.end());
            }
            return points;
        }
        case RoiKind::Polygon:
            return std::get<PolygonShape>(shape_).vertices;
        case RoiKind::Composite: {
            std::vector<Point2d> points;
            for (const auto& ring : std::get<CompositeShape>(shape_).rings) {
                points.insert(points.end(), ring.begin(), ring.end());
            }
            return points;
        }
        case RoiKind::Line: {
            const auto& line = std::get<LineShape>(shape_);
            return {line.start, line.end};
        }
        case RoiKind::Polyline:
            return std::get<PolylineShape>(shape_).vertices;
        case RoiKind::Points:
            return std::get<PointsShape>(shape_).points;
    }
    return {};
}

size_t QRoi::NumPoints() const {
    switch (Kind()) {
        case RoiKind::Rectangle: return 4;
        case RoiKind::Line:      return 2;
        default:                 return PolygonPoints().size();
    }
}

std::vector<Ring2d> QRoi::Rings() const {
    if (!IsArea() || IsEmpty()) {
        return {};
    }
    if (Kind() == RoiKind::Composite) {
        return std::get<CompositeShape>(shape_).rings;
    }
    return {PolygonPoints()};
}

// =============================================================================
// Transformations
// =============================================================================

QRoi QRoi::WithPlane(const ImagePlane& plane) const {
    return QRoi(shape_, plane);
}

QRoi QRoi::Translate(double dx, double dy) const {
    switch (Kind()) {
        case RoiKind::Rectangle: {
            const Rect2d& r = std::get<RectangleShape>(shape_).bounds;
            return Rectangle(r.x + dx, r.y + dy, r.width, r.height, plane_);
        }
        case RoiKind::Ellipse: {
            const Rect2d& r = std::get<EllipseShape>(shape_).bounds;
            return Ellipse(r.x + dx, r.y + dy, r.width, r.height, plane_);
        }
        case RoiKind::Polygon:
            return Polygon(TranslatePoints(std::get<PolygonShape>(shape_).vertices, dx, dy), plane_);
        case RoiKind::Composite: {
            std::vector<Ring2d> rings;
            for (const auto& ring : std::get<CompositeShape>(shape_).rings) {
                rings.push_back(TranslatePoints(ring, dx, dy));
            }
            return Composite(rings, plane_);
        }
        case RoiKind::Line: {
            const auto& line = std::get<LineShape>(shape_);
            return Line(line.start.x + dx, line.start.y + dy, line.end.x + dx, line.end.y + dy, plane_);
        }
        case RoiKind::Polyline:
            return Polyline(TranslatePoints(std::get<PolylineShape>(shape_).vertices, dx, dy), plane_);
        case RoiKind::Points:
            return Points(TranslatePoints(std::get<PointsShape>(shape_).points, dx, dy), plane_);
    }
    throw UnsupportedException("Translate: unknown ROI kind");
}

} // namespace Patho::Roi
