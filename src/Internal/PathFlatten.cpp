/**
 * @file PathFlatten.cpp
 * @brief Implementation of ROI paths and curve flattening
 */

#include <PathoRoi/Internal/PathFlatten.h>
#include <PathoRoi/Core/Constants.h>
#include <PathoRoi/Core/Exception.h>
#include <PathoRoi/Core/Validate.h>

#include <algorithm>
#include <cmath>
#include <string>

namespace Patho::Roi::Internal {

namespace {

/// Subdivision depth limit for a single cubic (2^16 pieces)
constexpr int MAX_CUBIC_DEPTH = 16;

struct CubicWork {
    Point2d p0;
    Point2d c1;
    Point2d c2;
    Point2d p3;
    int depth = 0;
};

double PointSegmentDistance(const Point2d& p, const Point2d& a, const Point2d& b) {
    Point2d ab = b - a;
    double abLen2 = ab.Dot(ab);
    if (!(abLen2 > EPSILON)) {
        return p.DistanceTo(a);
    }
    double t = Clamp((p - a).Dot(ab) / abLen2, 0.0, 1.0);
    return p.DistanceTo(a + ab * t);
}

size_t CountDistinct(const Ring2d& ring) {
    std::vector<Point2d> sorted(ring);
    std::sort(sorted.begin(), sorted.end(), [](const Point2d& a, const Point2d& b) {
        return a.x < b.x || (a.x == b.x && a.y < b.y);
    });
    return static_cast<size_t>(std::unique(sorted.begin(), sorted.end()) - sorted.begin());
}

void FinishRing(Ring2d& current, std::vector<FlatRing>& rings) {
    Ring2d ring = RemoveDuplicateVertices(current);
    current.clear();
    if (ring.size() < 3 || CountDistinct(ring) < 3) {
        return;
    }
    FlatRing flat;
    flat.signedArea = SignedArea(ring);
    flat.points = std::move(ring);
    rings.push_back(std::move(flat));
}

Point2d ScalePoint(const Point2d& p, double sx, double sy) {
    return {p.x * sx, p.y * sy};
}

void AppendRingPath(RoiPath& path, const Ring2d& ring) {
    if (ring.empty()) {
        return;
    }
    path.MoveTo(ring[0]);
    for (size_t i = 1; i < ring.size(); ++i) {
        path.LineTo(ring[i]);
    }
    path.Close();
}

void AppendEllipsePath(RoiPath& path, const Rect2d& bounds) {
    double a = bounds.width / 2.0;
    double b = bounds.height / 2.0;
    double cx = bounds.x + a;
    double cy = bounds.y + b;
    double ka = BEZIER_ELLIPSE_KAPPA * a;
    double kb = BEZIER_ELLIPSE_KAPPA * b;

    // Right -> bottom -> left -> top (y axis points down)
    path.MoveTo({cx + a, cy});
    path.CubicTo({cx + a, cy + kb}, {cx + ka, cy + b}, {cx, cy + b});
    path.CubicTo({cx - ka, cy + b}, {cx - a, cy + kb}, {cx - a, cy});
    path.CubicTo({cx - a, cy - kb}, {cx - ka, cy - b}, {cx, cy - b});
    path.CubicTo({cx + ka, cy - b}, {cx + a, cy - kb}, {cx + a, cy});
    path.Close();
}

} // anonymous namespace

// =============================================================================
// RoiPath
// =============================================================================

void RoiPath::MoveTo(const Point2d& p) {
    PathSegment seg;
    seg.command = PathCommand::MoveTo;
    seg.p1 = p;
    segments_.push_back(seg);
}

void RoiPath::LineTo(const Point2d& p) {
    PathSegment seg;
    seg.command = PathCommand::LineTo;
    seg.p1 = p;
    segments_.push_back(seg);
}

void RoiPath::CubicTo(const Point2d& c1, const Point2d& c2, const Point2d& p) {
    PathSegment seg;
    seg.command = PathCommand::CubicTo;
    seg.p1 = c1;
    seg.p2 = c2;
    seg.p3 = p;
    segments_.push_back(seg);
}

void RoiPath::Close() {
    PathSegment seg;
    seg.command = PathCommand::Close;
    segments_.push_back(seg);
}

size_t RoiPath::NumSubpaths() const {
    return static_cast<size_t>(std::count_if(segments_.begin(), segments_.end(),
        [](const PathSegment& s) { return s.command == PathCommand::MoveTo; }));
}

RoiPath RoiPath::Scaled(double sx, double sy) const {
    RoiPath result(*this);
    if (sx == 1.0 && sy == 1.0) {
        return result;
    }
    for (auto& seg : result.segments_) {
        seg.p1 = ScalePoint(seg.p1, sx, sy);
        seg.p2 = ScalePoint(seg.p2, sx, sy);
        seg.p3 = ScalePoint(seg.p3, sx, sy);
    }
    return result;
}

RoiPath BuildPath(const QRoi& roi) {
    if (!roi.IsArea()) {
        throw UnsupportedException(std::string("BuildPath: ") + RoiKindName(roi.Kind()) +
                                   " ROI has no area path");
    }

    RoiPath path;
    if (roi.IsEmpty()) {
        return path;
    }

    switch (roi.Kind()) {
        case RoiKind::Rectangle: {
            const Rect2d& r = std::get<RectangleShape>(roi.Shape()).bounds;
            AppendRingPath(path, {{r.x, r.y}, {r.Right(), r.y},
                                  {r.Right(), r.Bottom()}, {r.x, r.Bottom()}});
            break;
        }
        case RoiKind::Ellipse:
            AppendEllipsePath(path, std::get<EllipseShape>(roi.Shape()).bounds);
            break;
        case RoiKind::Polygon:
            AppendRingPath(path, std::get<PolygonShape>(roi.Shape()).vertices);
            break;
        case RoiKind::Composite:
            for (const auto& ring : std::get<CompositeShape>(roi.Shape()).rings) {
                AppendRingPath(path, ring);
            }
            break;
        default:
            throw UnsupportedException(std::string("BuildPath: unexpected ROI kind ") +
                                       RoiKindName(roi.Kind()));
    }
    return path;
}

// =============================================================================
// Flattening
// =============================================================================

void FlattenCubic(const Point2d& p0, const Point2d& c1, const Point2d& c2, const Point2d& p3,
                  double flatness, std::vector<Point2d>& out) {
    // Iterative subdivision (stack), first half processed first
    std::vector<CubicWork> stack;
    stack.push_back(CubicWork{p0, c1, c2, p3, 0});

    while (!stack.empty()) {
        CubicWork w = stack.back();
        stack.pop_back();

        double d = std::max(PointSegmentDistance(w.c1, w.p0, w.p3),
                            PointSegmentDistance(w.c2, w.p0, w.p3));
        if (!(d > flatness) || w.depth >= MAX_CUBIC_DEPTH) {
            out.push_back(w.p3);
            continue;
        }

        // De Casteljau subdivision at t = 0.5
        Point2d p01 = (w.p0 + w.c1) * 0.5;
        Point2d p12 = (w.c1 + w.c2) * 0.5;
        Point2d p23 = (w.c2 + w.p3) * 0.5;
        Point2d p012 = (p01 + p12) * 0.5;
        Point2d p123 = (p12 + p23) * 0.5;
        Point2d mid = (p012 + p123) * 0.5;

        stack.push_back(CubicWork{mid, p123, p23, w.p3, w.depth + 1});
        stack.push_back(CubicWork{w.p0, p01, p012, mid, w.depth + 1});
    }
}

std::vector<FlatRing> FlattenPath(const RoiPath& path, double flatness) {
    Validate::RequirePositive(flatness, "flatness", "FlattenPath");

    std::vector<FlatRing> rings;
    Ring2d current;
    Point2d cursor;
    Point2d start;

    for (const auto& seg : path.Segments()) {
        switch (seg.command) {
            case PathCommand::MoveTo:
                FinishRing(current, rings);
                current.push_back(seg.p1);
                cursor = seg.p1;
                start = seg.p1;
                break;
            case PathCommand::LineTo:
                if (current.empty()) {
                    current.push_back(cursor);
                    start = cursor;
                }
                current.push_back(seg.p1);
                cursor = seg.p1;
                break;
            case PathCommand::CubicTo:
                if (current.empty()) {
                    current.push_back(cursor);
                    start = cursor;
                }
                FlattenCubic(cursor, seg.p1, seg.p2, seg.p3, flatness, current);
                cursor = seg.p3;
                break;
            case PathCommand::Close:
                FinishRing(current, rings);
                cursor = start;
                break;
        }
    }
    FinishRing(current, rings);
    return rings;
}

std::vector<FlatRing> FlattenAreaRoi(const QRoi& roi, double flatness, double sx, double sy) {
    return FlattenPath(BuildPath(roi).Scaled(sx, sy), flatness);
}

// =============================================================================
// Ring Utilities
// =============================================================================

double SignedArea(const Ring2d& ring) {
    if (ring.size() < 3) {
        return 0.0;
    }

    // Shoelace formula
    double area = 0.0;
    size_t n = ring.size();
    for (size_t i = 0; i < n; ++i) {
        size_t j = (i + 1) % n;
        area += ring[i].x * ring[j].y;
        area -= ring[j].x * ring[i].y;
    }
    return area * 0.5;
}

double RingPerimeter(const Ring2d& ring) {
    if (ring.size() < 2) {
        return 0.0;
    }
    return PolylineLength(ring) + ring.back().DistanceTo(ring.front());
}

double PolylineLength(const std::vector<Point2d>& points) {
    double length = 0.0;
    for (size_t i = 1; i < points.size(); ++i) {
        length += points[i - 1].DistanceTo(points[i]);
    }
    return length;
}

Ring2d RemoveDuplicateVertices(const Ring2d& ring) {
    Ring2d result;
    result.reserve(ring.size());
    for (const auto& p : ring) {
        if (result.empty() || result.back() != p) {
            result.push_back(p);
        }
    }
    while (result.size() > 1 && result.back() == result.front()) {
        result.pop_back();
    }
    return result;
}

} // namespace Patho::Roi::Internal
