/**
 * @file TopologyBuilder.cpp
 * @brief Implementation of topology building and ROI <-> geometry conversion
 */

#include <PathoRoi/Internal/TopologyBuilder.h>
#include <PathoRoi/Core/Exception.h>
#include <PathoRoi/Internal/RingRepair.h>
#include <PathoRoi/Platform/Logging.h>

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

namespace Patho::Roi::Internal {

namespace {

Point2d ScaleIn(const Point2d& p, const ConverterParams& params) {
    Point2d q(p.x * params.pixelWidth, p.y * params.pixelHeight);
    return params.IsFixedPrecision() ? RoundToGrid(q, params.precisionScale) : q;
}

Point2d ScaleOut(const BgPoint& p, const ConverterParams& params) {
    return {p.x() / params.pixelWidth, p.y() / params.pixelHeight};
}

Ring2d ScaleOut(const BgRing& ring, const ConverterParams& params) {
    Ring2d result;
    for (const auto& p : ToRing2d(ring)) {
        result.emplace_back(p.x / params.pixelWidth, p.y / params.pixelHeight);
    }
    return result;
}

// Snap flattened rings to the fixed precision grid
std::vector<FlatRing> ApplyPrecision(const std::vector<FlatRing>& rings, double scale) {
    std::vector<FlatRing> result;
    result.reserve(rings.size());
    for (const auto& ring : rings) {
        Ring2d points;
        points.reserve(ring.points.size());
        for (const auto& p : ring.points) {
            points.push_back(RoundToGrid(p, scale));
        }
        points = RemoveDuplicateVertices(points);
        if (points.size() < 3) {
            continue;
        }
        FlatRing flat;
        flat.signedArea = SignedArea(points);
        flat.points = std::move(points);
        result.push_back(std::move(flat));
    }
    return result;
}

} // anonymous namespace

// =============================================================================
// TopologyGeometry
// =============================================================================

TopologyGeometry TopologyGeometry::FromPolygons(BgMultiPolygon polygons, bool repairedApproximate) {
    TopologyGeometry geometry;
    if (polygons.empty()) {
        geometry.repairedApproximate_ = repairedApproximate;
        return geometry;
    }
    geometry.type_ = GeometryType::Polygonal;
    geometry.polygons_ = std::move(polygons);
    geometry.repairedApproximate_ = repairedApproximate;
    return geometry;
}

TopologyGeometry TopologyGeometry::FromLine(BgLineString line) {
    TopologyGeometry geometry;
    if (!line.empty()) {
        geometry.type_ = GeometryType::Lineal;
        geometry.line_ = std::move(line);
    }
    return geometry;
}

TopologyGeometry TopologyGeometry::FromPoints(BgMultiPoint points) {
    TopologyGeometry geometry;
    if (!points.empty()) {
        geometry.type_ = GeometryType::Puntal;
        geometry.points_ = std::move(points);
    }
    return geometry;
}

double TopologyGeometry::Area() const {
    return IsPolygonal() ? bg::area(polygons_) : 0.0;
}

double TopologyGeometry::Length() const {
    switch (type_) {
        case GeometryType::Polygonal: return bg::perimeter(polygons_);
        case GeometryType::Lineal:    return bg::length(line_);
        default:                      return 0.0;
    }
}

size_t TopologyGeometry::NumPoints() const {
    switch (type_) {
        case GeometryType::Polygonal: {
            size_t count = 0;
            for (const auto& ring : Rings()) {
                count += ring.points.size();
            }
            return count;
        }
        case GeometryType::Lineal: return line_.size();
        case GeometryType::Puntal: return points_.size();
        default:                   return 0;
    }
}

size_t TopologyGeometry::NumRings() const {
    size_t count = 0;
    for (const auto& polygon : polygons_) {
        count += 1 + polygon.inners().size();
    }
    return count;
}

Point2d TopologyGeometry::Centroid() const {
    if (IsPolygonal() && Area() > 0.0) {
        BgPoint c;
        bg::centroid(polygons_, c);
        return ToPoint2d(c);
    }

    std::vector<BgPoint> vertices;
    if (IsLineal()) {
        vertices.assign(line_.begin(), line_.end());
    } else if (IsPuntal()) {
        vertices.assign(points_.begin(), points_.end());
    } else {
        for (const auto& ring : Rings()) {
            for (const auto& p : ring.points) {
                vertices.push_back(ToBgPoint(p));
            }
        }
    }
    if (vertices.empty()) {
        return {0.0, 0.0};
    }
    double sumX = 0.0, sumY = 0.0;
    for (const auto& p : vertices) {
        sumX += p.x();
        sumY += p.y();
    }
    double n = static_cast<double>(vertices.size());
    return {sumX / n, sumY / n};
}

Rect2d TopologyGeometry::BoundingBox() const {
    BgBox box;
    switch (type_) {
        case GeometryType::Polygonal: bg::envelope(polygons_, box); break;
        case GeometryType::Lineal:    bg::envelope(line_, box); break;
        case GeometryType::Puntal:    bg::envelope(points_, box); break;
        default:                      return Rect2d();
    }
    return Rect2d(box.min_corner().x(), box.min_corner().y(),
                  box.max_corner().x() - box.min_corner().x(),
                  box.max_corner().y() - box.min_corner().y());
}

bool TopologyGeometry::IsValid(std::string* reason) const {
    std::string message;
    bool valid = true;
    switch (type_) {
        case GeometryType::Polygonal: valid = bg::is_valid(polygons_, message); break;
        case GeometryType::Lineal:    valid = bg::is_valid(line_, message); break;
        case GeometryType::Puntal:    valid = bg::is_valid(points_, message); break;
        default:                      break;
    }
    if (!valid && reason != nullptr) {
        *reason = message;
    }
    return valid;
}

std::vector<FlatRing> TopologyGeometry::Rings() const {
    std::vector<FlatRing> rings;
    auto addRing = [&rings](const BgRing& ring) {
        FlatRing flat;
        flat.points = ToRing2d(ring);
        flat.signedArea = SignedArea(flat.points);
        rings.push_back(std::move(flat));
    };
    for (const auto& polygon : polygons_) {
        addRing(polygon.outer());
        for (const auto& hole : polygon.inners()) {
            addRing(hole);
        }
    }
    return rings;
}

// =============================================================================
// Builder
// =============================================================================

BuildResult BuildTopology(const std::vector<FlatRing>& rings, const ConverterParams& params) {
    BuildResult result;
    std::vector<BgMultiPolygon> positive;
    std::vector<BgMultiPolygon> negative;
    double areaCached = 0.0;

    for (size_t i = 0; i < rings.size(); ++i) {
        const FlatRing& ring = rings[i];
        double signedArea = SignedArea(ring.points);
        areaCached += signedArea;
        if (signedArea == 0.0) {
            continue;  // empty ring
        }

        Ring2d oriented = ring.points;
        if (signedArea < 0.0) {
            std::reverse(oriented.begin(), oriented.end());
        }

        BgMultiPolygon piece;
        BgPolygon polygon = ToBgPolygon(oriented);
        std::string reason;
        if (IsPolygonValid(polygon, &reason)) {
            piece.push_back(std::move(polygon));
        } else {
            Logger()->debug("Invalid ring {} detected, attempting to correct: {}", i, reason);
            RingRepairResult repaired = RepairRing(oriented, params);

            RingRepairInfo info;
            info.ringIndex = i;
            info.areaBefore = repaired.areaBefore;
            info.areaAfter = repaired.areaAfter;
            info.snapTolerance = repaired.snapTolerance;
            info.reason = reason;
            info.approximate = repaired.approximate;
            result.report.AddRepair(info);

            if (repaired.approximate) {
                Logger()->warn("Unable to fix ring {} safely (area before: {}, area after: {}), "
                               "proceeding with the repaired ring", i, info.areaBefore, info.areaAfter);
            } else {
                Logger()->debug("Ring {} fix looks ok (area before: {}, area after: {})",
                                i, info.areaBefore, info.areaAfter);
            }
            piece = std::move(repaired.polygons);
        }

        if (signedArea < 0.0) {
            negative.push_back(std::move(piece));
        } else {
            positive.push_back(std::move(piece));
        }
    }

    // The aggregate sign decides which orientation describes outer rings
    const std::vector<BgMultiPolygon>* outer = nullptr;
    const std::vector<BgMultiPolygon>* holes = nullptr;
    if (areaCached < 0.0) {
        outer = &negative;
        holes = &positive;
    } else if (areaCached > 0.0) {
        outer = &positive;
        holes = &negative;
    } else {
        result.geometry = TopologyGeometry::FromPolygons({}, result.report.IsApproximate());
        return result;
    }

    // A single valid ring skips the overlays and keeps its vertex order
    bool singleRing = outer->size() == 1 && outer->front().size() == 1 && holes->empty() &&
                      !result.report.IsRepaired();

    BgMultiPolygon geometry = UnionAll(*outer);
    if (!holes->empty()) {
        BgMultiPolygon cut;
        bg::difference(geometry, UnionAll(*holes), cut);
        geometry = std::move(cut);
    }

    result.geometry = FinishPolygons(std::move(geometry), params, result.report.IsApproximate(),
                                     singleRing);
    result.clockwiseInput = singleRing && areaCached < 0.0;
    return result;
}

BuildResult RebuildTopology(const TopologyGeometry& geometry, const ConverterParams& params) {
    if (!geometry.IsPolygonal()) {
        BuildResult result;
        result.geometry = geometry;
        return result;
    }
    return BuildTopology(geometry.Rings(), params);
}

TopologyGeometry FinishPolygons(BgMultiPolygon polygons, const ConverterParams& params,
                                bool repairedApproximate, bool keepRingStart) {
    if (params.IsFixedPrecision()) {
        RoundToGrid(polygons, params.precisionScale);
    }
    return TopologyGeometry::FromPolygons(CanonicalizePolygons(polygons, keepRingStart),
                                          repairedApproximate);
}

// =============================================================================
// ROI Conversion
// =============================================================================

BuildResult RoiToGeometry(const QRoi& roi, const ConverterParams& params) {
    params.Validate();

    BuildResult result;
    if (roi.IsEmpty()) {
        return result;
    }

    switch (roi.Kind()) {
        case RoiKind::Rectangle:
        case RoiKind::Ellipse:
        case RoiKind::Polygon:
        case RoiKind::Composite: {
            std::vector<FlatRing> rings = FlattenAreaRoi(roi, params.flatness,
                                                         params.pixelWidth, params.pixelHeight);
            if (params.IsFixedPrecision()) {
                rings = ApplyPrecision(rings, params.precisionScale);
            }
            return BuildTopology(rings, params);
        }
        case RoiKind::Line:
        case RoiKind::Polyline: {
            BgLineString line;
            for (const auto& p : roi.PolygonPoints()) {
                line.push_back(ToBgPoint(ScaleIn(p, params)));
            }
            result.geometry = TopologyGeometry::FromLine(std::move(line));
            return result;
        }
        case RoiKind::Points: {
            BgMultiPoint points;
            for (const auto& p : roi.PolygonPoints()) {
                points.push_back(ToBgPoint(ScaleIn(p, params)));
            }
            result.geometry = TopologyGeometry::FromPoints(std::move(points));
            return result;
        }
    }
    throw UnsupportedException("RoiToGeometry: unknown ROI kind " +
                               std::to_string(static_cast<int>(roi.Kind())));
}

QRoi GeometryToRoi(const TopologyGeometry& geometry, const ImagePlane& plane,
                   const ConverterParams& params, bool clockwise) {
    switch (geometry.Type()) {
        case GeometryType::Empty:
            return QRoi::Empty(plane);

        case GeometryType::Puntal: {
            std::vector<Point2d> points;
            for (const auto& p : geometry.Points()) {
                points.push_back(ScaleOut(p, params));
            }
            return QRoi::Points(points, plane);
        }

        case GeometryType::Lineal: {
            std::vector<Point2d> points;
            for (const auto& p : geometry.Line()) {
                points.push_back(ScaleOut(p, params));
            }
            if (points.size() == 2) {
                return QRoi::Line(points[0].x, points[0].y, points[1].x, points[1].y, plane);
            }
            return QRoi::Polyline(points, plane);
        }

        case GeometryType::Polygonal: {
            const BgMultiPolygon& polygons = geometry.Polygons();
            if (polygons.size() == 1 && polygons[0].inners().empty()) {
                Ring2d outer = ScaleOut(polygons[0].outer(), params);
                if (clockwise) {
                    std::reverse(outer.begin(), outer.end());
                }
                return QRoi::Polygon(outer, plane);
            }
            std::vector<Ring2d> rings;
            for (const auto& polygon : polygons) {
                rings.push_back(ScaleOut(polygon.outer(), params));
                for (const auto& hole : polygon.inners()) {
                    rings.push_back(ScaleOut(hole, params));
                }
            }
            return QRoi::Composite(rings, plane);
        }
    }
    throw UnsupportedException("GeometryToRoi: unknown geometry type");
}

} // namespace Patho::Roi::Internal
