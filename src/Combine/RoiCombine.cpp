#include <PathoRoi/Combine/RoiCombine.h>
#include <PathoRoi/Core/Exception.h>
#include <PathoRoi/Core/Validate.h>
#include <PathoRoi/Internal/TopologyBuilder.h>
#include <PathoRoi/Platform/Logging.h>

#include <string>
#include <utility>

namespace Patho::Roi {

namespace bg = boost::geometry;
using Internal::BgMultiPolygon;
using Internal::BuildResult;
using Internal::TopologyGeometry;

namespace {

void RequireArea(const QRoi& roi, const char* funcName) {
    if (!roi.IsArea()) {
        throw UnsupportedException(std::string(funcName) + ": " + RoiKindName(roi.Kind()) +
                                   " ROI cannot be combined, area ROI required");
    }
}

RoiResult Unchanged(const QRoi& roi) {
    RoiResult result;
    result.roi = roi;
    return result;
}

RoiResult EmptyResult(const ImagePlane& plane) {
    RoiResult result;
    result.roi = QRoi::Empty(plane);
    return result;
}

BgMultiPolygon Overlay(const BgMultiPolygon& a, const BgMultiPolygon& b, CombineOp op) {
    BgMultiPolygon out;
    switch (op) {
        case CombineOp::Union:               bg::union_(a, b, out); break;
        case CombineOp::Difference:          bg::difference(a, b, out); break;
        case CombineOp::Intersection:        bg::intersection(a, b, out); break;
        case CombineOp::SymmetricDifference: bg::sym_difference(a, b, out); break;
    }
    return out;
}

} // anonymous namespace

const char* CombineOpName(CombineOp op) {
    switch (op) {
        case CombineOp::Union:               return "Union";
        case CombineOp::Difference:          return "Difference";
        case CombineOp::Intersection:        return "Intersection";
        case CombineOp::SymmetricDifference: return "SymmetricDifference";
        default:                             return "Unknown";
    }
}

// =============================================================================
// Boolean Combination
// =============================================================================

RoiResult CombineRoisWithReport(const QRoi& a, const QRoi& b, CombineOp op,
                                const ConverterParams& params) {
    Validate::RequireSamePlane(a.Plane(), b.Plane(), "CombineRois");
    RequireArea(a, "CombineRois");
    RequireArea(b, "CombineRois");
    params.Validate();

    const ImagePlane& plane = a.Plane();
    bool aEmpty = a.IsEmpty();
    bool bEmpty = b.IsEmpty();
    if (aEmpty || bEmpty) {
        switch (op) {
            case CombineOp::Union:
            case CombineOp::SymmetricDifference:
                return aEmpty ? (bEmpty ? EmptyResult(plane) : Unchanged(b)) : Unchanged(a);
            case CombineOp::Difference:
                return aEmpty ? EmptyResult(plane) : Unchanged(a);
            case CombineOp::Intersection:
                return EmptyResult(plane);
        }
    }

    BuildResult ga = Internal::RoiToGeometry(a, params);
    BuildResult gb = Internal::RoiToGeometry(b, params);

    RoiResult result;
    result.report.Merge(ga.report);
    result.report.Merge(gb.report);

    BgMultiPolygon combined;
    try {
        combined = Overlay(ga.geometry.Polygons(), gb.geometry.Polygons(), op);
    } catch (const bg::exception& e) {
        throw Exception(std::string("CombineRois: ") + CombineOpName(op) + " failed: " + e.what());
    }

    TopologyGeometry geometry = Internal::FinishPolygons(std::move(combined), params,
                                                         result.report.IsApproximate());
    result.roi = Internal::GeometryToRoi(geometry, plane, params);
    return result;
}

QRoi CombineRois(const QRoi& a, const QRoi& b, CombineOp op, const ConverterParams& params) {
    return CombineRoisWithReport(a, b, op, params).roi;
}

QRoi UnionRois(const std::vector<QRoi>& rois, const ConverterParams& params) {
    if (rois.empty()) {
        return QRoi::Empty();
    }

    const ImagePlane& plane = rois.front().Plane();
    std::vector<BgMultiPolygon> pieces;
    bool approximate = false;
    for (const auto& roi : rois) {
        Validate::RequireSamePlane(plane, roi.Plane(), "UnionRois");
        RequireArea(roi, "UnionRois");
        BuildResult built = Internal::RoiToGeometry(roi, params);
        approximate = approximate || built.report.IsApproximate();
        pieces.push_back(built.geometry.Polygons());
    }

    BgMultiPolygon merged;
    try {
        merged = Internal::UnionAll(pieces);
    } catch (const bg::exception& e) {
        throw Exception(std::string("UnionRois: union failed: ") + e.what());
    }
    return Internal::GeometryToRoi(Internal::FinishPolygons(std::move(merged), params, approximate),
                                   plane, params);
}

// =============================================================================
// Expansion
// =============================================================================

QRoi ExpandRoi(const QRoi& roi, double radius, const ExpandParams& expandParams,
               const ConverterParams& params) {
    Validate::RequireFinite(radius, "radius", "ExpandRoi");
    Validate::RequireRange(expandParams.pointsPerCircle, 8, 3600, "pointsPerCircle", "ExpandRoi");
    if (expandParams.constrainTo) {
        Validate::RequireSamePlane(roi.Plane(), expandParams.constrainTo->Plane(), "ExpandRoi");
        RequireArea(*expandParams.constrainTo, "ExpandRoi");
    }

    const ImagePlane& plane = roi.Plane();
    if (roi.IsEmpty()) {
        return QRoi::Empty(plane);
    }

    BuildResult source = Internal::RoiToGeometry(roi, params);
    const TopologyGeometry& geometry = source.geometry;

    bg::strategy::buffer::distance_symmetric<double> distance(radius);
    bg::strategy::buffer::side_straight side;
    bg::strategy::buffer::join_round join(static_cast<std::size_t>(expandParams.pointsPerCircle));
    bg::strategy::buffer::end_round end(static_cast<std::size_t>(expandParams.pointsPerCircle));
    bg::strategy::buffer::point_circle circle(static_cast<std::size_t>(expandParams.pointsPerCircle));

    bool isErosion = radius < 0.0;
    BgMultiPolygon expanded;
    try {
        switch (geometry.Type()) {
            case Internal::GeometryType::Polygonal:
                bg::buffer(geometry.Polygons(), expanded, distance, side, join, end, circle);
                break;
            case Internal::GeometryType::Lineal:
                bg::buffer(geometry.Line(), expanded, distance, side, join, end, circle);
                break;
            case Internal::GeometryType::Puntal:
                bg::buffer(geometry.Points(), expanded, distance, side, join, end, circle);
                break;
            case Internal::GeometryType::Empty:
                return QRoi::Empty(plane);
        }

        if (expandParams.constrainTo && !isErosion) {
            BuildResult parent = Internal::RoiToGeometry(*expandParams.constrainTo, params);
            BgMultiPolygon clipped;
            bg::intersection(expanded, parent.geometry.Polygons(), clipped);
            expanded = std::move(clipped);
        }

        if (expandParams.removeInterior && geometry.IsPolygonal()) {
            BgMultiPolygon band;
            if (isErosion) {
                bg::difference(geometry.Polygons(), expanded, band);
            } else {
                bg::difference(expanded, geometry.Polygons(), band);
            }
            expanded = std::move(band);
        }
    } catch (const bg::exception& e) {
        throw Exception(std::string("ExpandRoi: buffer failed: ") + e.what());
    }

    QRoi result = Internal::GeometryToRoi(
        Internal::FinishPolygons(std::move(expanded), params, source.report.IsApproximate()),
        plane, params);
    if (result.IsEmpty()) {
        Logger()->debug("ExpandRoi: ROI is empty after {} expansion", radius);
    }
    return result;
}

} // namespace Patho::Roi
