#include <PathoRoi/Convert/RoiConvert.h>
#include <PathoRoi/Core/Exception.h>
#include <PathoRoi/Core/Validate.h>
#include <PathoRoi/Internal/TopologyBuilder.h>
#include <PathoRoi/Platform/Logging.h>

#include <exception>

namespace Patho::Roi {

namespace {

void RequireFiniteRoi(const QRoi& roi, const char* funcName) {
    if (roi.Kind() == RoiKind::Rectangle || roi.Kind() == RoiKind::Ellipse) {
        const Rect2d& r = roi.Kind() == RoiKind::Rectangle
            ? std::get<RectangleShape>(roi.Shape()).bounds
            : std::get<EllipseShape>(roi.Shape()).bounds;
        Validate::RequireFinite(r.x, "x", funcName);
        Validate::RequireFinite(r.y, "y", funcName);
        Validate::RequireFinite(r.width, "width", funcName);
        Validate::RequireFinite(r.height, "height", funcName);
        return;
    }
    Validate::RequireFinitePoints(roi.PolygonPoints(), funcName);
}

} // anonymous namespace

RoiResult NormalizeRoi(const QRoi& roi, const ConverterParams& params) {
    RequireFiniteRoi(roi, "NormalizeRoi");

    Internal::BuildResult built = Internal::RoiToGeometry(roi, params);
    RoiResult result;
    result.roi = Internal::GeometryToRoi(built.geometry, roi.Plane(), params, built.clockwiseInput);
    result.report = std::move(built.report);
    return result;
}

std::vector<RoiResult> NormalizeRois(const std::vector<QRoi>& rois, const ConverterParams& params) {
    params.Validate();

    std::vector<RoiResult> results;
    results.reserve(rois.size());
    for (size_t i = 0; i < rois.size(); ++i) {
        try {
            results.push_back(NormalizeRoi(rois[i], params));
        } catch (const std::exception& e) {
            Logger()->error("NormalizeRois: ROI {} ({}) rejected: {}", i,
                            RoiKindName(rois[i].Kind()), e.what());
            RoiResult failed;
            failed.roi = QRoi::Empty(rois[i].Plane());
            failed.report.quality = RepairQuality::Failed;
            failed.report.message = e.what();
            results.push_back(std::move(failed));
        }
    }
    return results;
}

bool IsRoiTopologyValid(const QRoi& roi, std::string* reason, const ConverterParams& params) {
    RequireFiniteRoi(roi, "IsRoiTopologyValid");

    Internal::BuildResult built = Internal::RoiToGeometry(roi, params);
    if (built.report.IsRepaired()) {
        if (reason != nullptr) {
            *reason = built.report.repairs.front().reason;
        }
        return false;
    }
    return built.geometry.IsValid(reason);
}

} // namespace Patho::Roi
