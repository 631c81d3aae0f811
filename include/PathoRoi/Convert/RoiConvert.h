#pragma once

/**
 * @file RoiConvert.h
 * @brief ROI normalization through the topology engine
 *
 * Normalizing a ROI converts it to validated geometry and back. Area ROIs
 * come back as Polygon (one ring) or Composite (several polygons or holes),
 * lines as Line/Polyline, point sets as Points. Degenerate input yields the
 * explicitly empty ROI, never an exception.
 *
 * Example:
 * @code
 * QRoi roi = QRoi::Ellipse(50, 0, 500, 300);
 * RoiResult normalized = NormalizeRoi(roi);
 * if (normalized.report.IsApproximate()) {
 *     // area changed during self-intersection repair
 * }
 * @endcode
 */

#include <PathoRoi/Core/ConverterParams.h>
#include <PathoRoi/Core/Export.h>
#include <PathoRoi/Core/QRoi.h>

#include <string>
#include <vector>

namespace Patho::Roi {

/**
 * @brief ROI together with the diagnostics of its conversion
 */
struct PATHOROI_API RoiResult {
    QRoi roi;
    ConversionReport report;
};

/**
 * @brief Convert a ROI to validated geometry and back
 *
 * @throws InvalidArgumentException for invalid params or non-finite coordinates
 * @throws UnsupportedException for unknown ROI kinds
 */
PATHOROI_API RoiResult NormalizeRoi(const QRoi& roi,
                                    const ConverterParams& params = DefaultConverterParams());

/**
 * @brief Normalize a batch of ROIs
 *
 * A ROI rejected by a contract violation yields the empty ROI (on its own
 * plane) with quality Failed; the other ROIs are unaffected.
 */
PATHOROI_API std::vector<RoiResult> NormalizeRois(const std::vector<QRoi>& rois,
                                                  const ConverterParams& params = DefaultConverterParams());

/**
 * @brief Check whether the ROI converts to valid geometry without repair
 *
 * @param reason Receives the first problem found (may be null)
 */
PATHOROI_API bool IsRoiTopologyValid(const QRoi& roi, std::string* reason = nullptr,
                                     const ConverterParams& params = DefaultConverterParams());

} // namespace Patho::Roi
