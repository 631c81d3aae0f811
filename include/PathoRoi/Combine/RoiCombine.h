#pragma once

/**
 * @file RoiCombine.h
 * @brief Boolean combination and expansion of ROIs
 *
 * Both operands are converted to validated geometry, combined, and the
 * result converted back to a ROI on the operands' plane. Empty operands
 * follow plain set algebra:
 * - Union(empty, B) = B
 * - Difference(empty, B) = empty, Difference(A, empty) = A
 * - Intersection(empty, B) = empty
 * An empty result is returned as QRoi::Empty(plane), never as an error.
 */

#include <PathoRoi/Convert/RoiConvert.h>
#include <PathoRoi/Core/Constants.h>
#include <PathoRoi/Core/ConverterParams.h>
#include <PathoRoi/Core/Export.h>
#include <PathoRoi/Core/QRoi.h>

#include <cstdint>
#include <optional>
#include <vector>

namespace Patho::Roi {

// =============================================================================
// Boolean Combination
// =============================================================================

enum class CombineOp : uint8_t {
    Union,
    Difference,             ///< First minus second
    Intersection,
    SymmetricDifference
};

PATHOROI_API const char* CombineOpName(CombineOp op);

/**
 * @brief Combine two area ROIs
 *
 * @throws InvalidArgumentException if the ROIs lie on different planes
 * @throws UnsupportedException if either ROI is not an area
 */
PATHOROI_API RoiResult CombineRoisWithReport(const QRoi& a, const QRoi& b, CombineOp op,
                                             const ConverterParams& params = DefaultConverterParams());

/// CombineRoisWithReport without diagnostics
PATHOROI_API QRoi CombineRois(const QRoi& a, const QRoi& b, CombineOp op,
                              const ConverterParams& params = DefaultConverterParams());

/**
 * @brief Union of any number of area ROIs on one plane
 *
 * An empty list yields the empty ROI on the default plane.
 */
PATHOROI_API QRoi UnionRois(const std::vector<QRoi>& rois,
                            const ConverterParams& params = DefaultConverterParams());

// =============================================================================
// Expansion
// =============================================================================

/**
 * @brief Parameters for ROI expansion
 */
struct PATHOROI_API ExpandParams {
    bool removeInterior = false;            ///< Keep only the added (or removed) band
    std::optional<QRoi> constrainTo;        ///< Clip a grown ROI to this area ROI
    int32_t pointsPerCircle = DEFAULT_BUFFER_POINTS_PER_CIRCLE; ///< Round join resolution

    ExpandParams& SetRemoveInterior(bool r) { removeInterior = r; return *this; }
    ExpandParams& SetConstrainTo(const QRoi& roi) { constrainTo = roi; return *this; }
    ExpandParams& SetPointsPerCircle(int32_t n) { pointsPerCircle = n; return *this; }
};

/**
 * @brief Grow (radius > 0) or shrink (radius < 0) a ROI
 *
 * The radius is measured after pixel scaling (pixelWidth/pixelHeight), so
 * with the default parameters it is in pixels.
 * Uses round joins and ends, so points and lines expand to areas. The
 * constraint applies to growth only. With removeInterior, growth returns
 * the band around the original and shrinking returns the removed band.
 *
 * @throws InvalidArgumentException for non-finite radius, fewer than 8 points
 *         per circle, or a constraint on another plane
 * @throws UnsupportedException if the constraint is not an area ROI
 */
PATHOROI_API QRoi ExpandRoi(const QRoi& roi, double radius,
                            const ExpandParams& expandParams = ExpandParams(),
                            const ConverterParams& params = DefaultConverterParams());

} // namespace Patho::Roi
