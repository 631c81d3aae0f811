#pragma once

/**
 * @file RoiComparator.h
 * @brief Deterministic total order over ROIs
 *
 * Order: bounds (x, y, width, height), then plane (z, t, c), then vertices
 * one by one (x, then y), then vertex count. ROIs with identical bounds,
 * plane and vertices compare equal whatever their kind.
 */

#include <PathoRoi/Core/Export.h>
#include <PathoRoi/Core/QRoi.h>

namespace Patho::Roi {

/**
 * @brief Compare two ROIs
 * @return -1 if a < b, 0 if equal, 1 if a > b
 */
PATHOROI_API int CompareRois(const QRoi& a, const QRoi& b);

/**
 * @brief Strict weak ordering functor for std::sort and ordered containers
 */
struct PATHOROI_API RoiLess {
    bool operator()(const QRoi& a, const QRoi& b) const {
        return CompareRois(a, b) < 0;
    }
};

} // namespace Patho::Roi
