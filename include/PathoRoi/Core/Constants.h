#pragma once

/**
 * @file Constants.h
 * @brief Mathematical and numeric constants for PathoRoi
 */

#include <cstdint>

namespace Patho::Roi {

constexpr double PI = 3.14159265358979323846;

/// Generic floating point tolerance
constexpr double EPSILON = 1e-12;

/// Control point distance for a cubic Bezier quarter ellipse: 4/3 * (sqrt(2) - 1)
constexpr double BEZIER_ELLIPSE_KAPPA = 0.5522847498307936;

/// Default curve flattening tolerance (maximum deviation in pixels)
constexpr double DEFAULT_FLATNESS = 0.5;

/// Default relative area change accepted for a self-intersection repair (0.01 %)
constexpr double DEFAULT_REPAIR_AREA_TOLERANCE = 1e-4;

/// Snap tolerance relative to a ring's bounding diameter
constexpr double DEFAULT_SNAP_PRECISION_FACTOR = 1e-9;

/// Segments used per full circle when expanding ROIs
constexpr int32_t DEFAULT_BUFFER_POINTS_PER_CIRCLE = 72;

/// Clamp value to [lo, hi]
template<typename T>
constexpr T Clamp(T value, T lo, T hi) {
    return value < lo ? lo : (value > hi ? hi : value);
}

} // namespace Patho::Roi
