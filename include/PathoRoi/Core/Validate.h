#pragma once

/**
 * @file Validate.h
 * @brief Unified validation utilities for PathoRoi
 *
 * Design principles:
 * - Degenerate geometry returns an empty result (not an error)
 * - Contract violations (bad parameters, mismatched planes, wrong ROI kind) throw
 * - Consistent error message format: "<Function>: <param> must be ..., got <v>"
 */

#include <PathoRoi/Core/Exception.h>
#include <PathoRoi/Core/Types.h>

#include <cmath>
#include <cstdio>
#include <string>

namespace Patho::Roi::Validate {

// =============================================================================
// Internal Formatting
// =============================================================================

namespace Detail {

// Format double with limited precision (avoid long tails)
inline std::string FormatValue(double val) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.4g", val);
    return buf;
}

inline std::string FormatValue(int val) {
    return std::to_string(val);
}

inline std::string FormatValue(int64_t val) {
    return std::to_string(val);
}

inline std::string FormatValue(size_t val) {
    return std::to_string(val);
}

inline std::string FormatPlane(const ImagePlane& plane) {
    return "(z=" + std::to_string(plane.z) + ", t=" + std::to_string(plane.t) +
           ", c=" + std::to_string(plane.c) + ")";
}

} // namespace Detail

// =============================================================================
// Value Validation
// =============================================================================

/**
 * @brief Validate value is finite (not NaN or infinite)
 */
inline void RequireFinite(double value, const char* paramName, const char* funcName) {
    if (!std::isfinite(value)) {
        throw InvalidArgumentException(
            std::string(funcName) + ": " + paramName + " must be finite, got " +
            Detail::FormatValue(value));
    }
}

/**
 * @brief Validate value is in range [min, max]
 */
template<typename T>
inline void RequireRange(T value, T minVal, T maxVal,
                         const char* paramName, const char* funcName) {
    if (value < minVal || value > maxVal) {
        throw InvalidArgumentException(
            std::string(funcName) + ": " + paramName + " must be in [" +
            Detail::FormatValue(minVal) + ", " + Detail::FormatValue(maxVal) +
            "], got " + Detail::FormatValue(value));
    }
}

/**
 * @brief Validate value is positive (> 0)
 */
template<typename T>
inline void RequirePositive(T value, const char* paramName, const char* funcName) {
    if (!(value > T(0))) {
        throw InvalidArgumentException(
            std::string(funcName) + ": " + paramName + " must be > 0, got " +
            Detail::FormatValue(value));
    }
}

/**
 * @brief Validate value is non-negative (>= 0)
 */
template<typename T>
inline void RequireNonNegative(T value, const char* paramName, const char* funcName) {
    if (!(value >= T(0))) {
        throw InvalidArgumentException(
            std::string(funcName) + ": " + paramName + " must be >= 0, got " +
            Detail::FormatValue(value));
    }
}

// =============================================================================
// Geometry Validation
// =============================================================================

/**
 * @brief Validate that every point has finite coordinates
 */
inline void RequireFinitePoints(const std::vector<Point2d>& points, const char* funcName) {
    for (size_t i = 0; i < points.size(); ++i) {
        if (!points[i].IsValid()) {
            throw InvalidArgumentException(
                std::string(funcName) + ": point " + Detail::FormatValue(i) +
                " has non-finite coordinates");
        }
    }
}

/**
 * @brief Validate two ROIs live on the same image plane
 *
 * @throws InvalidArgumentException on mismatch
 */
inline void RequireSamePlane(const ImagePlane& a, const ImagePlane& b, const char* funcName) {
    if (a != b) {
        throw InvalidArgumentException(
            std::string(funcName) + ": ROIs are on different planes " +
            Detail::FormatPlane(a) + " and " + Detail::FormatPlane(b));
    }
}

} // namespace Patho::Roi::Validate
