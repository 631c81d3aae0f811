#pragma once

/**
 * @file Types.h
 * @brief Core type definitions for PathoRoi
 */

#include <PathoRoi/Core/Export.h>

#include <cmath>
#include <cstdint>
#include <vector>

namespace Patho::Roi {

// =============================================================================
// 2D Point Type
// =============================================================================

/**
 * @brief 2D point with sub-pixel precision
 */
struct PATHOROI_API Point2d {
    double x = 0.0;
    double y = 0.0;

    Point2d() = default;
    Point2d(double x_, double y_) : x(x_), y(y_) {}

    bool IsValid() const { return std::isfinite(x) && std::isfinite(y); }

    /// Vector addition
    Point2d operator+(const Point2d& other) const {
        return {x + other.x, y + other.y};
    }

    /// Vector subtraction
    Point2d operator-(const Point2d& other) const {
        return {x - other.x, y - other.y};
    }

    /// Scalar multiplication
    Point2d operator*(double s) const {
        return {x * s, y * s};
    }

    /// Exact coordinate equality
    bool operator==(const Point2d& other) const {
        return x == other.x && y == other.y;
    }

    bool operator!=(const Point2d& other) const {
        return !(*this == other);
    }

    /// Euclidean norm
    double Norm() const {
        return std::sqrt(x * x + y * y);
    }

    /// Dot product
    double Dot(const Point2d& other) const {
        return x * other.x + y * other.y;
    }

    /// Cross product (2D: returns scalar)
    double Cross(const Point2d& other) const {
        return x * other.y - y * other.x;
    }

    /// Distance to another point
    double DistanceTo(const Point2d& other) const {
        return (*this - other).Norm();
    }
};

/// Closed vertex loop; the last point connects implicitly back to the first
using Ring2d = std::vector<Point2d>;

// =============================================================================
// Rectangle Type
// =============================================================================

/**
 * @brief Axis-aligned rectangle with double precision
 */
struct PATHOROI_API Rect2d {
    double x = 0.0;
    double y = 0.0;
    double width = 0.0;
    double height = 0.0;

    Rect2d() = default;
    Rect2d(double x_, double y_, double w, double h)
        : x(x_), y(y_), width(w), height(h) {}

    double Right() const { return x + width; }
    double Bottom() const { return y + height; }
    double Area() const { return width * height; }
    Point2d Center() const { return {x + width / 2.0, y + height / 2.0}; }

    /// Length of the diagonal
    double Diameter() const { return std::sqrt(width * width + height * height); }

    bool IsValid() const {
        return std::isfinite(x) && std::isfinite(y) &&
               std::isfinite(width) && std::isfinite(height) &&
               width >= 0.0 && height >= 0.0;
    }

    bool Contains(double px, double py) const {
        return px >= x && px <= Right() && py >= y && py <= Bottom();
    }

    /// Smallest rectangle covering a point set (empty rectangle for no points)
    static Rect2d FromPoints(const std::vector<Point2d>& points);
};

// =============================================================================
// Image Plane
// =============================================================================

/**
 * @brief Plane of a multi-dimensional image a ROI belongs to
 *
 * A channel of -1 means the ROI applies to all channels.
 */
struct PATHOROI_API ImagePlane {
    int32_t z = 0;      ///< Z-slice index
    int32_t t = 0;      ///< Time point index
    int32_t c = -1;     ///< Channel index (-1 = all channels)

    ImagePlane() = default;
    ImagePlane(int32_t z_, int32_t t_, int32_t c_ = -1) : z(z_), t(t_), c(c_) {}

    /// Default plane: z = 0, t = 0, all channels
    static ImagePlane Default() { return ImagePlane(); }

    /// Plane for all channels at (z, t)
    static ImagePlane Make(int32_t z, int32_t t) { return ImagePlane(z, t, -1); }

    /// Plane for a single channel at (z, t)
    static ImagePlane WithChannel(int32_t c, int32_t z, int32_t t) { return ImagePlane(z, t, c); }

    bool operator==(const ImagePlane& other) const {
        return z == other.z && t == other.t && c == other.c;
    }

    bool operator!=(const ImagePlane& other) const {
        return !(*this == other);
    }
};

} // namespace Patho::Roi
