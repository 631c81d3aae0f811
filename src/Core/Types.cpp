#include <PathoRoi/Core/Types.h>

#include <algorithm>

namespace Patho::Roi {

// =============================================================================
// Rect2d Implementation
// =============================================================================

Rect2d Rect2d::FromPoints(const std::vector<Point2d>& points) {
    if (points.empty()) {
        return Rect2d();
    }

    double minX = points[0].x, maxX = points[0].x;
    double minY = points[0].y, maxY = points[0].y;
    for (const auto& p : points) {
        minX = std::min(minX, p.x);
        maxX = std::max(maxX, p.x);
        minY = std::min(minY, p.y);
        maxY = std::max(maxY, p.y);
    }
    return Rect2d(minX, minY, maxX - minX, maxY - minY);
}

} // namespace Patho::Roi
