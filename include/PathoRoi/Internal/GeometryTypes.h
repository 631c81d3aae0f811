#pragma once

/**
 * @file GeometryTypes.h
 * @brief Boost.Geometry models used by the topology engine
 *
 * Polygons are closed and counter-clockwise: outer rings have positive
 * shoelace area, holes negative. With image coordinates (y down) the ring
 * (x,y) -> (x+w,y) -> (x+w,y+h) -> (x,y+h) is an outer ring.
 */

#include <PathoRoi/Core/Types.h>

#include <boost/geometry.hpp>
#include <boost/geometry/geometries/box.hpp>
#include <boost/geometry/geometries/linestring.hpp>
#include <boost/geometry/geometries/multi_point.hpp>
#include <boost/geometry/geometries/multi_polygon.hpp>
#include <boost/geometry/geometries/point_xy.hpp>
#include <boost/geometry/geometries/polygon.hpp>
#include <boost/geometry/geometries/ring.hpp>

#include <string>
#include <vector>

namespace Patho::Roi::Internal {

namespace bg = boost::geometry;

using BgPoint = bg::model::d2::point_xy<double>;
using BgRing = bg::model::ring<BgPoint, false, true>;
using BgPolygon = bg::model::polygon<BgPoint, false, true>;
using BgMultiPolygon = bg::model::multi_polygon<BgPolygon>;
using BgLineString = bg::model::linestring<BgPoint>;
using BgMultiPoint = bg::model::multi_point<BgPoint>;
using BgBox = bg::model::box<BgPoint>;

// =============================================================================
// Conversion Helpers
// =============================================================================

inline BgPoint ToBgPoint(const Point2d& p) {
    return BgPoint(p.x, p.y);
}

inline Point2d ToPoint2d(const BgPoint& p) {
    return {p.x(), p.y()};
}

/// Closed Boost ring from an implicit-closing vertex list
BgRing ToBgRing(const Ring2d& ring);

/// Vertex list without the closing point
Ring2d ToRing2d(const BgRing& ring);

/// Polygon with the given outer ring and no holes
BgPolygon ToBgPolygon(const Ring2d& outer);

/**
 * @brief Check polygon validity
 *
 * @param reason Receives the Boost validity message when invalid (may be null)
 */
bool IsPolygonValid(const BgPolygon& polygon, std::string* reason = nullptr);

/// Union of all pieces (returned unchanged for a single piece)
BgMultiPolygon UnionAll(const std::vector<BgMultiPolygon>& pieces);

/**
 * @brief Remove duplicate and exactly collinear vertices
 *
 * Zero-tolerance simplification: no vertex is moved. Rings left with fewer
 * than 3 vertices are removed; a polygon losing its outer ring is removed.
 * Unless keepRingStart is set, every ring is rotated to start at its lowest
 * vertex (smallest x, then smallest y) with its orientation unchanged, and
 * polygons and holes are sorted by that vertex, so overlay output has one
 * canonical vertex order.
 */
BgMultiPolygon CanonicalizePolygons(const BgMultiPolygon& polygons, bool keepRingStart = false);

/// Round all coordinates to a grid of 1/scale
Point2d RoundToGrid(const Point2d& p, double scale);

void RoundToGrid(BgMultiPolygon& polygons, double scale);

} // namespace Patho::Roi::Internal
