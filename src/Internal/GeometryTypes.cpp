/**
 * @file GeometryTypes.cpp
 * @brief Boost.Geometry conversion and canonicalization helpers
 */

#include <PathoRoi/Internal/GeometryTypes.h>
#include <PathoRoi/Internal/PathFlatten.h>

#include <algorithm>
#include <cmath>
#include <utility>

namespace Patho::Roi::Internal {

namespace {

// Repeatedly drop vertices whose neighbours make an exactly straight (or
// doubled back) corner
Ring2d RemoveCollinearVertices(const Ring2d& input) {
    Ring2d ring = RemoveDuplicateVertices(input);
    bool changed = true;
    while (changed && ring.size() >= 3) {
        changed = false;
        size_t i = 0;
        while (i < ring.size() && ring.size() >= 3) {
            size_t n = ring.size();
            const Point2d& prev = ring[(i + n - 1) % n];
            const Point2d& cur = ring[i];
            const Point2d& next = ring[(i + 1) % n];
            if ((cur - prev).Cross(next - cur) == 0.0) {
                ring.erase(ring.begin() + static_cast<std::ptrdiff_t>(i));
                changed = true;
            } else {
                ++i;
            }
        }
    }
    return ring;
}

bool LowerVertex(const Point2d& a, const Point2d& b) {
    return a.x < b.x || (a.x == b.x && a.y < b.y);
}

// Start the ring at its lowest vertex
void RotateToLowestVertex(Ring2d& ring) {
    std::rotate(ring.begin(), std::min_element(ring.begin(), ring.end(), LowerVertex), ring.end());
}

// Order rings by their start vertex
bool LowerRing(const BgRing& a, const BgRing& b) {
    return LowerVertex(ToPoint2d(a.front()), ToPoint2d(b.front()));
}

} // anonymous namespace

BgRing ToBgRing(const Ring2d& ring) {
    BgRing result;
    result.reserve(ring.size() + 1);
    for (const auto& p : ring) {
        result.push_back(ToBgPoint(p));
    }
    if (!ring.empty() && ring.front() != ring.back()) {
        result.push_back(ToBgPoint(ring.front()));
    }
    return result;
}

Ring2d ToRing2d(const BgRing& ring) {
    Ring2d result;
    result.reserve(ring.size());
    for (const auto& p : ring) {
        result.push_back(ToPoint2d(p));
    }
    if (result.size() > 1 && result.front() == result.back()) {
        result.pop_back();
    }
    return result;
}

BgPolygon ToBgPolygon(const Ring2d& outer) {
    BgPolygon polygon;
    polygon.outer() = ToBgRing(outer);
    return polygon;
}

bool IsPolygonValid(const BgPolygon& polygon, std::string* reason) {
    std::string message;
    bool valid = bg::is_valid(polygon, message);
    if (!valid && reason != nullptr) {
        *reason = message;
    }
    return valid;
}

BgMultiPolygon UnionAll(const std::vector<BgMultiPolygon>& pieces) {
    BgMultiPolygon acc;
    bool first = true;
    for (const auto& piece : pieces) {
        if (piece.empty()) {
            continue;
        }
        if (first) {
            acc = piece;
            first = false;
            continue;
        }
        BgMultiPolygon merged;
        bg::union_(acc, piece, merged);
        acc = std::move(merged);
    }
    return acc;
}

BgMultiPolygon CanonicalizePolygons(const BgMultiPolygon& polygons, bool keepRingStart) {
    auto clean = [keepRingStart](const BgRing& input) {
        Ring2d ring = RemoveCollinearVertices(ToRing2d(input));
        if (!keepRingStart && !ring.empty()) {
            RotateToLowestVertex(ring);
        }
        return ring;
    };

    BgMultiPolygon result;
    for (const auto& polygon : polygons) {
        Ring2d outer = clean(polygon.outer());
        if (outer.size() < 3) {
            continue;
        }
        BgPolygon cleaned;
        cleaned.outer() = ToBgRing(outer);
        for (const auto& hole : polygon.inners()) {
            Ring2d ring = clean(hole);
            if (ring.size() >= 3) {
                cleaned.inners().push_back(ToBgRing(ring));
            }
        }
        if (!keepRingStart) {
            std::sort(cleaned.inners().begin(), cleaned.inners().end(), LowerRing);
        }
        result.push_back(std::move(cleaned));
    }
    if (!keepRingStart) {
        std::sort(result.begin(), result.end(), [](const BgPolygon& a, const BgPolygon& b) {
            return LowerRing(a.outer(), b.outer());
        });
    }
    return result;
}

Point2d RoundToGrid(const Point2d& p, double scale) {
    return {std::round(p.x * scale) / scale, std::round(p.y * scale) / scale};
}

void RoundToGrid(BgMultiPolygon& polygons, double scale) {
    auto roundRing = [scale](BgRing& ring) {
        for (auto& p : ring) {
            p.x(std::round(p.x() * scale) / scale);
            p.y(std::round(p.y() * scale) / scale);
        }
    };
    for (auto& polygon : polygons) {
        roundRing(polygon.outer());
        for (auto& hole : polygon.inners()) {
            roundRing(hole);
        }
    }
}

} // namespace Patho::Roi::Internal
