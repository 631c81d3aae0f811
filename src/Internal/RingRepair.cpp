/**
 * @file RingRepair.cpp
 * @brief Implementation of self-intersecting ring repair
 */

#include <PathoRoi/Internal/RingRepair.h>
#include <PathoRoi/Internal/PathFlatten.h>
#include <PathoRoi/Platform/Logging.h>

#include <boost/geometry/index/rtree.hpp>

#include <algorithm>
#include <cmath>
#include <iterator>
#include <map>
#include <utility>

namespace Patho::Roi::Internal {

namespace bgi = boost::geometry::index;

namespace {

using PointEntry = std::pair<BgPoint, size_t>;
using PointTree = bgi::rtree<PointEntry, bgi::quadratic<16>>;
using SegmentEntry = std::pair<BgBox, size_t>;
using SegmentTree = bgi::rtree<SegmentEntry, bgi::quadratic<16>>;

using PointKey = std::pair<double, double>;

PointKey KeyOf(const Point2d& p) {
    return {p.x, p.y};
}

bool IsInterior(double param) {
    return param > NODING_PARAM_TOLERANCE && param < 1.0 - NODING_PARAM_TOLERANCE;
}

// Parameter of p projected onto a1-a2
double ProjectParam(const Point2d& p, const Point2d& a1, const Point2d& a2) {
    Point2d d = a2 - a1;
    double len2 = d.Dot(d);
    return len2 > 0.0 ? (p - a1).Dot(d) / len2 : 0.0;
}

struct Split {
    double t;
    Point2d point;
};

BgBox SearchBox(const Point2d& p, double margin) {
    return BgBox(BgPoint(p.x - margin, p.y - margin), BgPoint(p.x + margin, p.y + margin));
}

// Envelope of segment a-b grown by margin
BgBox SegmentBox(const Point2d& a, const Point2d& b, double margin) {
    return BgBox(BgPoint(std::min(a.x, b.x) - margin, std::min(a.y, b.y) - margin),
                 BgPoint(std::max(a.x, b.x) + margin, std::max(a.y, b.y) + margin));
}

} // anonymous namespace

// =============================================================================
// Segment Intersection
// =============================================================================

std::vector<SegmentHit> IntersectSegments(const Point2d& a1, const Point2d& a2,
                                          const Point2d& b1, const Point2d& b2) {
    std::vector<SegmentHit> hits;
    Point2d d1 = a2 - a1;
    Point2d d2 = b2 - b1;
    double len1 = d1.Norm();
    double len2 = d2.Norm();
    if (len1 <= 0.0 || len2 <= 0.0) {
        return hits;
    }

    double cross = d1.Cross(d2);
    Point2d toB = b1 - a1;

    if (std::abs(cross) <= NODING_PARALLEL_TOLERANCE * len1 * len2) {
        // Parallel - only collinear segments can overlap
        if (std::abs(d1.Cross(toB)) > NODING_PARALLEL_TOLERANCE * len1 * std::max(toB.Norm(), len1)) {
            return hits;
        }

        // Overlap end points: endpoints of each segment inside the other
        auto addHit = [&](const Point2d& p, double t, double s) {
            if (t < -NODING_PARAM_TOLERANCE || t > 1.0 + NODING_PARAM_TOLERANCE ||
                s < -NODING_PARAM_TOLERANCE || s > 1.0 + NODING_PARAM_TOLERANCE) {
                return;
            }
            for (const auto& h : hits) {
                if (h.point == p) return;
            }
            hits.push_back({p, std::clamp(t, 0.0, 1.0), std::clamp(s, 0.0, 1.0)});
        };
        addHit(b1, ProjectParam(b1, a1, a2), 0.0);
        addHit(b2, ProjectParam(b2, a1, a2), 1.0);
        addHit(a1, 0.0, ProjectParam(a1, b1, b2));
        addHit(a2, 1.0, ProjectParam(a2, b1, b2));
        return hits;
    }

    double t = toB.Cross(d2) / cross;
    double s = toB.Cross(d1) / cross;
    if (t < -NODING_PARAM_TOLERANCE || t > 1.0 + NODING_PARAM_TOLERANCE ||
        s < -NODING_PARAM_TOLERANCE || s > 1.0 + NODING_PARAM_TOLERANCE) {
        return hits;
    }
    t = std::clamp(t, 0.0, 1.0);
    s = std::clamp(s, 0.0, 1.0);

    // Prefer existing vertices over computed points
    Point2d p;
    if (!IsInterior(t)) {
        p = t < 0.5 ? a1 : a2;
    } else if (!IsInterior(s)) {
        p = s < 0.5 ? b1 : b2;
    } else {
        p = a1 + d1 * t;
    }
    hits.push_back({p, t, s});
    return hits;
}

// =============================================================================
// Repair Steps
// =============================================================================

double ComputeSnapTolerance(const Ring2d& ring, double factor) {
    return Rect2d::FromPoints(ring).Diameter() * factor;
}

Ring2d SnapRingToSelf(const Ring2d& ring, double tolerance) {
    Ring2d snapped;
    snapped.reserve(ring.size());
    PointTree tree;
    std::vector<PointEntry> candidates;
    for (const auto& p : ring) {
        // Snap to the earliest kept vertex within tolerance
        candidates.clear();
        tree.query(bgi::intersects(SearchBox(p, tolerance)), std::back_inserter(candidates));
        size_t best = snapped.size();
        for (const auto& candidate : candidates) {
            if (candidate.second < best && p.DistanceTo(snapped[candidate.second]) <= tolerance) {
                best = candidate.second;
            }
        }
        if (best < snapped.size()) {
            snapped.push_back(snapped[best]);
        } else {
            tree.insert({ToBgPoint(p), snapped.size()});
            snapped.push_back(p);
        }
    }
    return RemoveDuplicateVertices(snapped);
}

Ring2d NodeRing(const Ring2d& ring, double tolerance) {
    size_t n = ring.size();
    if (n < 3) {
        return ring;
    }

    // Candidate pairs come from overlapping segment envelopes
    std::vector<SegmentEntry> entries;
    entries.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        const Point2d& a = ring[i];
        const Point2d& b = ring[(i + 1) % n];
        double margin = tolerance + NODING_PARAM_TOLERANCE * a.DistanceTo(b);
        entries.emplace_back(SegmentBox(a, b, margin), i);
    }
    SegmentTree tree(entries.begin(), entries.end());

    std::vector<std::vector<Split>> splits(n);
    std::vector<SegmentEntry> candidates;
    for (size_t i = 0; i < n; ++i) {
        const Point2d& a1 = ring[i];
        const Point2d& a2 = ring[(i + 1) % n];
        candidates.clear();
        tree.query(bgi::intersects(entries[i].first), std::back_inserter(candidates));
        std::sort(candidates.begin(), candidates.end(),
                  [](const SegmentEntry& a, const SegmentEntry& b) { return a.second < b.second; });
        for (const auto& candidate : candidates) {
            size_t j = candidate.second;
            if (j <= i) {
                continue;
            }
            const Point2d& b1 = ring[j];
            const Point2d& b2 = ring[(j + 1) % n];
            bool adjacent = (j == i + 1) || (i == 0 && j == n - 1);
            for (const auto& hit : IntersectSegments(a1, a2, b1, b2)) {
                if (adjacent && !IsInterior(hit.t) && !IsInterior(hit.s)) {
                    continue;  // shared vertex
                }
                if (IsInterior(hit.t)) {
                    splits[i].push_back({hit.t, hit.point});
                }
                if (IsInterior(hit.s)) {
                    splits[j].push_back({hit.s, hit.point});
                }
            }
        }
    }

    Ring2d noded;
    noded.reserve(n * 2);
    for (size_t i = 0; i < n; ++i) {
        noded.push_back(ring[i]);
        auto& list = splits[i];
        std::sort(list.begin(), list.end(), [](const Split& a, const Split& b) { return a.t < b.t; });
        for (const auto& split : list) {
            noded.push_back(split.point);
        }
    }
    return SnapRingToSelf(noded, tolerance);
}

std::vector<Ring2d> SplitIntoLoops(const Ring2d& ring) {
    std::vector<Ring2d> loops;
    std::vector<Point2d> stack;
    std::map<PointKey, size_t> index;

    for (const auto& p : ring) {
        auto it = index.find(KeyOf(p));
        if (it == index.end()) {
            index[KeyOf(p)] = stack.size();
            stack.push_back(p);
            continue;
        }

        // Close the loop that started at the earlier occurrence
        size_t k = it->second;
        Ring2d loop(stack.begin() + static_cast<std::ptrdiff_t>(k), stack.end());
        for (size_t m = k + 1; m < stack.size(); ++m) {
            index.erase(KeyOf(stack[m]));
        }
        stack.resize(k + 1);
        if (loop.size() >= 3) {
            loops.push_back(std::move(loop));
        }
    }
    if (stack.size() >= 3) {
        loops.push_back(std::move(stack));
    }
    return loops;
}

RingRepairResult RepairRing(const Ring2d& ring, const ConverterParams& params) {
    RingRepairResult result;
    result.areaBefore = std::abs(SignedArea(ring));
    result.snapTolerance = ComputeSnapTolerance(ring, params.snapPrecisionFactor);

    Ring2d noded = NodeRing(SnapRingToSelf(ring, result.snapTolerance), result.snapTolerance);

    std::vector<Ring2d> loops;
    std::vector<double> areas;
    double total = 0.0;
    for (auto& loop : SplitIntoLoops(noded)) {
        double a = SignedArea(loop);
        if (a == 0.0) continue;
        total += a;
        areas.push_back(a);
        loops.push_back(std::move(loop));
    }

    if (!loops.empty()) {
        double dominant = total != 0.0 ? total : areas.front();

        try {
            std::vector<BgMultiPolygon> filled;
            std::vector<BgPolygon> opposite;
            for (size_t i = 0; i < loops.size(); ++i) {
                Ring2d oriented = loops[i];
                if (areas[i] < 0.0) {
                    std::reverse(oriented.begin(), oriented.end());
                }
                BgPolygon polygon = ToBgPolygon(oriented);
                if ((areas[i] > 0.0) == (dominant > 0.0)) {
                    filled.push_back(BgMultiPolygon{polygon});
                } else {
                    opposite.push_back(polygon);
                }
            }

            BgMultiPolygon body = UnionAll(filled);
            std::vector<BgMultiPolygon> holes;
            std::vector<BgMultiPolygon> lobes{body};
            for (const auto& polygon : opposite) {
                BgMultiPolygon overlap;
                bg::intersection(polygon, body, overlap);
                if (bg::area(overlap) >= 0.5 * bg::area(polygon)) {
                    holes.push_back(BgMultiPolygon{polygon});
                } else {
                    lobes.push_back(BgMultiPolygon{polygon});
                }
            }

            body = UnionAll(lobes);
            if (!holes.empty()) {
                BgMultiPolygon cut;
                bg::difference(body, UnionAll(holes), cut);
                body = std::move(cut);
            }
            result.polygons = CanonicalizePolygons(body);
        } catch (const bg::exception& e) {
            Logger()->warn("Ring repair failed: {}", e.what());
            result.polygons.clear();
        }
    }

    result.areaAfter = bg::area(result.polygons);

    RingRepairInfo info;
    info.areaBefore = result.areaBefore;
    info.areaAfter = result.areaAfter;
    result.approximate = info.RelativeAreaChange() > params.repairAreaTolerance;
    return result;
}

} // namespace Patho::Roi::Internal
