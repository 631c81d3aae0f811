#include <PathoRoi/Core/RoiComparator.h>

#include <algorithm>

namespace Patho::Roi {

namespace {

template<typename T>
int Compare(T a, T b) {
    if (a < b) return -1;
    if (b < a) return 1;
    return 0;
}

} // anonymous namespace

int CompareRois(const QRoi& a, const QRoi& b) {
    Rect2d ba = a.BoundingBox();
    Rect2d bb = b.BoundingBox();

    int c = Compare(ba.x, bb.x);
    if (c == 0) c = Compare(ba.y, bb.y);
    if (c == 0) c = Compare(ba.width, bb.width);
    if (c == 0) c = Compare(ba.height, bb.height);
    if (c == 0) c = Compare(a.Plane().z, b.Plane().z);
    if (c == 0) c = Compare(a.Plane().t, b.Plane().t);
    if (c == 0) c = Compare(a.Plane().c, b.Plane().c);
    if (c != 0) {
        return c;
    }

    std::vector<Point2d> pa = a.PolygonPoints();
    std::vector<Point2d> pb = b.PolygonPoints();
    size_t n = std::min(pa.size(), pb.size());
    for (size_t i = 0; i < n; ++i) {
        c = Compare(pa[i].x, pb[i].x);
        if (c == 0) c = Compare(pa[i].y, pb[i].y);
        if (c != 0) {
            return c;
        }
    }
    return Compare(pa.size(), pb.size());
}

} // namespace Patho::Roi
