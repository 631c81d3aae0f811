/**
 * @file test_topology_builder.cpp
 * @brief Unit tests for Internal/TopologyBuilder
 */

#include <gtest/gtest.h>
#include <PathoRoi/Internal/TopologyBuilder.h>
#include <PathoRoi/Core/Constants.h>
#include <PathoRoi/Core/Exception.h>

#include <cmath>

using namespace Patho::Roi;
using namespace Patho::Roi::Internal;

namespace {

FlatRing MakeRing(const Ring2d& points) {
    FlatRing ring;
    ring.points = points;
    ring.signedArea = SignedArea(points);
    return ring;
}

Ring2d Square(double x, double y, double size) {
    return {{x, y}, {x + size, y}, {x + size, y + size}, {x, y + size}};
}

Ring2d Reversed(const Ring2d& ring) {
    return Ring2d(ring.rbegin(), ring.rend());
}

} // anonymous namespace

// ============================================================================
// BuildTopology
// ============================================================================

TEST(TopologyBuilderTest, SingleSquare) {
    BuildResult result = BuildTopology({MakeRing(Square(0, 0, 10))});
    EXPECT_TRUE(result.geometry.IsPolygonal());
    EXPECT_EQ(result.geometry.NumPolygons(), 1u);
    EXPECT_DOUBLE_EQ(result.geometry.Area(), 100.0);
    EXPECT_EQ(result.report.quality, RepairQuality::None);
    EXPECT_TRUE(result.geometry.IsValid());
}

TEST(TopologyBuilderTest, OppositeRingBecomesHole) {
    BuildResult result = BuildTopology({
        MakeRing(Square(0, 0, 10)),
        MakeRing(Reversed(Square(2, 2, 4))),
    });
    ASSERT_EQ(result.geometry.NumPolygons(), 1u);
    EXPECT_EQ(result.geometry.NumRings(), 2u);
    EXPECT_DOUBLE_EQ(result.geometry.Area(), 84.0);
}

TEST(TopologyBuilderTest, AggregateSignDecidesOuterRings) {
    // Both rings clockwise: aggregate is negative so clockwise rings are outer
    BuildResult result = BuildTopology({
        MakeRing(Reversed(Square(0, 0, 10))),
        MakeRing(Reversed(Square(20, 0, 10))),
    });
    EXPECT_EQ(result.geometry.NumPolygons(), 2u);
    EXPECT_DOUBLE_EQ(result.geometry.Area(), 200.0);
}

TEST(TopologyBuilderTest, OverlappingOuterRingsAreMerged) {
    BuildResult result = BuildTopology({
        MakeRing(Square(0, 0, 10)),
        MakeRing(Square(5, 0, 10)),
    });
    EXPECT_EQ(result.geometry.NumPolygons(), 1u);
    EXPECT_NEAR(result.geometry.Area(), 150.0, 1e-9);
}

TEST(TopologyBuilderTest, ZeroAggregateIsEmpty) {
    BuildResult result = BuildTopology({
        MakeRing(Square(0, 0, 10)),
        MakeRing(Reversed(Square(0, 0, 10))),
    });
    EXPECT_TRUE(result.geometry.IsEmpty());
    EXPECT_DOUBLE_EQ(result.geometry.Area(), 0.0);
}

TEST(TopologyBuilderTest, NoRingsIsEmpty) {
    EXPECT_TRUE(BuildTopology({}).geometry.IsEmpty());
}

TEST(TopologyBuilderTest, SelfIntersectingRingIsRepaired) {
    BuildResult result = BuildTopology({MakeRing({{0, 0}, {20, 20}, {20, 0}, {0, 10}})});
    ASSERT_EQ(result.report.repairs.size(), 1u);
    EXPECT_EQ(result.report.repairs[0].ringIndex, 0u);
    EXPECT_FALSE(result.report.repairs[0].reason.empty());
    EXPECT_EQ(result.report.quality, RepairQuality::Approximate);
    EXPECT_TRUE(result.geometry.IsRepairedApproximate());
    EXPECT_EQ(result.geometry.NumPolygons(), 2u);
    EXPECT_NEAR(result.geometry.Area(), 500.0 / 3.0, 1e-6);
    EXPECT_TRUE(result.geometry.IsValid());
}

TEST(TopologyBuilderTest, RebuildIsIdempotent) {
    BuildResult first = BuildTopology({
        MakeRing(Square(0, 0, 100)),
        MakeRing(Reversed(Square(10, 10, 20))),
        MakeRing(Square(200, 0, 50)),
    });
    BuildResult second = RebuildTopology(first.geometry);
    EXPECT_NEAR(second.geometry.Area(), first.geometry.Area(), 1e-9);
    EXPECT_EQ(second.geometry.NumRings(), first.geometry.NumRings());
    EXPECT_EQ(second.report.quality, RepairQuality::None);
}

TEST(TopologyBuilderTest, FixedPrecisionRoundsVertices) {
    ConverterParams params = ConverterParams().SetPrecisionScale(10.0);
    BuildResult result = BuildTopology({MakeRing({{0.01, 0.02}, {10.04, 0}, {10, 10.06}, {0, 10}})},
                                       params);
    ASSERT_EQ(result.geometry.NumPolygons(), 1u);
    for (const auto& ring : result.geometry.Rings()) {
        for (const auto& p : ring.points) {
            EXPECT_NEAR(p.x * 10.0, std::round(p.x * 10.0), 1e-9);
            EXPECT_NEAR(p.y * 10.0, std::round(p.y * 10.0), 1e-9);
        }
    }
}

TEST(TopologyBuilderTest, CollinearVerticesRemoved) {
    BuildResult result = BuildTopology({MakeRing({{0, 0}, {5, 0}, {10, 0}, {10, 10}, {0, 10}})});
    auto rings = result.geometry.Rings();
    ASSERT_EQ(rings.size(), 1u);
    EXPECT_EQ(rings[0].points.size(), 4u);
}

TEST(TopologyBuilderTest, SingleRingKeepsStartVertex) {
    Ring2d ring = {{10, 10}, {0, 10}, {0, 0}, {10, 0}};
    BuildResult result = BuildTopology({MakeRing(ring)});
    EXPECT_FALSE(result.clockwiseInput);
    ASSERT_EQ(result.geometry.Rings().size(), 1u);
    EXPECT_EQ(result.geometry.Rings()[0].points, ring);
}

TEST(TopologyBuilderTest, SingleClockwiseRingIsFlagged) {
    BuildResult result = BuildTopology({MakeRing(Reversed(Square(0, 0, 10)))});
    EXPECT_TRUE(result.clockwiseInput);
    EXPECT_DOUBLE_EQ(result.geometry.Area(), 100.0);
    EXPECT_GT(result.geometry.Rings()[0].signedArea, 0.0);

    QRoi back = GeometryToRoi(result.geometry, ImagePlane(), DefaultConverterParams(), true);
    EXPECT_EQ(back.PolygonPoints(), Reversed(Square(0, 0, 10)));
}

TEST(TopologyBuilderTest, OverlayRingsStartAtLowestVertex) {
    BuildResult result = BuildTopology({
        MakeRing({{100, 100}, {0, 100}, {0, 0}, {100, 0}}),
        MakeRing(Reversed(Square(10, 10, 20))),
    });
    EXPECT_FALSE(result.clockwiseInput);
    auto rings = result.geometry.Rings();
    ASSERT_EQ(rings.size(), 2u);
    EXPECT_EQ(rings[0].points.front(), Point2d(0, 0));
    EXPECT_EQ(rings[1].points.front(), Point2d(10, 10));

    BuildResult again = RebuildTopology(result.geometry);
    auto againRings = again.geometry.Rings();
    ASSERT_EQ(againRings.size(), 2u);
    EXPECT_EQ(againRings[0].points, rings[0].points);
    EXPECT_EQ(againRings[1].points, rings[1].points);
}

// ============================================================================
// TopologyGeometry
// ============================================================================

TEST(TopologyGeometryTest, Measures) {
    TopologyGeometry geometry = BuildTopology({MakeRing(Square(0, 0, 10))}).geometry;
    EXPECT_DOUBLE_EQ(geometry.Length(), 40.0);
    EXPECT_EQ(geometry.NumPoints(), 4u);
    Point2d c = geometry.Centroid();
    EXPECT_NEAR(c.x, 5.0, 1e-12);
    EXPECT_NEAR(c.y, 5.0, 1e-12);
    Rect2d box = geometry.BoundingBox();
    EXPECT_DOUBLE_EQ(box.width, 10.0);
    EXPECT_DOUBLE_EQ(box.height, 10.0);
}

TEST(TopologyGeometryTest, LineAndPoints) {
    BgLineString line;
    line.push_back(BgPoint(0, 0));
    line.push_back(BgPoint(3, 4));
    TopologyGeometry lineal = TopologyGeometry::FromLine(line);
    EXPECT_TRUE(lineal.IsLineal());
    EXPECT_DOUBLE_EQ(lineal.Length(), 5.0);
    EXPECT_DOUBLE_EQ(lineal.Area(), 0.0);

    BgMultiPoint points;
    points.push_back(BgPoint(1, 1));
    points.push_back(BgPoint(3, 3));
    TopologyGeometry puntal = TopologyGeometry::FromPoints(points);
    EXPECT_TRUE(puntal.IsPuntal());
    EXPECT_EQ(puntal.NumPoints(), 2u);
    EXPECT_EQ(puntal.Centroid(), Point2d(2, 2));

    EXPECT_TRUE(TopologyGeometry::FromLine(BgLineString()).IsEmpty());
}

// ============================================================================
// ROI Conversion
// ============================================================================

TEST(RoiGeometryTest, RectangleRoundTrip) {
    QRoi roi = QRoi::Rectangle(10, 20, 30, 40, ImagePlane::Make(2, 3));
    BuildResult built = RoiToGeometry(roi);
    QRoi back = GeometryToRoi(built.geometry, roi.Plane());

    EXPECT_EQ(back.Kind(), RoiKind::Polygon);
    EXPECT_EQ(back.Plane(), roi.Plane());
    Rect2d box = back.BoundingBox();
    EXPECT_DOUBLE_EQ(box.x, 10.0);
    EXPECT_DOUBLE_EQ(box.y, 20.0);
    EXPECT_DOUBLE_EQ(box.width, 30.0);
    EXPECT_DOUBLE_EQ(box.height, 40.0);
}

TEST(RoiGeometryTest, PixelSizeScalesCoordinates) {
    ConverterParams params = ConverterParams().SetPixelSize(0.5, 0.25);
    BuildResult built = RoiToGeometry(QRoi::Rectangle(0, 0, 100, 100), params);
    EXPECT_DOUBLE_EQ(built.geometry.Area(), 100.0 * 0.5 * 100.0 * 0.25);

    QRoi back = GeometryToRoi(built.geometry, ImagePlane(), params);
    EXPECT_DOUBLE_EQ(back.Area(), 10000.0);
}

TEST(RoiGeometryTest, LinesAndPoints) {
    BuildResult line = RoiToGeometry(QRoi::Line(0, 0, 10, 0));
    EXPECT_TRUE(line.geometry.IsLineal());
    EXPECT_EQ(GeometryToRoi(line.geometry, ImagePlane()).Kind(), RoiKind::Line);

    BuildResult polyline = RoiToGeometry(QRoi::Polyline({{0, 0}, {10, 0}, {10, 10}}));
    EXPECT_EQ(GeometryToRoi(polyline.geometry, ImagePlane()).Kind(), RoiKind::Polyline);

    BuildResult single = RoiToGeometry(QRoi::Points({{4, 5}}));
    QRoi back = GeometryToRoi(single.geometry, ImagePlane());
    EXPECT_EQ(back.Kind(), RoiKind::Points);
    EXPECT_EQ(back.NumPoints(), 1u);
}

TEST(RoiGeometryTest, CompositeWithHoleStaysComposite) {
    QRoi roi = QRoi::Composite({Square(0, 0, 10), Reversed(Square(2, 2, 4))});
    BuildResult built = RoiToGeometry(roi);
    QRoi back = GeometryToRoi(built.geometry, ImagePlane());
    EXPECT_EQ(back.Kind(), RoiKind::Composite);
    EXPECT_EQ(back.Rings().size(), 2u);
    EXPECT_DOUBLE_EQ(back.Area(), 84.0);
}

TEST(RoiGeometryTest, EmptyRoi) {
    BuildResult built = RoiToGeometry(QRoi::Empty());
    EXPECT_TRUE(built.geometry.IsEmpty());
    QRoi back = GeometryToRoi(built.geometry, ImagePlane::Make(4, 0));
    EXPECT_TRUE(back.IsEmpty());
    EXPECT_EQ(back.Plane().z, 4);
}

TEST(RoiGeometryTest, InvalidParamsThrow) {
    EXPECT_THROW(RoiToGeometry(QRoi::Rectangle(0, 0, 1, 1), ConverterParams().SetFlatness(0.0)),
                 InvalidArgumentException);
}
