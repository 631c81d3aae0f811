/**
 * @file test_path_flatten.cpp
 * @brief Unit tests for Internal/PathFlatten
 */

#include <gtest/gtest.h>
#include <PathoRoi/Internal/PathFlatten.h>
#include <PathoRoi/Core/Constants.h>
#include <PathoRoi/Core/Exception.h>

#include <cmath>

using namespace Patho::Roi;
using namespace Patho::Roi::Internal;

// ============================================================================
// Path Construction
// ============================================================================

TEST(RoiPathTest, RectanglePath) {
    RoiPath path = BuildPath(QRoi::Rectangle(1, 2, 3, 4));
    ASSERT_EQ(path.Size(), 5u);
    EXPECT_EQ(path.NumSubpaths(), 1u);
    EXPECT_EQ(path.Segments()[0].command, PathCommand::MoveTo);
    EXPECT_EQ(path.Segments()[0].p1, Point2d(1, 2));
    EXPECT_EQ(path.Segments()[2].p1, Point2d(4, 6));
    EXPECT_EQ(path.Segments()[4].command, PathCommand::Close);
}

TEST(RoiPathTest, EllipsePathUsesFourCubics) {
    RoiPath path = BuildPath(QRoi::Ellipse(0, 0, 20, 10));
    ASSERT_EQ(path.Size(), 6u);
    EXPECT_EQ(path.Segments()[0].p1, Point2d(20, 5));
    for (size_t i = 1; i <= 4; ++i) {
        EXPECT_EQ(path.Segments()[i].command, PathCommand::CubicTo);
    }
    EXPECT_EQ(path.Segments()[1].p3, Point2d(10, 10));
    EXPECT_EQ(path.Segments()[4].p3, Point2d(20, 5));
}

TEST(RoiPathTest, CompositeHasOneSubpathPerRing) {
    QRoi roi = QRoi::Composite({
        {{0, 0}, {10, 0}, {10, 10}},
        {{20, 0}, {30, 0}, {30, 10}},
        {{40, 0}, {50, 0}, {50, 10}},
    });
    EXPECT_EQ(BuildPath(roi).NumSubpaths(), 3u);
}

TEST(RoiPathTest, EmptyAndNonAreaRois) {
    EXPECT_TRUE(BuildPath(QRoi::Empty()).Empty());
    EXPECT_TRUE(BuildPath(QRoi::Rectangle(0, 0, 0, 5)).Empty());
    EXPECT_THROW(BuildPath(QRoi::Line(0, 0, 1, 1)), UnsupportedException);
    EXPECT_THROW(BuildPath(QRoi::Points({{0, 0}})), UnsupportedException);
}

TEST(RoiPathTest, Scaled) {
    RoiPath path = BuildPath(QRoi::Rectangle(1, 1, 2, 2)).Scaled(2.0, 0.5);
    EXPECT_EQ(path.Segments()[0].p1, Point2d(2.0, 0.5));
    EXPECT_EQ(path.Segments()[2].p1, Point2d(6.0, 1.5));
}

// ============================================================================
// Flattening
// ============================================================================

TEST(FlattenTest, LargeRectangleAreaIsExact) {
    auto rings = FlattenAreaRoi(QRoi::Rectangle(0, 0, 1000, 1000), DEFAULT_FLATNESS);
    ASSERT_EQ(rings.size(), 1u);
    EXPECT_EQ(rings[0].points.size(), 4u);
    EXPECT_NEAR(rings[0].signedArea, 1e6, 0.01);
}

TEST(FlattenTest, EllipseAreaWithinOnePercent) {
    auto rings = FlattenAreaRoi(QRoi::Ellipse(50, 0, 500, 300), DEFAULT_FLATNESS);
    ASSERT_EQ(rings.size(), 1u);
    double expected = PI * 250.0 * 150.0;
    EXPECT_GT(rings[0].signedArea, 0.0);
    EXPECT_NEAR(rings[0].signedArea, expected, expected * 0.01);
}

TEST(FlattenTest, FinerFlatnessAddsVertices) {
    QRoi roi = QRoi::Ellipse(0, 0, 400, 400);
    auto coarse = FlattenAreaRoi(roi, 2.0);
    auto fine = FlattenAreaRoi(roi, 0.05);
    ASSERT_EQ(coarse.size(), 1u);
    ASSERT_EQ(fine.size(), 1u);
    EXPECT_GT(fine[0].points.size(), coarse[0].points.size());

    double expected = PI * 200.0 * 200.0;
    EXPECT_LT(std::abs(fine[0].signedArea - expected), std::abs(coarse[0].signedArea - expected));
}

TEST(FlattenTest, CubicEndsAtEndPoint) {
    std::vector<Point2d> out;
    FlattenCubic({0, 0}, {0, 100}, {100, 100}, {100, 0}, 0.1, out);
    ASSERT_FALSE(out.empty());
    EXPECT_EQ(out.back(), Point2d(100, 0));
    EXPECT_NE(out.front(), Point2d(0, 0));
}

TEST(FlattenTest, StraightCubicIsOneSegment) {
    std::vector<Point2d> out;
    FlattenCubic({0, 0}, {10, 0}, {20, 0}, {30, 0}, 0.5, out);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0], Point2d(30, 0));
}

TEST(FlattenTest, ScaledFlattening) {
    auto rings = FlattenAreaRoi(QRoi::Rectangle(0, 0, 10, 10), DEFAULT_FLATNESS, 0.5, 2.0);
    ASSERT_EQ(rings.size(), 1u);
    EXPECT_DOUBLE_EQ(rings[0].signedArea, 100.0);
}

TEST(FlattenTest, UnclosedSubpathsCloseImplicitly) {
    RoiPath path;
    path.MoveTo({0, 0});
    path.LineTo({10, 0});
    path.LineTo({10, 10});
    path.MoveTo({20, 0});
    path.LineTo({30, 0});
    path.LineTo({30, 10});
    auto rings = FlattenPath(path, 0.5);
    ASSERT_EQ(rings.size(), 2u);
    EXPECT_DOUBLE_EQ(rings[0].signedArea, 50.0);
    EXPECT_DOUBLE_EQ(rings[1].signedArea, 50.0);
}

TEST(FlattenTest, DegenerateRingsDropped) {
    RoiPath path;
    path.MoveTo({0, 0});
    path.LineTo({5, 5});
    path.LineTo({0, 0});
    path.Close();
    EXPECT_TRUE(FlattenPath(path, 0.5).empty());
}

TEST(FlattenTest, InvalidFlatnessThrows) {
    RoiPath path = BuildPath(QRoi::Rectangle(0, 0, 1, 1));
    EXPECT_THROW(FlattenPath(path, 0.0), InvalidArgumentException);
    EXPECT_THROW(FlattenPath(path, -1.0), InvalidArgumentException);
}

// ============================================================================
// Ring Utilities
// ============================================================================

TEST(RingUtilsTest, SignedAreaOrientation) {
    Ring2d ccw = {{0, 0}, {4, 0}, {4, 4}, {0, 4}};
    Ring2d cw(ccw.rbegin(), ccw.rend());
    EXPECT_DOUBLE_EQ(SignedArea(ccw), 16.0);
    EXPECT_DOUBLE_EQ(SignedArea(cw), -16.0);
    EXPECT_DOUBLE_EQ(SignedArea({{0, 0}, {1, 1}}), 0.0);
}

TEST(RingUtilsTest, PerimeterAndLength) {
    Ring2d square = {{0, 0}, {4, 0}, {4, 4}, {0, 4}};
    EXPECT_DOUBLE_EQ(RingPerimeter(square), 16.0);
    EXPECT_DOUBLE_EQ(PolylineLength(square), 12.0);
}

TEST(RingUtilsTest, RemoveDuplicateVertices) {
    Ring2d ring = {{0, 0}, {0, 0}, {1, 0}, {1, 1}, {1, 1}, {0, 0}};
    Ring2d cleaned = RemoveDuplicateVertices(ring);
    ASSERT_EQ(cleaned.size(), 3u);
    EXPECT_EQ(cleaned[2], Point2d(1, 1));
}
