#include <gtest/gtest.h>
#include <PathoRoi/Core/Types.h>
#include <PathoRoi/Core/Constants.h>
#include <PathoRoi/Core/Validate.h>

#include <cmath>
#include <limits>

using namespace Patho::Roi;

// =============================================================================
// Point2d Tests
// =============================================================================

TEST(Point2dTest, DefaultConstructor) {
    Point2d p;
    EXPECT_DOUBLE_EQ(p.x, 0.0);
    EXPECT_DOUBLE_EQ(p.y, 0.0);
}

TEST(Point2dTest, Arithmetic) {
    Point2d a(1.0, 2.0);
    Point2d b(3.0, 4.0);
    EXPECT_EQ(a + b, Point2d(4.0, 6.0));
    EXPECT_EQ(b - a, Point2d(2.0, 2.0));
    EXPECT_EQ(a * 2.0, Point2d(2.0, 4.0));
    EXPECT_DOUBLE_EQ(a.Dot(b), 11.0);
    EXPECT_DOUBLE_EQ(Point2d(1, 0).Cross(Point2d(0, 1)), 1.0);
    EXPECT_DOUBLE_EQ(Point2d(0, 0).DistanceTo(Point2d(3, 4)), 5.0);
}

TEST(Point2dTest, Validity) {
    EXPECT_TRUE(Point2d(1, 2).IsValid());
    EXPECT_FALSE(Point2d(std::numeric_limits<double>::quiet_NaN(), 0).IsValid());
    EXPECT_FALSE(Point2d(0, std::numeric_limits<double>::infinity()).IsValid());
}

// =============================================================================
// Rect2d Tests
// =============================================================================

TEST(Rect2dTest, BasicProperties) {
    Rect2d r(10, 20, 100, 50);
    EXPECT_DOUBLE_EQ(r.Right(), 110.0);
    EXPECT_DOUBLE_EQ(r.Bottom(), 70.0);
    EXPECT_DOUBLE_EQ(r.Area(), 5000.0);
    EXPECT_EQ(r.Center(), Point2d(60.0, 45.0));
    EXPECT_DOUBLE_EQ(Rect2d(0, 0, 3, 4).Diameter(), 5.0);
}

TEST(Rect2dTest, FromPoints) {
    Rect2d r = Rect2d::FromPoints({{5, 7}, {-1, 3}, {2, 10}});
    EXPECT_DOUBLE_EQ(r.x, -1.0);
    EXPECT_DOUBLE_EQ(r.y, 3.0);
    EXPECT_DOUBLE_EQ(r.width, 6.0);
    EXPECT_DOUBLE_EQ(r.height, 7.0);

    Rect2d empty = Rect2d::FromPoints({});
    EXPECT_DOUBLE_EQ(empty.Area(), 0.0);
}

// =============================================================================
// ImagePlane Tests
// =============================================================================

TEST(ImagePlaneTest, DefaultPlane) {
    ImagePlane plane = ImagePlane::Default();
    EXPECT_EQ(plane.z, 0);
    EXPECT_EQ(plane.t, 0);
    EXPECT_EQ(plane.c, -1);
    EXPECT_EQ(plane, ImagePlane());
}

TEST(ImagePlaneTest, Factories) {
    EXPECT_EQ(ImagePlane::Make(3, 4), ImagePlane(3, 4, -1));
    ImagePlane withChannel = ImagePlane::WithChannel(0, 1, 2);
    EXPECT_EQ(withChannel.c, 0);
    EXPECT_EQ(withChannel.z, 1);
    EXPECT_EQ(withChannel.t, 2);
    EXPECT_NE(withChannel, ImagePlane::Make(1, 2));
}

// =============================================================================
// Validation Tests
// =============================================================================

TEST(ValidateTest, RequirePositive) {
    EXPECT_NO_THROW(Validate::RequirePositive(1.0, "flatness", "Test"));
    EXPECT_THROW(Validate::RequirePositive(0.0, "flatness", "Test"), InvalidArgumentException);
    EXPECT_THROW(Validate::RequirePositive(std::nan(""), "flatness", "Test"),
                 InvalidArgumentException);
}

TEST(ValidateTest, MessageFormat) {
    try {
        Validate::RequirePositive(-2.0, "radius", "ExpandRoi");
        FAIL() << "expected exception";
    } catch (const InvalidArgumentException& e) {
        EXPECT_STREQ(e.what(), "Invalid argument: ExpandRoi: radius must be > 0, got -2");
    }
}

TEST(ValidateTest, RequireSamePlane) {
    EXPECT_NO_THROW(Validate::RequireSamePlane(ImagePlane(), ImagePlane(), "Test"));
    EXPECT_THROW(Validate::RequireSamePlane(ImagePlane(0, 0), ImagePlane(1, 0), "Test"),
                 InvalidArgumentException);
}

TEST(ValidateTest, RequireFinitePoints) {
    EXPECT_NO_THROW(Validate::RequireFinitePoints({{0, 0}, {1, 1}}, "Test"));
    EXPECT_THROW(Validate::RequireFinitePoints({{0, 0}, {std::nan(""), 1}}, "Test"),
                 InvalidArgumentException);
}

TEST(ConstantsTest, Clamp) {
    EXPECT_EQ(Clamp(5, 0, 3), 3);
    EXPECT_EQ(Clamp(-1, 0, 3), 0);
    EXPECT_DOUBLE_EQ(Clamp(0.5, 0.0, 1.0), 0.5);
    EXPECT_NEAR(BEZIER_ELLIPSE_KAPPA, 4.0 / 3.0 * (std::sqrt(2.0) - 1.0), 1e-15);
}
