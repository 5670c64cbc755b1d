#include <gtest/gtest.h>
#include <weft/layout/geometry.h>

#include <limits>

using namespace weft::layout;

TEST(GeometryTest, ParseAxisSpellings) {
    EXPECT_EQ(parse_axis("horizontal"), Axis::Horizontal);
    EXPECT_EQ(parse_axis("Horz"), Axis::Horizontal);
    EXPECT_EQ(parse_axis("h"), Axis::Horizontal);
    EXPECT_EQ(parse_axis("vertical"), Axis::Vertical);
    EXPECT_EQ(parse_axis("VERT"), Axis::Vertical);
    EXPECT_EQ(parse_axis("v"), Axis::Vertical);
    EXPECT_FALSE(parse_axis("diagonal").has_value());
    EXPECT_FALSE(parse_axis("").has_value());
}

TEST(GeometryTest, AxisNames) {
    EXPECT_STREQ(axis_name(Axis::Horizontal), "horizontal");
    EXPECT_STREQ(axis_name(Axis::Vertical), "vertical");
}

TEST(GeometryTest, MainAndCrossFollowAxis) {
    Size s{7, 3};
    EXPECT_EQ(main_of(s, Axis::Horizontal), 7);
    EXPECT_EQ(cross_of(s, Axis::Horizontal), 3);
    EXPECT_EQ(main_of(s, Axis::Vertical), 3);
    EXPECT_EQ(cross_of(s, Axis::Vertical), 7);
    EXPECT_EQ(make_size(Axis::Vertical, 3, 7), s);
    EXPECT_EQ(make_size(Axis::Horizontal, 7, 3), s);
}

TEST(GeometryTest, RectShrinkSaturates) {
    Rect r{2, 3, 10, 4};
    EXPECT_EQ(r.shrink(1, 1, 1, 1), (Rect{3, 4, 8, 2}));
    Rect tiny = r.shrink(6, 6, 3, 3);
    EXPECT_EQ(tiny.width, 0);
    EXPECT_EQ(tiny.height, 0);
    EXPECT_TRUE(tiny.is_empty());
}

TEST(GeometryTest, RectContainment) {
    Rect r{1, 1, 4, 2};
    EXPECT_TRUE(r.contains(1, 1));
    EXPECT_TRUE(r.contains(4, 2));
    EXPECT_FALSE(r.contains(5, 1));
    EXPECT_FALSE(r.contains(1, 3));
    EXPECT_TRUE(r.contains(Rect{2, 1, 3, 2}));
    EXPECT_FALSE(r.contains(Rect{2, 1, 4, 2}));
}

TEST(GeometryTest, ExtentReduceKeepsUnbounded) {
    Extent e{10, kUnbounded};
    Extent reduced = e.reduce(4, 4);
    EXPECT_EQ(reduced.width, 6);
    EXPECT_FALSE(reduced.height_bounded());
    EXPECT_EQ((Extent{3, 3}.reduce(5, 5)), (Extent{0, 0}));
}

TEST(GeometryTest, DefaultViewportIsATerminal) {
    Extent v = Extent::viewport();
    EXPECT_EQ(v.width, 80);
    EXPECT_EQ(v.height, 24);
    EXPECT_FALSE(Extent::unbounded().width_bounded());
}

TEST(GeometryTest, ExtentPinNeverGrowsPastBound) {
    Extent e{10, kUnbounded};
    Extent pinned = e.pin(20, 4);
    EXPECT_EQ(pinned.width, 10);
    EXPECT_EQ(pinned.height, 4);
    EXPECT_EQ(e.pin(std::nullopt, std::nullopt), e);
}

TEST(GeometryTest, ExtentClampOnlyCapsBoundedDimensions) {
    Extent e{5, kUnbounded};
    EXPECT_EQ(e.clamp({9, 100}), (Size{5, 100}));
    EXPECT_EQ(e.clamp({-2, 3}), (Size{0, 3}));
}

TEST(GeometryTest, ExtentAlongAndAcross) {
    Extent e = Extent::from_axis(Axis::Vertical, 6, 20);
    EXPECT_EQ(e.width, 20);
    EXPECT_EQ(e.height, 6);
    EXPECT_EQ(e.along(Axis::Vertical), 6);
    EXPECT_EQ(e.across(Axis::Vertical), 20);
}

TEST(GeometryTest, SaturatingAddPinsAtIntRange) {
    constexpr int kMax = std::numeric_limits<int>::max();
    EXPECT_EQ(saturating_add(2, 3), 5);
    EXPECT_EQ(saturating_add(kMax, 1), kMax);
    EXPECT_EQ(saturating_add(kMax, kMax), kMax);
    EXPECT_TRUE(is_bounded(saturating_add(kMax, kMax)));
}

TEST(GeometryTest, RectEdgesAndShrinkNeverWrap) {
    constexpr int kMax = std::numeric_limits<int>::max();
    Rect r{kMax - 1, 0, 5, 3};
    EXPECT_EQ(r.right(), kMax);
    Rect inner = Rect{0, 0, 10, 4}.shrink(kMax, kMax, 1, 1);
    EXPECT_EQ(inner.x, kMax);
    EXPECT_EQ(inner.width, 0);
    EXPECT_EQ(inner.height, 2);
}
