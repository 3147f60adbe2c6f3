#include <gtest/gtest.h>
#include "KnotFrame.hxx"
#include <cmath>

static const std::vector<Point> kChart = { {50,182}, {100,166}, {150,87}, {200,191}, {250,106} };

static double dist(const Point& a, const Point& b) {
    return std::hypot(b[0]-a[0], b[1]-a[1]);
}

TEST(KnotFrame, SegmentGeometry) {
    KnotFrame f = KnotFrame::build(kChart, 1, 0.4);
    EXPECT_EQ(f.index, 1u);
    EXPECT_DOUBLE_EQ(f.joining[0], 100.0);
    EXPECT_DOUBLE_EQ(f.joining[1], -95.0);
    EXPECT_NEAR(f.length, std::sqrt(19025.0), 1e-12);
    EXPECT_NEAR(f.unit[0]*f.unit[0] + f.unit[1]*f.unit[1], 1.0, 1e-12);
    // Normals are perpendicular to the joining line and opposite to each other
    EXPECT_NEAR(f.normalLeft[0]*f.unit[0] + f.normalLeft[1]*f.unit[1], 0.0, 1e-12);
    EXPECT_DOUBLE_EQ(f.normalLeft[0], -f.normalRight[0]);
    EXPECT_DOUBLE_EQ(f.normalLeft[1], -f.normalRight[1]);
}

TEST(KnotFrame, HandlesOnControlLine) {
    auto frames = KnotFrame::buildAll(kChart, 0.4);
    ASSERT_EQ(frames.size(), 3u);
    for (const auto& f : frames) {
        double dx = f.outHandle[0] - f.inHandle[0];
        double dy = f.outHandle[1] - f.inHandle[1];
        double len = std::hypot(dx, dy);
        ASSERT_GT(len, 0.0);
        // Control line is parallel to the joining line and oriented the same way
        EXPECT_NEAR((dx*f.unit[0] + dy*f.unit[1]) / len, 1.0, 1e-12);
        // The knot lies between its handles
        EXPECT_NEAR(dist(f.inHandle, f.knot) + dist(f.knot, f.outHandle), len, 1e-9);
    }
}

TEST(KnotFrame, HandleLengthsFollowNeighbourSpacing) {
    const double scaling = 0.4;
    for (const auto& f : KnotFrame::buildAll(kChart, scaling)) {
        const double d1 = dist(kChart[f.index-1], f.knot);
        const double d2 = dist(f.knot, kChart[f.index+1]);
        EXPECT_NEAR(dist(f.knot, f.inHandle), f.inLength, 1e-9);
        EXPECT_NEAR(dist(f.knot, f.outHandle), f.outLength, 1e-9);
        EXPECT_NEAR(f.inLength / f.outLength, d1 / d2, 1e-9);
        EXPECT_NEAR(f.ratio, d1 / d2, 1e-12);
        EXPECT_NEAR(f.inLength + f.outLength, scaling * f.length, 1e-9);
    }
}

TEST(KnotFrame, KnownHandles) {
    KnotFrame f = KnotFrame::build(kChart, 1, 0.4);
    EXPECT_NEAR(f.inHandle[0], 85.61619753753597, 1e-9);
    EXPECT_NEAR(f.inHandle[1], 179.66461233934083, 1e-9);
    EXPECT_NEAR(f.outHandle[0], 125.61619753753597, 1e-9);
    EXPECT_NEAR(f.outHandle[1], 141.66461233934083, 1e-9);
}

TEST(KnotFrame, ZeroScalingCollapsesHandles) {
    for (const auto& f : KnotFrame::buildAll(kChart, 0.0)) {
        EXPECT_EQ(f.inHandle, f.knot);
        EXPECT_EQ(f.outHandle, f.knot);
    }
}

TEST(KnotFrame, CoincidentFlankingKnotsThrow) {
    std::vector<Point> P = { {0,0}, {1,1}, {0,0} };
    try {
        KnotFrame::build(P, 1, 0.5);
        FAIL() << "expected DegenerateSegment";
    } catch (const DegenerateSegment& e) {
        EXPECT_EQ(e.knotIndex(), 1u);
    }
}

TEST(KnotFrame, CoincidentAdjacentKnotsThrow) {
    std::vector<Point> P = { {0,0}, {1,1}, {1,1}, {2,0} };
    EXPECT_THROW(KnotFrame::buildAll(P, 0.5), DegenerateSegment);
}

TEST(KnotFrame, EndKnotIsNotInterior) {
    EXPECT_THROW(KnotFrame::build(kChart, 0, 0.4), InvalidArgument);
    EXPECT_THROW(KnotFrame::build(kChart, 4, 0.4), InvalidArgument);
}

TEST(KnotFrame, TinyCoordinatesAreNotDegenerate) {
    std::vector<Point> P = { {0,0}, {1e-170,1e-170}, {2e-170,0} };
    KnotFrame f;
    ASSERT_NO_THROW(f = KnotFrame::build(P, 1, 0.5));
    EXPECT_GT(f.length, 0.0);
    EXPECT_TRUE(std::isfinite(f.inHandle[0]) && std::isfinite(f.inHandle[1]));
    EXPECT_TRUE(std::isfinite(f.outHandle[0]) && std::isfinite(f.outHandle[1]));
    EXPECT_LT(f.inHandle[0], f.knot[0]);
    EXPECT_GT(f.outHandle[0], f.knot[0]);
}

TEST(KnotFrame, HugeCoordinatesStayFinite) {
    std::vector<Point> P = { {0,0}, {1e160,1e160}, {2e160,0} };
    KnotFrame f;
    ASSERT_NO_THROW(f = KnotFrame::build(P, 1, 0.5));
    EXPECT_NEAR(f.length / 2e160, 1.0, 1e-12);
    EXPECT_TRUE(std::isfinite(f.inHandle[0]) && std::isfinite(f.inHandle[1]));
    EXPECT_TRUE(std::isfinite(f.outHandle[0]) && std::isfinite(f.outHandle[1]));
    EXPECT_NEAR(f.inHandle[0] / 0.5e160, 1.0, 1e-12);
    EXPECT_NEAR(f.outHandle[0] / 1.5e160, 1.0, 1e-12);
}

TEST(KnotFrame, OverflowingJoiningLineThrows) {
    std::vector<Point> P = { {-1.5e308,0}, {0,1}, {1.5e308,0} };
    EXPECT_THROW(KnotFrame::build(P, 1, 0.5), InvalidArgument);
}

TEST(KnotFrame, ScalingOutOfRangeThrows) {
    EXPECT_THROW(KnotFrame::build(kChart, 1, 1.5), InvalidArgument);
    EXPECT_THROW(KnotFrame::build(kChart, 1, -0.01), InvalidArgument);
    EXPECT_THROW(KnotFrame::buildAll(kChart, std::nan("")), InvalidArgument);
    EXPECT_NO_THROW(KnotFrame::buildAll(kChart, 1.0));
}
