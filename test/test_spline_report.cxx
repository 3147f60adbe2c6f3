#include <gtest/gtest.h>
#include "SplineReport.hxx"
#include "Spline.hxx"
#include <sstream>

TEST(SplineReport, OneBlockPerInteriorKnot) {
    std::vector<Point> P = { {50,182}, {100,166}, {150,87}, {200,191}, {250,106} };
    std::vector<KnotFrame> frames;
    SplineBuilder(0.4).build(P, &frames);

    std::ostringstream os;
    SplineReport(6).write(os, P, frames);
    const std::string r = os.str();
    EXPECT_NE(r.find("points 5  interior knots 3"), std::string::npos) << r;
    EXPECT_NE(r.find("knot 1 (100,166)"), std::string::npos) << r;
    EXPECT_NE(r.find("knot 3 (200,191)"), std::string::npos) << r;
    EXPECT_NE(r.find("100,-95"), std::string::npos) << r;
    EXPECT_NE(r.find("85.6162,179.665"), std::string::npos) << r;

    std::size_t blocks = 0;
    for (std::size_t pos = r.find("\nknot "); pos != std::string::npos; pos = r.find("\nknot ", pos + 1)) ++blocks;
    EXPECT_EQ(blocks, 3u);
}

TEST(SplineReport, RestoresStreamState) {
    std::vector<Point> P = { {0,0}, {1,1}, {2,0} };
    std::vector<KnotFrame> frames;
    SplineBuilder(0.5).build(P, &frames);
    std::ostringstream os;
    os.precision(3);
    SplineReport(10).write(os, P, frames);
    EXPECT_EQ(os.precision(), 3);
    EXPECT_FALSE(os.flags() & std::ios::left);
}

TEST(SplineReport, WriteFileFailure) {
    std::string err;
    EXPECT_FALSE(SplineReport().writeFile("no_such_dir/report.txt", {}, {}, &err));
    EXPECT_FALSE(err.empty());
}
