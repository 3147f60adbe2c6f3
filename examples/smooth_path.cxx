#include "Spline.hxx"
#include "PointsIO.hxx"
#include "SvgWriter.hxx"
#include "SplineReport.hxx"

#include <cstdio>
#include <cstring>
#include <exception>
#include <string>
#include <vector>

static void usage(const char* prog) {
    std::fprintf(stderr,
                 "Usage: %s <\"x,y x,y ...\" | @points.txt> <scaling 0..1> [out.svg] [--polyline] [--debug report.txt]\n"
                 "Without out.svg the path data is printed to stdout.\n",
                 prog);
}

int main(int argc, char** argv) {
    std::vector<std::string> positional;
    std::string reportPath;
    SvgWriter::Options options;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--polyline") == 0) {
            options.polyline = true;
        } else if (std::strcmp(argv[i], "--debug") == 0) {
            if (i + 1 >= argc) { usage(argv[0]); return 2; }
            reportPath = argv[++i];
            options.overlay = true;
        } else {
            positional.push_back(argv[i]);
        }
    }
    if (positional.size() < 2 || positional.size() > 3) {
        usage(argv[0]);
        return 2;
    }

    std::vector<Point> points;
    double scaling = 0.0;
    try {
        const std::string& src = positional[0];
        if (!src.empty() && src[0] == '@') {
            std::string err;
            if (!PointsIO::readFile(src.substr(1), points, &err)) {
                std::fprintf(stderr, "Failed to read points %s: %s\n", src.c_str() + 1, err.c_str());
                return 1;
            }
        } else {
            points = PointsIO::parse(src);
        }
        scaling = PointsIO::parseScaling(positional[1]);
    } catch (const std::exception& e) {
        std::fprintf(stderr, "Invalid input: %s\n", e.what());
        return 2;
    }

    Spline spline;
    std::vector<KnotFrame> frames;
    try {
        spline = SplineBuilder(scaling).build(points, reportPath.empty() ? nullptr : &frames);
    } catch (const std::exception& e) {
        std::fprintf(stderr, "Spline synthesis failed: %s\n", e.what());
        return 1;
    }

    std::string err;
    if (!reportPath.empty()) {
        if (!SplineReport().writeFile(reportPath, points, frames, &err)) {
            std::fprintf(stderr, "Report write failed: %s\n", err.c_str());
            return 1;
        }
        std::printf("Wrote report: %s\n", reportPath.c_str());
    }

    if (positional.size() == 3) {
        const std::string& svgPath = positional[2];
        if (!SvgWriter::writeFile(svgPath, points, spline, options, reportPath.empty() ? nullptr : &frames, &err)) {
            std::fprintf(stderr, "SVG write failed: %s\n", err.c_str());
            return 1;
        }
        std::printf("Wrote %zu segments: %s\n", spline.numSegments(), svgPath.c_str());
    } else {
        std::printf("%s\n", SvgWriter::pathData(spline).c_str());
    }
    return 0;
}
