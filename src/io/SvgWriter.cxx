#include "SvgWriter.hxx"
#include "NumberFormat.hxx"

#include <algorithm>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

using NumberFormat::number;
using NumberFormat::point;

namespace {
struct Box {
    double x0 = std::numeric_limits<double>::infinity();
    double y0 = std::numeric_limits<double>::infinity();
    double x1 = -std::numeric_limits<double>::infinity();
    double y1 = -std::numeric_limits<double>::infinity();

    void add(const Point& p) {
        x0 = std::min(x0, p[0]); y0 = std::min(y0, p[1]);
        x1 = std::max(x1, p[0]); y1 = std::max(y1, p[1]);
    }
};

static void line(std::ostringstream& os, const Point& a, const Point& b, const char* style) {
    os << "  <line x1=\"" << number(a[0]) << "\" y1=\"" << number(a[1])
       << "\" x2=\"" << number(b[0]) << "\" y2=\"" << number(b[1]) << "\" " << style << "/>\n";
}

static void circle(std::ostringstream& os, const Point& c, double r, const char* style) {
    os << "  <circle cx=\"" << number(c[0]) << "\" cy=\"" << number(c[1])
       << "\" r=\"" << number(r) << "\" " << style << "/>\n";
}

// Joining line between the neighbours, control line through the knot, and both handles.
static void overlay(std::ostringstream& os, const std::vector<Point>& points, const std::vector<KnotFrame>& frames) {
    os << "  <g class=\"overlay\">\n";
    for (const auto& f : frames) {
        if (f.index == 0 || f.index + 1 >= points.size()) continue;
        line(os, points[f.index - 1], points[f.index + 1], "stroke=\"#bbbbbb\" stroke-dasharray=\"4 3\"");
        line(os, f.inHandle, f.outHandle, "stroke=\"#d62728\"");
        circle(os, f.inHandle, 2.5, "fill=\"#2ca02c\"");
        circle(os, f.outHandle, 2.5, "fill=\"#ff7f0e\"");
    }
    os << "  </g>\n";
}
}

namespace SvgWriter {

std::string pathData(const Spline& spline) {
    std::string d = "M " + point(spline.start);
    for (const auto& s : spline.segments) {
        if (s.isQuadratic()) {
            d += " Q " + point(s.c1) + " " + point(s.end);
        } else {
            d += " C " + point(s.c1) + " " + point(s.c2) + " " + point(s.end);
        }
    }
    return d;
}

std::string polylineData(const std::vector<Point>& points) {
    std::string out;
    for (std::size_t i = 0; i < points.size(); ++i) {
        if (i) out += ' ';
        out += point(points[i]);
    }
    return out;
}

std::string document(const std::vector<Point>& points,
                     const Spline& spline,
                     const Options& options,
                     const std::vector<KnotFrame>* frames) {
    Box box;
    for (const auto& p : points) box.add(p);
    for (const auto& s : spline.segments) { box.add(s.c1); box.add(s.c2); }
    if (points.empty()) { box.x0 = box.y0 = box.x1 = box.y1 = 0.0; }
    const double x = box.x0 - options.margin;
    const double y = box.y0 - options.margin;
    const double w = (box.x1 - box.x0) + 2.0 * options.margin;
    const double h = (box.y1 - box.y0) + 2.0 * options.margin;

    std::ostringstream os;
    os << "<svg xmlns=\"http://www.w3.org/2000/svg\" viewBox=\""
       << number(x) << ' ' << number(y) << ' ' << number(w) << ' ' << number(h) << "\">\n";
    if (options.polyline) {
        os << "  <polyline points=\"" << polylineData(points)
           << "\" fill=\"none\" stroke=\"#999999\" stroke-width=\"1\"/>\n";
    }
    os << "  <path d=\"" << pathData(spline) << "\" fill=\"none\" stroke=\"" << options.stroke
       << "\" stroke-width=\"" << number(options.strokeWidth) << "\"/>\n";
    if (options.overlay && frames) overlay(os, points, *frames);
    if (options.knots) {
        for (const auto& p : points) circle(os, p, 3.0, "fill=\"#000000\"");
    }
    os << "</svg>\n";
    return os.str();
}

bool writeFile(const std::string& path,
               const std::vector<Point>& points,
               const Spline& spline,
               const Options& options,
               const std::vector<KnotFrame>* frames,
               std::string* errorMessage) {
    try {
        std::ofstream ofs(path);
        if (!ofs) throw std::runtime_error("Could not open svg file for writing: " + path);
        ofs << document(points, spline, options, frames);
        if (!ofs) throw std::runtime_error("Write failed: " + path);
        return true;
    } catch (const std::exception& e) {
        if (errorMessage) *errorMessage = e.what();
        return false;
    }
}

} // namespace SvgWriter
