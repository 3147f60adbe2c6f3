#ifndef BEZSPLINE_SVG_WRITER_HXX
#define BEZSPLINE_SVG_WRITER_HXX

#include "Spline.hxx"
#include <string>
#include <vector>

namespace SvgWriter {

struct Options {
    double margin = 10.0;      // added around the bounding box of knots and handles
    double strokeWidth = 2.0;
    std::string stroke = "#1f77b4";
    bool polyline = false;     // draw the straight-line polyline through the knots
    bool knots = true;         // draw a marker at every knot
    bool overlay = false;      // draw joining lines, control lines and handles (needs frames)
};

// Path data: "M x,y", then "Q cx,cy ex,ey" for quadratic and
// "C c1x,c1y c2x,c2y ex,ey" for cubic segments, space separated.
std::string pathData(const Spline& spline);

// "x,y x,y ..." for a <polyline> points attribute.
std::string polylineData(const std::vector<Point>& points);

// Complete SVG document. The overlay is drawn only when frames is non-null and options.overlay is set.
std::string document(const std::vector<Point>& points,
                     const Spline& spline,
                     const Options& options,
                     const std::vector<KnotFrame>* frames = nullptr);

// Write document() to path. Returns true on success.
bool writeFile(const std::string& path,
               const std::vector<Point>& points,
               const Spline& spline,
               const Options& options,
               const std::vector<KnotFrame>* frames = nullptr,
               std::string* errorMessage = nullptr);

} // namespace SvgWriter

#endif // BEZSPLINE_SVG_WRITER_HXX
