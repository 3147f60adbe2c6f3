#ifndef BEZSPLINE_SPLINE_REPORT_HXX
#define BEZSPLINE_SPLINE_REPORT_HXX

#include "KnotFrame.hxx"
#include <ostream>
#include <string>
#include <vector>

// Text dump of the per-knot records behind a spline, one block per interior knot:
//   knot 1 (100,166)
//     joining      100,-95    length 137.931
//     unit         ...
// Values are printed with `precision` significant digits.
class SplineReport {
public:
    explicit SplineReport(int precision = 6) : precision_(precision) {}

    void write(std::ostream& os, const std::vector<Point>& points, const std::vector<KnotFrame>& frames) const;

    // Returns true on success.
    bool writeFile(const std::string& path,
                   const std::vector<Point>& points,
                   const std::vector<KnotFrame>& frames,
                   std::string* errorMessage = nullptr) const;

private:
    int precision_;
};

#endif // BEZSPLINE_SPLINE_REPORT_HXX
