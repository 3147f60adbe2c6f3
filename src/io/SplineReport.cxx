#include "SplineReport.hxx"

#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace {
const double kRadToDeg = 57.29577951308232;

std::string pt(const Point& p, int precision) {
    std::ostringstream os;
    os << std::setprecision(precision) << p[0] << ',' << p[1];
    return os.str();
}
}

void SplineReport::write(std::ostream& os, const std::vector<Point>& points, const std::vector<KnotFrame>& frames) const {
    const auto flags = os.flags();
    const auto prec = os.precision(precision_);
    os << "points " << points.size() << "  interior knots " << frames.size() << '\n';
    for (const auto& f : frames) {
        os << "knot " << f.index << " (" << pt(f.knot, precision_) << ")\n";
        os << "  " << std::left << std::setw(14) << "joining" << std::setw(24) << pt(f.joining, precision_)
           << "length " << f.length << '\n';
        os << "  " << std::setw(14) << "unit" << pt(f.unit, precision_) << '\n';
        os << "  " << std::setw(14) << "normals" << std::setw(24) << pt(f.normalLeft, precision_)
           << pt(f.normalRight, precision_) << '\n';
        os << "  " << std::setw(14) << "angles(deg)" << std::setw(24) << f.inAngle * kRadToDeg
           << f.outAngle * kRadToDeg << '\n';
        os << "  " << std::setw(14) << "distances" << std::setw(24) << f.prevDistance
           << f.nextDistance << "  ratio " << f.ratio << '\n';
        os << "  " << std::setw(14) << "handle len" << std::setw(24) << f.inLength << f.outLength << '\n';
        os << "  " << std::setw(14) << "handles" << std::setw(24) << pt(f.inHandle, precision_)
           << pt(f.outHandle, precision_) << '\n';
    }
    os.precision(prec);
    os.flags(flags);
}

bool SplineReport::writeFile(const std::string& path,
                             const std::vector<Point>& points,
                             const std::vector<KnotFrame>& frames,
                             std::string* errorMessage) const {
    try {
        std::ofstream ofs(path);
        if (!ofs) throw std::runtime_error("Could not open report file for writing: " + path);
        write(ofs, points, frames);
        return true;
    } catch (const std::exception& e) {
        if (errorMessage) *errorMessage = e.what();
        return false;
    }
}
