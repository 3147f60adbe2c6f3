#include "KnotFrame.hxx"

#include <cmath>
#include <string>

namespace {
const double kHalfPi = 1.57079632679489661923;

inline double distance(const Point& a, const Point& b) {
	return std::hypot(b[0] - a[0], b[1] - a[1]);
}

inline Point offset(const Point& p, double angle, double r) {
	return Point{p[0] + std::cos(angle) * r, p[1] + std::sin(angle) * r};
}
} // anonymous namespace

KnotFrame KnotFrame::build(const std::vector<Point>& points, std::size_t index, double scaling) {
	if (!(scaling >= 0.0 && scaling <= 1.0)) {
		throw InvalidArgument("KnotFrame: scaling must be within [0, 1], got " + std::to_string(scaling));
	}
	if (index == 0 || index + 1 >= points.size()) {
		throw InvalidArgument("KnotFrame: index " + std::to_string(index) + " is not an interior knot");
	}
	const Point& prev = points[index - 1];
	const Point& next = points[index + 1];

	KnotFrame f;
	f.index = index;
	f.knot = points[index];

	f.joining = Point{next[0] - prev[0], next[1] - prev[1]};
	f.length = std::hypot(f.joining[0], f.joining[1]);
	if (f.length == 0.0) {
		throw DegenerateSegment("KnotFrame: knots around knot " + std::to_string(index) + " coincide", index);
	}
	if (!std::isfinite(f.length)) {
		throw InvalidArgument("KnotFrame: knots around knot " + std::to_string(index) + " are too far apart");
	}
	f.unit = Point{f.joining[0] / f.length, f.joining[1] / f.length};
	f.normalLeft = Point{-f.unit[1], f.unit[0]};
	f.normalRight = Point{f.unit[1], -f.unit[0]};

	f.inAngle = std::atan2(f.normalLeft[1], f.normalLeft[0]) + kHalfPi;
	f.outAngle = std::atan2(f.normalRight[1], f.normalRight[0]) + kHalfPi;

	f.prevDistance = distance(prev, f.knot);
	f.nextDistance = distance(f.knot, next);
	if (f.prevDistance == 0.0 || f.nextDistance == 0.0) {
		throw DegenerateSegment("KnotFrame: knot " + std::to_string(index) + " coincides with a neighbour", index);
	}
	f.ratio = f.prevDistance / f.nextDistance;

	const double span = scaling * f.length;
	const double total = f.prevDistance + f.nextDistance;
	// Divide first, span * distance overflows for large coordinates
	f.inLength = span * (f.prevDistance / total);
	f.outLength = span * (f.nextDistance / total);

	f.inHandle = offset(f.knot, f.inAngle, f.inLength);
	f.outHandle = offset(f.knot, f.outAngle, f.outLength);
	return f;
}

std::vector<KnotFrame> KnotFrame::buildAll(const std::vector<Point>& points, double scaling) {
	std::vector<KnotFrame> frames;
	if (points.size() < 3) return frames;
	frames.reserve(points.size() - 2);
	for (std::size_t i = 1; i + 1 < points.size(); ++i) {
		frames.push_back(build(points, i, scaling));
	}
	return frames;
}
