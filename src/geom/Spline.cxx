// Implementation for CurveSegment, Spline and SplineBuilder
#include "Spline.hxx"

#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

CurveSegment CurveSegment::quadratic(const Point& start, const Point& c, const Point& end) {
	CurveSegment s;
	s.kind = Kind::Quadratic;
	s.start = start; s.c1 = c; s.c2 = c; s.end = end;
	return s;
}

CurveSegment CurveSegment::cubic(const Point& start, const Point& c1, const Point& c2, const Point& end) {
	CurveSegment s;
	s.kind = Kind::Cubic;
	s.start = start; s.c1 = c1; s.c2 = c2; s.end = end;
	return s;
}

Point CurveSegment::evaluate(double t) const {
	if (!(t >= 0.0 && t <= 1.0)) {
		throw std::runtime_error("Segment parameter t out of range");
	}
	const double mt = 1.0 - t;
	Point P{};
	if (kind == Kind::Quadratic) {
		const double b0 = mt * mt, b1 = 2.0 * mt * t, b2 = t * t;
		for (int k = 0; k < 2; ++k) P[k] = b0 * start[k] + b1 * c1[k] + b2 * end[k];
	} else {
		const double b0 = mt * mt * mt, b1 = 3.0 * mt * mt * t, b2 = 3.0 * mt * t * t, b3 = t * t * t;
		for (int k = 0; k < 2; ++k) P[k] = b0 * start[k] + b1 * c1[k] + b2 * c2[k] + b3 * end[k];
	}
	return P;
}

Point Spline::evaluate(double s) const {
	if (segments.empty()) {
		throw std::runtime_error("Spline has no segments");
	}
	const double smax = static_cast<double>(segments.size());
	if (!(s >= 0.0 && s <= smax)) {
		throw std::runtime_error("Spline parameter s out of range");
	}
	std::size_t k = static_cast<std::size_t>(std::floor(s));
	if (k >= segments.size()) k = segments.size() - 1; // s == smax
	return segments[k].evaluate(s - static_cast<double>(k));
}

std::vector<Point> Spline::sample(int samplesPerSegment) const {
	std::vector<Point> pts;
	if (segments.empty() || samplesPerSegment < 1) return pts;
	pts.reserve(segments.size() * static_cast<std::size_t>(samplesPerSegment) + 1);
	for (const auto& seg : segments) {
		for (int j = 0; j < samplesPerSegment; ++j) {
			pts.push_back(seg.evaluate(static_cast<double>(j) / samplesPerSegment));
		}
	}
	pts.push_back(segments.back().end);
	return pts;
}

SplineBuilder::SplineBuilder(double scaling) : scaling_(scaling) {
	// NaN fails both comparisons
	if (!(scaling >= 0.0 && scaling <= 1.0)) {
		throw InvalidArgument("Scaling must be within [0, 1], got " + std::to_string(scaling));
	}
}

void SplineBuilder::validatePoints(const std::vector<Point>& points) {
	if (points.size() < 3) {
		throw InvalidArgument("Spline needs at least 3 points, got " + std::to_string(points.size()));
	}
	for (std::size_t i = 0; i < points.size(); ++i) {
		if (!std::isfinite(points[i][0]) || !std::isfinite(points[i][1])) {
			throw InvalidArgument("Point " + std::to_string(i) + " is not finite");
		}
	}
}

Spline SplineBuilder::build(const std::vector<Point>& points, std::vector<KnotFrame>* frames) const {
	validatePoints(points);
	std::vector<KnotFrame> local = KnotFrame::buildAll(points, scaling_);
	Spline spline = assemble(points, local);
	if (frames) *frames = std::move(local);
	return spline;
}

// Segment k runs from knot k to knot k+1. Interior knot i owns frame i-1.
// The end knots have a single handle each, so the first and last segments
// are quadratic and borrow the only handle available on their interior side.
Spline SplineBuilder::assemble(const std::vector<Point>& points, const std::vector<KnotFrame>& frames) {
	const std::size_t n = points.size();
	Spline spline;
	spline.start = points.front();
	spline.segments.reserve(n - 1);

	spline.segments.push_back(CurveSegment::quadratic(points[0], frames.front().inHandle, points[1]));
	for (std::size_t i = 1; i + 2 < n; ++i) {
		spline.segments.push_back(CurveSegment::cubic(points[i], frames[i - 1].outHandle,
		                                              frames[i].inHandle, points[i + 1]));
	}
	spline.segments.push_back(CurveSegment::quadratic(points[n - 2], frames.back().outHandle, points[n - 1]));
	return spline;
}

Spline synthesizeSpline(const std::vector<Point>& points, double scaling) {
	return SplineBuilder(scaling).build(points);
}
