#include "Spline.hxx"
#include "PointsIO.hxx"
#include "SvgWriter.hxx"

#include <cmath>
#include <cstdio>
#include <exception>
#include <string>
#include <vector>

// Writes a few sample line charts, each smoothed at several scaling factors,
// next to the straight polyline they were drawn from.

static std::vector<Point> unevenChart() {
	return { {50, 182}, {100, 166}, {150, 87}, {200, 191}, {250, 106} };
}

// Sine samples with irregular spacing in x to show the proportional handles.
static std::vector<Point> irregularSine(int samples) {
	std::vector<Point> pts;
	double x = 20.0;
	for (int k = 0; k < samples; ++k) {
		pts.push_back(Point{ x, 150.0 - 80.0 * std::sin(x / 40.0) });
		x += (k % 3 == 0) ? 12.0 : 35.0;
	}
	return pts;
}

static bool writeChart(const std::string& name, const std::vector<Point>& pts, double scaling) {
	Spline spline;
	std::vector<KnotFrame> frames;
	try {
		spline = SplineBuilder(scaling).build(pts, &frames);
	} catch (const std::exception& e) {
		std::fprintf(stderr, "%s: %s\n", name.c_str(), e.what());
		return false;
	}
	SvgWriter::Options opt;
	opt.polyline = true;
	opt.overlay = true;
	std::string err;
	if (!SvgWriter::writeFile(name, pts, spline, opt, &frames, &err)) {
		std::fprintf(stderr, "SVG write failed: %s\n", err.c_str());
		return false;
	}
	return true;
}

int main() {
	const double scalings[] = { 0.0, 0.33, 0.5, 1.0 };
	int written = 0;
	for (double s : scalings) {
		char suffix[32];
		std::snprintf(suffix, sizeof(suffix), "_%03d.svg", static_cast<int>(std::lround(s * 100.0)));
		if (!writeChart(std::string("uneven") + suffix, unevenChart(), s)) return 1;
		if (!writeChart(std::string("sine") + suffix, irregularSine(16), s)) return 1;
		written += 2;
	}
	std::string err;
	if (!PointsIO::writeFile("uneven.pts", unevenChart(), &err)) {
		std::fprintf(stderr, "Points write failed: %s\n", err.c_str());
		return 1;
	}
	std::printf("Wrote %d charts and uneven.pts\n", written);
	return 0;
}
