#ifndef BEZSPLINE_SPLINE_HXX
#define BEZSPLINE_SPLINE_HXX

#include "KnotFrame.hxx"
#include "SplineTypes.hxx"

#include <cstddef>
#include <vector>

// One Bezier piece of a spline. Quadratic segments use c1 only; c2 is left
// equal to c1 so both control slots always hold a meaningful point.
struct CurveSegment {
	enum class Kind { Quadratic, Cubic };

	Kind kind{Kind::Cubic};
	Point start{};
	Point c1{};
	Point c2{};
	Point end{};

	static CurveSegment quadratic(const Point& start, const Point& c, const Point& end);
	static CurveSegment cubic(const Point& start, const Point& c1, const Point& c2, const Point& end);

	bool isQuadratic() const { return kind == Kind::Quadratic; }

	// Evaluate the segment at t in [0, 1] (Bernstein form).
	// Throws std::runtime_error if t is out of range.
	Point evaluate(double t) const;
};

// A smooth path through a sequence of knots: the first knot followed by N - 1
// segments, each starting where the previous one ends.
struct Spline {
	Point start{};
	std::vector<CurveSegment> segments;

	std::size_t numSegments() const { return segments.size(); }

	// Evaluate at global parameter s in [0, numSegments()]; segment k covers [k, k+1].
	Point evaluate(double s) const;

	// Polyline approximation with samplesPerSegment points per segment plus the final knot.
	std::vector<Point> sample(int samplesPerSegment) const;
};

// Synthesizes the control points of a spline through a point sequence.
class SplineBuilder {
public:
	// Throws InvalidArgument unless 0 <= scaling <= 1.
	explicit SplineBuilder(double scaling);

	double scaling() const { return scaling_; }

	// Build the spline through `points` (at least 3, all finite).
	// If `frames` is non-null it receives the per-knot records used to place
	// the control points; the result does not depend on it.
	// Throws InvalidArgument or DegenerateSegment.
	Spline build(const std::vector<Point>& points, std::vector<KnotFrame>* frames = nullptr) const;

private:
	double scaling_;

	static void validatePoints(const std::vector<Point>& points);
	static Spline assemble(const std::vector<Point>& points, const std::vector<KnotFrame>& frames);
};

// Convenience wrapper around SplineBuilder(scaling).build(points).
Spline synthesizeSpline(const std::vector<Point>& points, double scaling);

#endif // BEZSPLINE_SPLINE_HXX
