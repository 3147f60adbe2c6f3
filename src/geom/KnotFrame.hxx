#ifndef BEZSPLINE_KNOT_FRAME_HXX
#define BEZSPLINE_KNOT_FRAME_HXX

#include "SplineTypes.hxx"

#include <cstddef>
#include <vector>

// Derived geometry at one interior knot of a point sequence.
// Notes:
// - The joining line runs from the previous knot to the next knot; the control
//   line passes through the knot parallel to it and carries both handles.
// - The handle span (scaling * length) is split between the two handles in
//   proportion to the distances to the previous and next knot, so that the
//   shorter neighbouring segment gets the shorter handle.
// - inHandle shapes the curve arriving at the knot, outHandle the one leaving it.
struct KnotFrame {
	std::size_t index{0}; // 0-based index of the knot in the point sequence
	Point knot{};

	// Segment geometry
	Point joining{};      // next - previous
	double length{0.0};   // |joining|
	Point unit{};         // joining / length
	Point normalLeft{};   // (-unit.y, unit.x)
	Point normalRight{};  // (unit.y, -unit.x)

	// Handle placement
	double inAngle{0.0};  // atan2(normalLeft) + pi/2, points back along the control line
	double outAngle{0.0}; // atan2(normalRight) + pi/2, points forward along the control line
	double prevDistance{0.0};
	double nextDistance{0.0};
	double ratio{0.0};    // prevDistance / nextDistance
	double inLength{0.0};
	double outLength{0.0};
	Point inHandle{};
	Point outHandle{};

	// Build the frame of interior knot `index` (1 <= index <= points.size() - 2).
	// Throws InvalidArgument unless 0 <= scaling <= 1, and DegenerateSegment if
	// the flanking knots coincide or the knot coincides with one of its neighbours.
	static KnotFrame build(const std::vector<Point>& points, std::size_t index, double scaling);

	// Frames of every interior knot, in order.
	static std::vector<KnotFrame> buildAll(const std::vector<Point>& points, double scaling);
};

#endif // BEZSPLINE_KNOT_FRAME_HXX
