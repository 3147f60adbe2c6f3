#ifndef BEZSPLINE_SPLINE_TYPES_HXX
#define BEZSPLINE_SPLINE_TYPES_HXX

#include <array>
#include <cstddef>
#include <stdexcept>
#include <string>

using Point = std::array<double, 2>; // 2D point (x, y)

// Raised for caller contract violations: fewer than 3 knots, non-finite
// coordinates, or a scaling factor outside [0, 1].
class InvalidArgument : public std::invalid_argument {
public:
	explicit InvalidArgument(const std::string& what) : std::invalid_argument(what) {}
};

// Raised by the text adapter when the point list syntax is violated.
class MalformedInput : public std::runtime_error {
public:
	explicit MalformedInput(const std::string& what) : std::runtime_error(what) {}
};

// Raised when no direction can be derived at an interior knot, i.e. the knots
// around it coincide. knotIndex() is the 0-based index of that interior knot.
class DegenerateSegment : public std::runtime_error {
public:
	DegenerateSegment(const std::string& what, std::size_t knotIndex)
		: std::runtime_error(what), knotIndex_(knotIndex) {}

	std::size_t knotIndex() const { return knotIndex_; }

private:
	std::size_t knotIndex_;
};

#endif // BEZSPLINE_SPLINE_TYPES_HXX
