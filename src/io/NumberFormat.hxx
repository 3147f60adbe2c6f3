#ifndef BEZSPLINE_NUMBER_FORMAT_HXX
#define BEZSPLINE_NUMBER_FORMAT_HXX

#include "SplineTypes.hxx"
#include <string>

namespace NumberFormat {

// Shortest decimal text that reads back to the same double ("100", "125.61619753753597").
// Negative zero is written as "0".
std::string number(double v);

// "x,y"
std::string point(const Point& p);

} // namespace NumberFormat

#endif // BEZSPLINE_NUMBER_FORMAT_HXX
