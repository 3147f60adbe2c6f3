#ifndef BEZSPLINE_POINTS_IO_HXX
#define BEZSPLINE_POINTS_IO_HXX

#include "SplineTypes.hxx"
#include <string>
#include <vector>

namespace PointsIO {

// Parse whitespace separated "x,y" tokens, e.g. "50,182 100,166 150,87".
// Throws MalformedInput on a bad token or if fewer than 3 points result.
std::vector<Point> parse(const std::string& text);

// Parse a single "x,y" token. Throws MalformedInput.
Point parsePoint(const std::string& token);

// Parse a scaling factor. Throws MalformedInput if the text is not a number
// and InvalidArgument if the value lies outside [0, 1].
double parseScaling(const std::string& text);

// Format points back into the "x,y x,y ..." form accepted by parse().
std::string format(const std::vector<Point>& points);

// Read a points file and append the points to 'out'. Returns true on success.
// Lines starting with '*' are comments, text after '#' is ignored, every other
// line holds zero or more "x,y" tokens. Fewer than 3 points in total is an error.
bool readFile(const std::string& path, std::vector<Point>& out);
bool readFile(const std::string& path, std::vector<Point>& out, std::string* errorMessage);

// Write points one per line. Returns true on success.
bool writeFile(const std::string& path, const std::vector<Point>& points);
bool writeFile(const std::string& path, const std::vector<Point>& points, std::string* errorMessage);

} // namespace PointsIO

#endif // BEZSPLINE_POINTS_IO_HXX
