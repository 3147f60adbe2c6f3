#include "PointsIO.hxx"
#include "NumberFormat.hxx"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace {
static inline std::string trim(const std::string& s) {
    std::size_t a = 0, b = s.size();
    while (a < b && std::isspace(static_cast<unsigned char>(s[a]))) ++a;
    while (b > a && std::isspace(static_cast<unsigned char>(s[b-1]))) --b;
    return s.substr(a, b - a);
}

static void splitTokens(const std::string& line, std::vector<std::string>& out) {
    out.clear();
    std::istringstream iss(line);
    std::string tok;
    while (iss >> tok) out.push_back(tok);
}

// The whole string must be consumed. Underflow to a subnormal or zero is
// accepted, overflow to infinity is not.
static bool parseNumber(const std::string& s, double& value) {
    if (s.empty() || std::isspace(static_cast<unsigned char>(s[0]))) return false;
    char* end = nullptr;
    value = std::strtod(s.c_str(), &end);
    return end == s.c_str() + s.size() && std::isfinite(value);
}

static void requireMinimum(const std::vector<Point>& pts) {
    if (pts.size() < 3) {
        throw MalformedInput("Points: need at least 3 points, got " + std::to_string(pts.size()));
    }
}
}

namespace PointsIO {

Point parsePoint(const std::string& token) {
    const auto comma = token.find(',');
    if (comma == std::string::npos || token.find(',', comma + 1) != std::string::npos) {
        throw MalformedInput("Points: expected 'x,y' but got '" + token + "'");
    }
    Point p{};
    if (!parseNumber(token.substr(0, comma), p[0]) || !parseNumber(token.substr(comma + 1), p[1])) {
        throw MalformedInput("Points: bad number in '" + token + "'");
    }
    return p;
}

std::vector<Point> parse(const std::string& text) {
    std::vector<std::string> toks;
    splitTokens(text, toks);
    std::vector<Point> pts;
    pts.reserve(toks.size());
    for (const auto& t : toks) pts.push_back(parsePoint(t));
    requireMinimum(pts);
    return pts;
}

double parseScaling(const std::string& text) {
    double s = 0.0;
    if (!parseNumber(trim(text), s)) {
        throw MalformedInput("Scaling: '" + text + "' is not a number");
    }
    if (s < 0.0 || s > 1.0) {
        throw InvalidArgument("Scaling must be within [0, 1], got " + text);
    }
    return s;
}

std::string format(const std::vector<Point>& points) {
    std::string out;
    for (std::size_t i = 0; i < points.size(); ++i) {
        if (i) out += ' ';
        out += NumberFormat::point(points[i]);
    }
    return out;
}

bool readFile(const std::string& path, std::vector<Point>& out) {
    std::ifstream ifs(path);
    if (!ifs) return false;
    std::string line;
    std::vector<std::string> toks;
    std::vector<Point> pts;
    int lineNo = 0;
    while (std::getline(ifs, line)) {
        ++lineNo;
        // Strip inline comments after '#'
        auto hashPos = line.find('#');
        if (hashPos != std::string::npos) line = line.substr(0, hashPos);
        std::string t = trim(line);
        if (t.empty()) continue;
        if (t[0] == '*') continue; // full-line comment

        splitTokens(t, toks);
        for (const auto& tok : toks) {
            try {
                pts.push_back(parsePoint(tok));
            } catch (const MalformedInput& e) {
                throw MalformedInput(std::string(e.what()) + " (line " + std::to_string(lineNo) + ")");
            }
        }
    }
    requireMinimum(pts);
    out.insert(out.end(), pts.begin(), pts.end());
    return true;
}

bool readFile(const std::string& path, std::vector<Point>& out, std::string* errorMessage) {
    try {
        if (!readFile(path, out)) {
            if (errorMessage) *errorMessage = "Could not open points file " + path;
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        if (errorMessage) *errorMessage = e.what();
        return false;
    }
}

bool writeFile(const std::string& path, const std::vector<Point>& points) {
    std::ofstream ofs(path);
    if (!ofs) return false;
    ofs << "* bezspline points\n";
    for (const auto& p : points) ofs << NumberFormat::point(p) << '\n';
    return static_cast<bool>(ofs);
}

bool writeFile(const std::string& path, const std::vector<Point>& points, std::string* errorMessage) {
    try {
        if (!writeFile(path, points)) {
            if (errorMessage) *errorMessage = "Could not write points file " + path;
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        if (errorMessage) *errorMessage = e.what();
        return false;
    }
}

} // namespace PointsIO
