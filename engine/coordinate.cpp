#include "coordinate.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <iomanip>

namespace {

constexpr double PI = 3.14159265358979323846;

double toRadians(double degrees) {
    return degrees * PI / 180.0;
}

std::string formatDegrees(double value) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(7) << value;
    std::string text = ss.str();

    // Trim trailing zeros but keep at least one decimal
    size_t last = text.find_last_not_of('0');
    if (last != std::string::npos && text[last] == '.') {
        ++last;
    }
    text.erase(last + 1);
    if (text == "-0.0") {
        text = "0.0";
    }
    return text;
}

} // namespace

bool isValidCoordinate(double lat, double lon) {
    // Comparisons are false for NaN, so NaN is rejected here too
    return lat >= -90.0 && lat <= 90.0 && lon >= -180.0 && lon <= 180.0;
}

bool isValidCoordinate(const Coordinate& c) {
    return isValidCoordinate(c.lat, c.lon);
}

double geodesicDistanceKm(const Coordinate& a, const Coordinate& b) {
    double lat1 = toRadians(a.lat);
    double lat2 = toRadians(b.lat);
    double d_lat = lat2 - lat1;
    double d_lon = toRadians(b.lon - a.lon);

    double h = std::sin(d_lat / 2.0) * std::sin(d_lat / 2.0) +
               std::cos(lat1) * std::cos(lat2) *
               std::sin(d_lon / 2.0) * std::sin(d_lon / 2.0);
    // Rounding can push h marginally above 1 for antipodal points
    h = std::min(1.0, std::max(0.0, h));
    double c = 2.0 * std::atan2(std::sqrt(h), std::sqrt(1.0 - h));

    return EARTH_RADIUS_KM * c;
}

std::string formatCoordinate(const Coordinate& c) {
    return formatDegrees(c.lat) + "," + formatDegrees(c.lon);
}
