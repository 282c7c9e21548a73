#include "route_cache.hpp"
#include <iostream>
#include <sstream>
#include <iomanip>
#include <cmath>
#include <utility>

namespace {

double roundTo6(double value) {
    // Adding 0.0 turns -0.0 into 0.0 so both print the same way
    return std::round(value * 1e6) / 1e6 + 0.0;
}

} // namespace

RouteCache::RouteCache(size_t capacity) : LruCache(capacity) {
    std::cout << "[INFO] RouteCache initialized with capacity " << this->capacity() << "\n";
}

std::string RouteCache::makeRouteKey(const Coordinate& start, const Coordinate& end) {
    std::pair<double, double> a{roundTo6(start.lat), roundTo6(start.lon)};
    std::pair<double, double> b{roundTo6(end.lat), roundTo6(end.lon)};
    if (b < a) {
        std::swap(a, b);
    }

    std::ostringstream ss;
    ss << std::fixed << std::setprecision(6)
       << "route_" << a.first << "," << a.second
       << "_to_" << b.first << "," << b.second;
    return ss.str();
}

std::optional<double> RouteCache::getDistance(const Coordinate& start, const Coordinate& end) {
    return get(makeRouteKey(start, end));
}

void RouteCache::setDistance(const Coordinate& start, const Coordinate& end, double distance_km) {
    std::string key = makeRouteKey(start, end);
    set(key, distance_km);
    std::cout << "[INFO] Route cache stored " << loggableKey(key) << "\n";
}
