#pragma once

#include "lru_cache.hpp"
#include "coordinate.hpp"
#include <string>
#include <optional>

// Unordered coordinate pair -> distance in kilometers. Stores whichever
// distance was last computed for the pair; routed and geodesic values are
// not told apart.
class RouteCache : public LruCache<std::string, double> {
public:
    explicit RouteCache(size_t capacity = 1000);

    std::optional<double> getDistance(const Coordinate& start, const Coordinate& end);
    void setDistance(const Coordinate& start, const Coordinate& end, double distance_km);

    // Coordinates are rounded to 6 decimals (about 10 cm) and sorted, so
    // A->B and B->A produce the same key.
    static std::string makeRouteKey(const Coordinate& start, const Coordinate& end);
};
