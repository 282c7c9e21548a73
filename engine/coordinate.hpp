#pragma once

#include <string>

struct Coordinate {
    double lat = 0.0;
    double lon = 0.0;
};

// Mean Earth radius (IUGG), used for great-circle distances
constexpr double EARTH_RADIUS_KM = 6371.0088;

// Latitude in [-90, 90], longitude in [-180, 180]. NaN is never valid.
bool isValidCoordinate(double lat, double lon);
bool isValidCoordinate(const Coordinate& c);

// Great-circle (haversine) distance in kilometers
double geodesicDistanceKm(const Coordinate& a, const Coordinate& b);

// "lat,lon" with up to 7 decimals, trailing zeros dropped
std::string formatCoordinate(const Coordinate& c);
