#pragma once

#include "coordinate.hpp"
#include <string>
#include <optional>
#include <chrono>

// Implementations report failed calls by throwing ServiceError (retry.hpp).

class GeocodingService {
public:
    virtual ~GeocodingService() = default;

    // nullopt when the service has no match for the address
    virtual std::optional<Coordinate> geocode(const std::string& address,
                                              std::chrono::milliseconds timeout) = 0;
};

class RoutingService {
public:
    virtual ~RoutingService() = default;

    // Road distance in kilometers, nullopt when no usable route exists
    virtual std::optional<double> route(const Coordinate& from, const Coordinate& to,
                                        std::chrono::milliseconds timeout) = 0;
};
