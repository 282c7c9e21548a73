#pragma once

#include "lru_cache.hpp"
#include "coordinate.hpp"
#include <string>
#include <optional>

// Normalized address -> coordinates. Pure cache of geocoding results.
class GeocodeCache : public LruCache<std::string, Coordinate> {
public:
    explicit GeocodeCache(size_t capacity = 1000);

    std::optional<Coordinate> getCoordinates(const std::string& address);
    void setCoordinates(const std::string& address, double lat, double lon);

    // Lower-cased, trimmed, whitespace-collapsed and "addr_" prefixed.
    // Normalized text longer than 100 bytes is replaced by its SHA-256 hex digest.
    static std::string normalizeAddress(const std::string& address);
};
