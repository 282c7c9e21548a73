#pragma once

#include "geocode_cache.hpp"
#include "route_cache.hpp"
#include "facility_directory.hpp"
#include "location_format.hpp"
#include "geo_services.hpp"
#include "resolution_error.hpp"
#include "retry.hpp"
#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include <utility>

enum class DistanceSource {
    Routed,    // road distance from the routing service
    Geodesic,  // great-circle fallback
    Cached     // served from the route cache, tier unknown
};

const char* distanceSourceName(DistanceSource source);

struct ResolvedLocation {
    std::string input;
    LocationKind kind = LocationKind::Address;
    Coordinate position;
    std::string facility_name;  // identifiers only
    std::string address;        // address that was geocoded, empty for coordinates
};

struct DistanceResult {
    double distance_km = 0.0;
    DistanceSource source = DistanceSource::Geodesic;
    ResolvedLocation origin;
    ResolvedLocation destination;
};

struct RouteQuery {
    std::string route_id;
    std::string origin;
    std::string destination;
};

struct RouteOutcome {
    std::string route_id;
    std::optional<DistanceResult> result;  // empty when the route failed
    std::string error;
};

struct BatchSummary {
    std::vector<RouteOutcome> outcomes;
    int successful = 0;
    int failed = 0;
};

struct WarmupSummary {
    int processed = 0;
    int geocoded = 0;
    int failed = 0;
};

struct ResolverCacheStats {
    CacheStats geocode;
    CacheStats route;
};

// Geocoding gives up quickly: one retry, and only while the service is down
RetryPolicy defaultGeocodingRetry();

struct ResolverOptions {
    std::chrono::milliseconds request_timeout{10000};
    RetryPolicy routing_retry;
    RetryPolicy geocoding_retry = defaultGeocodingRetry();

    // Appended as ", <hint>" unless the address already names the country
    std::string country_hint = "Denmark";
    std::vector<std::string> country_aliases{"denmark", "danmark"};

    // Geocode the destination on a worker while the origin is geocoded
    bool parallel_geocoding = true;
};

// Turns two location tokens into a distance:
//   tokens -> format resolution -> coordinates (geocode cache, geocoder)
//          -> route cache -> routing service (with retry) -> geodesic fallback
//
// The caches, facility table and services are owned by the caller and must
// outlive the resolver. geocoder and router may be null: without a geocoder
// only coordinate literals resolve, without a router every uncached distance
// is geodesic.
class DistanceResolver {
private:
    GeocodeCache* geocode_cache;
    RouteCache* route_cache;
    const FacilityLookup* facilities;
    GeocodingService* geocoder;
    RoutingService* router;
    ResolverOptions options;

    Location parseToken(const std::string& token, Endpoint side) const;
    bool needsGeocoder(const Location& location) const;
    ResolvedLocation locate(const std::string& token, const Location& location, Endpoint side);
    Coordinate geocodeAddress(const std::string& address, Endpoint side);
    std::string withCountryHint(const std::string& address) const;
    std::optional<double> routedDistance(const Coordinate& from, const Coordinate& to);

public:
    DistanceResolver(GeocodeCache* aGeocodeCache,
                     RouteCache* aRouteCache,
                     const FacilityLookup* aFacilities,
                     GeocodingService* aGeocoder,
                     RoutingService* aRouter,
                     ResolverOptions someOptions = ResolverOptions());

    // Positive distance or ResolutionError; never a silent zero
    DistanceResult resolveDistance(const std::string& origin, const std::string& destination);

    // Single token to coordinates: coordinate literal, then identifier, then address
    ResolvedLocation resolveLocation(const std::string& token, Endpoint side = Endpoint::Origin);

    // Route cache, then routing service, then geodesic
    std::pair<double, DistanceSource> distanceBetween(const Coordinate& from, const Coordinate& to);

    // Each route is resolved independently; failures are recorded, not thrown
    BatchSummary resolveBatch(const std::vector<RouteQuery>& routes);

    // Pre-populates the geocode cache
    WarmupSummary warmCache(const std::vector<std::string>& tokens);

    ResolverCacheStats cacheStats() const;
    void clearCaches();
};
