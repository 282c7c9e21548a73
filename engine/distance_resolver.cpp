#include "distance_resolver.hpp"
#include <iostream>
#include <sstream>
#include <iomanip>
#include <future>
#include <cmath>
#include <cctype>
#include <algorithm>

namespace {

std::string toLowerAscii(const std::string& text) {
    std::string result = text;
    std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return result;
}

std::string formatKm(double km) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2) << km << " km";
    return ss.str();
}

std::string describeEndpoint(Endpoint side, const std::string& token) {
    return std::string(endpointName(side)) + " '" + token + "'";
}

} // namespace

const char* endpointName(Endpoint endpoint) {
    return endpoint == Endpoint::Origin ? "origin" : "destination";
}

const char* distanceSourceName(DistanceSource source) {
    switch (source) {
        case DistanceSource::Routed: return "routed";
        case DistanceSource::Geodesic: return "geodesic";
        case DistanceSource::Cached: return "cached";
    }
    return "unknown";
}

RetryPolicy defaultGeocodingRetry() {
    RetryPolicy policy;
    policy.max_attempts = 2;
    policy.is_retryable = isUnavailableFailure;
    return policy;
}

DistanceResolver::DistanceResolver(GeocodeCache* aGeocodeCache,
                                   RouteCache* aRouteCache,
                                   const FacilityLookup* aFacilities,
                                   GeocodingService* aGeocoder,
                                   RoutingService* aRouter,
                                   ResolverOptions someOptions)
    : geocode_cache(aGeocodeCache),
      route_cache(aRouteCache),
      facilities(aFacilities),
      geocoder(aGeocoder),
      router(aRouter),
      options(std::move(someOptions)) {
    if (!geocode_cache || !route_cache || !facilities) {
        throw std::invalid_argument("DistanceResolver requires both caches and a facility lookup");
    }
}

Location DistanceResolver::parseToken(const std::string& token, Endpoint side) const {
    try {
        return resolveLocationFormat(token, *facilities);
    } catch (const InvalidLocationError& e) {
        throw ResolutionError(ResolutionFailure::InvalidInput, side,
                              "Invalid " + std::string(endpointName(side)) + ": " + e.what());
    }
}

bool DistanceResolver::needsGeocoder(const Location& location) const {
    if (const auto* address = std::get_if<AddressText>(&location)) {
        return !geocode_cache->contains(GeocodeCache::normalizeAddress(address->text));
    }
    if (const auto* ref = std::get_if<FacilityRef>(&location)) {
        auto record = facilities->lookupById(ref->id);
        return record && !geocode_cache->contains(GeocodeCache::normalizeAddress(record->address));
    }
    return false;
}

std::string DistanceResolver::withCountryHint(const std::string& address) const {
    if (options.country_hint.empty()) {
        return address;
    }

    std::string lowered = toLowerAscii(address);
    if (lowered.find(toLowerAscii(options.country_hint)) != std::string::npos) {
        return address;
    }
    for (const auto& alias : options.country_aliases) {
        if (!alias.empty() && lowered.find(toLowerAscii(alias)) != std::string::npos) {
            return address;
        }
    }
    return address + ", " + options.country_hint;
}

Coordinate DistanceResolver::geocodeAddress(const std::string& address, Endpoint side) {
    const std::string failure = "Could not geocode " + describeEndpoint(side, address);

    if (!isPlausibleAddress(address)) {
        std::cerr << "[WARNING] Address looks implausible, geocoding anyway: '" << address << "'\n";
    }

    auto cached = geocode_cache->getCoordinates(address);
    if (cached.has_value()) {
        return cached.value();
    }

    if (!geocoder) {
        throw ResolutionError(ResolutionFailure::GeocodingFailed, side,
                              failure + ": no geocoding service configured");
    }

    std::string query = withCountryHint(address);
    std::optional<Coordinate> found;
    try {
        found = withRetry(options.geocoding_retry, "geocode", [&]() {
            return geocoder->geocode(query, options.request_timeout);
        });
    } catch (const ServiceError& e) {
        std::cerr << "[ERROR] " << failure << ": " << describeFailure(e) << "\n";
        throw ResolutionError(ResolutionFailure::GeocodingFailed, side,
                              failure + ": " + describeFailure(e));
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << failure << ": " << e.what() << "\n";
        throw ResolutionError(ResolutionFailure::GeocodingFailed, side,
                              failure + ": " + e.what());
    }

    if (!found.has_value()) {
        std::cerr << "[ERROR] " << failure << ": no match\n";
        throw ResolutionError(ResolutionFailure::GeocodingFailed, side, failure + ": no match");
    }
    if (!isValidCoordinate(found.value())) {
        throw ResolutionError(ResolutionFailure::GeocodingFailed, side,
                              failure + ": service returned invalid coordinates " +
                              formatCoordinate(found.value()));
    }

    geocode_cache->setCoordinates(address, found->lat, found->lon);
    std::cout << "[INFO] Geocoded '" << address << "' to " << formatCoordinate(found.value()) << "\n";
    return found.value();
}

ResolvedLocation DistanceResolver::locate(const std::string& token, const Location& location, Endpoint side) {
    ResolvedLocation resolved;
    resolved.input = token;
    resolved.kind = kindOf(location);

    if (const auto* coordinate = std::get_if<Coordinate>(&location)) {
        resolved.position = *coordinate;
        return resolved;
    }

    if (const auto* ref = std::get_if<FacilityRef>(&location)) {
        auto record = facilities->lookupById(ref->id);
        if (!record.has_value()) {
            throw ResolutionError(ResolutionFailure::GeocodingFailed, side,
                                  "Could not geocode " + describeEndpoint(side, token) +
                                  ": unknown facility identifier");
        }
        resolved.facility_name = record->name;
        resolved.address = record->address;
    } else {
        resolved.address = std::get<AddressText>(location).text;
    }

    resolved.position = geocodeAddress(resolved.address, side);
    return resolved;
}

std::optional<double> DistanceResolver::routedDistance(const Coordinate& from, const Coordinate& to) {
    if (!router) {
        return std::nullopt;
    }

    try {
        auto distance = withRetry(options.routing_retry, "route", [&]() {
            return router->route(from, to, options.request_timeout);
        });

        if (!distance.has_value()) {
            std::cerr << "[WARNING] Routing service returned no route, using geodesic distance\n";
            return std::nullopt;
        }
        if (!std::isfinite(distance.value()) || distance.value() <= 0.0) {
            std::cerr << "[WARNING] Routing service returned invalid distance "
                      << distance.value() << ", using geodesic distance\n";
            return std::nullopt;
        }
        return distance;
    } catch (const ServiceError& e) {
        std::cerr << "[WARNING] Routing failed (" << describeFailure(e)
                  << "), using geodesic distance\n";
    } catch (const std::exception& e) {
        std::cerr << "[WARNING] Routing failed (" << e.what() << "), using geodesic distance\n";
    }
    return std::nullopt;
}

std::pair<double, DistanceSource> DistanceResolver::distanceBetween(const Coordinate& from, const Coordinate& to) {
    auto cached = route_cache->getDistance(from, to);
    if (cached.has_value()) {
        return {cached.value(), DistanceSource::Cached};
    }

    auto routed = routedDistance(from, to);
    if (routed.has_value()) {
        route_cache->setDistance(from, to, routed.value());
        std::cout << "[INFO] Routed distance " << formatCoordinate(from) << " -> "
                  << formatCoordinate(to) << ": " << formatKm(routed.value()) << "\n";
        return {routed.value(), DistanceSource::Routed};
    }

    double geodesic = geodesicDistanceKm(from, to);
    if (!std::isfinite(geodesic) || geodesic <= 0.0) {
        throw ResolutionError(ResolutionFailure::NoDistance,
                              "No positive distance between " + formatCoordinate(from) +
                              " and " + formatCoordinate(to));
    }

    route_cache->setDistance(from, to, geodesic);
    std::cout << "[INFO] Geodesic distance " << formatCoordinate(from) << " -> "
              << formatCoordinate(to) << ": " << formatKm(geodesic) << "\n";
    return {geodesic, DistanceSource::Geodesic};
}

DistanceResult DistanceResolver::resolveDistance(const std::string& origin, const std::string& destination) {
    // Both tokens are validated before any network traffic
    Location from = parseToken(origin, Endpoint::Origin);
    Location to = parseToken(destination, Endpoint::Destination);

    DistanceResult result;
    if (options.parallel_geocoding && needsGeocoder(from) && needsGeocoder(to)) {
        auto pending = std::async(std::launch::async, [this, &destination, &to]() {
            return locate(destination, to, Endpoint::Destination);
        });
        // If the origin throws, the future's destructor still waits for the worker
        result.origin = locate(origin, from, Endpoint::Origin);
        result.destination = pending.get();
    } else {
        result.origin = locate(origin, from, Endpoint::Origin);
        result.destination = locate(destination, to, Endpoint::Destination);
    }

    auto [distance_km, source] = distanceBetween(result.origin.position, result.destination.position);
    result.distance_km = distance_km;
    result.source = source;

    std::cout << "[INFO] Resolved '" << origin << "' -> '" << destination << "': "
              << formatKm(distance_km) << " (" << distanceSourceName(source) << ")\n";
    return result;
}

ResolvedLocation DistanceResolver::resolveLocation(const std::string& token, Endpoint side) {
    return locate(token, parseToken(token, side), side);
}

BatchSummary DistanceResolver::resolveBatch(const std::vector<RouteQuery>& routes) {
    BatchSummary summary;
    summary.outcomes.reserve(routes.size());

    for (const auto& route : routes) {
        RouteOutcome outcome;
        outcome.route_id = route.route_id;
        try {
            outcome.result = resolveDistance(route.origin, route.destination);
            ++summary.successful;
        } catch (const ResolutionError& e) {
            outcome.error = e.what();
            ++summary.failed;
            std::cerr << "[ERROR] Route " << route.route_id << " failed: " << e.what() << "\n";
        }
        summary.outcomes.push_back(std::move(outcome));
    }

    std::cout << "[INFO] Batch complete: " << summary.successful << " successful, "
              << summary.failed << " failed of " << routes.size() << " routes\n";
    return summary;
}

WarmupSummary DistanceResolver::warmCache(const std::vector<std::string>& tokens) {
    WarmupSummary summary;

    for (const auto& token : tokens) {
        ++summary.processed;
        try {
            Location location = parseToken(token, Endpoint::Origin);
            if (kindOf(location) == LocationKind::Coordinate) {
                continue;
            }
            locate(token, location, Endpoint::Origin);
            ++summary.geocoded;
        } catch (const ResolutionError& e) {
            ++summary.failed;
            std::cerr << "[WARNING] Warm-up skipped '" << token << "': " << e.what() << "\n";
        }
    }

    std::cout << "[INFO] Cache warm-up complete: " << summary.geocoded << " addresses geocoded from "
              << summary.processed << " locations\n";
    return summary;
}

ResolverCacheStats DistanceResolver::cacheStats() const {
    return ResolverCacheStats{geocode_cache->stats(), route_cache->stats()};
}

void DistanceResolver::clearCaches() {
    geocode_cache->clear();
    route_cache->clear();
    std::cout << "[INFO] All caches cleared\n";
}
