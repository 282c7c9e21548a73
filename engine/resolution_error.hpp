#pragma once

#include <string>
#include <stdexcept>
#include <optional>

enum class Endpoint {
    Origin,
    Destination
};

enum class ResolutionFailure {
    InvalidInput,     // malformed or empty location, nothing was sent anywhere
    GeocodingFailed,  // no match, unknown identifier, or geocoder error
    NoDistance        // no tier produced a positive distance
};

const char* endpointName(Endpoint endpoint);

// The only failures resolveDistance lets escape. Routing problems are
// absorbed by the geodesic fallback and never surface here.
class ResolutionError : public std::runtime_error {
private:
    ResolutionFailure failure_kind;
    std::optional<Endpoint> failed_endpoint;

public:
    ResolutionError(ResolutionFailure kind, Endpoint endpoint, const std::string& message)
        : std::runtime_error(message), failure_kind(kind), failed_endpoint(endpoint) {}

    // Failure of the pair as a whole, such as NoDistance
    ResolutionError(ResolutionFailure kind, const std::string& message)
        : std::runtime_error(message), failure_kind(kind) {}

    ResolutionFailure kind() const { return failure_kind; }

    // Side that failed; empty when the failure belongs to the pair
    std::optional<Endpoint> endpoint() const { return failed_endpoint; }
};
