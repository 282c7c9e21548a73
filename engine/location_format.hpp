#pragma once

#include "coordinate.hpp"
#include "facility_directory.hpp"
#include <string>
#include <optional>
#include <variant>
#include <stdexcept>

enum class LocationKind {
    Coordinate,
    Identifier,
    Address
};

const char* locationKindName(LocationKind kind);

// Empty token or a coordinate-shaped token outside the valid range
class InvalidLocationError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

struct FacilityRef {
    std::string id;
};

struct AddressText {
    std::string text;
};

// A location token after classification
using Location = std::variant<Coordinate, FacilityRef, AddressText>;

LocationKind kindOf(const Location& location);

// Parses "lat,lon" (optionally signed, optionally decimal) or the hemisphere
// form "55.676 N, 12.568 E". Returns nullopt when the token is not shaped
// like a coordinate; throws InvalidLocationError when it is shaped like one
// but out of range.
std::optional<Coordinate> parseCoordinateLiteral(const std::string& token);

// Throws InvalidLocationError for empty or out-of-range coordinate input.
// Short alphanumeric tokens are looked up in the facility table and fall
// through to Address when unknown; all-digit tokens are always identifiers.
LocationKind classifyLocation(const std::string& token, const FacilityLookup& facilities);

// Classification plus the matching parse step
Location resolveLocationFormat(const std::string& token, const FacilityLookup& facilities);

// Advisory check: 5-200 bytes, at least one letter and one digit
bool isPlausibleAddress(const std::string& text);
