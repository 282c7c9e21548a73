#include "location_format.hpp"
#include <regex>
#include <cctype>
#include <algorithm>

namespace {

constexpr size_t MAX_SHORT_IDENTIFIER_LENGTH = 10;

const std::regex& plainCoordinatePattern() {
    static const std::regex pattern(
        R"(^\s*([-+]?(?:\d+\.?\d*|\.\d+))\s*,\s*([-+]?(?:\d+\.?\d*|\.\d+))\s*$)");
    return pattern;
}

const std::regex& hemisphereCoordinatePattern() {
    static const std::regex pattern(
        R"(^\s*(\d+(?:\.\d+)?)\s*(?:°)?\s*([NSns])\s*,\s*(\d+(?:\.\d+)?)\s*(?:°)?\s*([EWew])\s*$)");
    return pattern;
}

std::string trim(const std::string& text) {
    const char* whitespace = " \t\r\n";
    size_t begin = text.find_first_not_of(whitespace);
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(whitespace);
    return text.substr(begin, end - begin + 1);
}

double toDegrees(const std::string& text, const std::string& token) {
    try {
        return std::stod(text);
    } catch (const std::out_of_range&) {
        throw InvalidLocationError("Coordinate value out of range: '" + token + "'");
    }
}

Coordinate checkedCoordinate(double lat, double lon, const std::string& token) {
    if (!isValidCoordinate(lat, lon)) {
        throw InvalidLocationError("Coordinates out of range (lat must be in [-90, 90], "
                                   "lon in [-180, 180]): '" + token + "'");
    }
    return Coordinate{lat, lon};
}

bool isAllDigits(const std::string& text) {
    return !text.empty() && std::all_of(text.begin(), text.end(), [](unsigned char c) {
        return std::isdigit(c) != 0;
    });
}

bool isShortAlphanumeric(const std::string& text) {
    if (text.empty() || text.size() > MAX_SHORT_IDENTIFIER_LENGTH) {
        return false;
    }
    bool has_alnum = false;
    for (unsigned char c : text) {
        if (c == ' ') {
            continue;
        }
        if (!std::isalnum(c)) {
            return false;
        }
        has_alnum = true;
    }
    return has_alnum;
}

} // namespace

const char* locationKindName(LocationKind kind) {
    switch (kind) {
        case LocationKind::Coordinate: return "coordinate";
        case LocationKind::Identifier: return "identifier";
        case LocationKind::Address: return "address";
    }
    return "unknown";
}

LocationKind kindOf(const Location& location) {
    if (std::holds_alternative<Coordinate>(location)) {
        return LocationKind::Coordinate;
    }
    if (std::holds_alternative<FacilityRef>(location)) {
        return LocationKind::Identifier;
    }
    return LocationKind::Address;
}

std::optional<Coordinate> parseCoordinateLiteral(const std::string& token) {
    std::smatch match;

    if (std::regex_match(token, match, plainCoordinatePattern())) {
        double lat = toDegrees(match[1].str(), token);
        double lon = toDegrees(match[2].str(), token);
        return checkedCoordinate(lat, lon, token);
    }

    if (std::regex_match(token, match, hemisphereCoordinatePattern())) {
        double lat = toDegrees(match[1].str(), token);
        double lon = toDegrees(match[3].str(), token);
        if (std::toupper(static_cast<unsigned char>(match[2].str()[0])) == 'S') {
            lat = -lat;
        }
        if (std::toupper(static_cast<unsigned char>(match[4].str()[0])) == 'W') {
            lon = -lon;
        }
        return checkedCoordinate(lat, lon, token);
    }

    return std::nullopt;
}

LocationKind classifyLocation(const std::string& token, const FacilityLookup& facilities) {
    std::string text = trim(token);
    if (text.empty()) {
        throw InvalidLocationError("Location must not be empty");
    }

    if (parseCoordinateLiteral(text)) {
        return LocationKind::Coordinate;
    }

    if (isAllDigits(text)) {
        return LocationKind::Identifier;
    }

    if (isShortAlphanumeric(text) && facilities.lookupById(text)) {
        return LocationKind::Identifier;
    }

    return LocationKind::Address;
}

Location resolveLocationFormat(const std::string& token, const FacilityLookup& facilities) {
    std::string text = trim(token);

    switch (classifyLocation(text, facilities)) {
        case LocationKind::Coordinate:
            return *parseCoordinateLiteral(text);
        case LocationKind::Identifier:
            return FacilityRef{text};
        case LocationKind::Address:
            break;
    }
    return AddressText{text};
}

bool isPlausibleAddress(const std::string& text) {
    std::string address = trim(text);
    if (address.size() < 5 || address.size() > 200) {
        return false;
    }

    // Bytes >= 0x80 belong to multi-byte UTF-8 letters such as æ, ø, å
    bool has_letter = std::any_of(address.begin(), address.end(), [](unsigned char c) {
        return std::isalpha(c) != 0 || c >= 0x80;
    });
    bool has_digit = std::any_of(address.begin(), address.end(), [](unsigned char c) {
        return std::isdigit(c) != 0;
    });
    return has_letter && has_digit;
}
