#include "geocode_cache.hpp"
#include <iostream>
#include <sstream>
#include <iomanip>
#include <cctype>
#include <openssl/sha.h>

namespace {

constexpr size_t MAX_PLAIN_KEY_LENGTH = 100;

// ASCII lower-casing plus the upper-case Latin-1 letters in their two-byte
// UTF-8 form (U+00C0..U+00DE except U+00D7), which covers Æ, Ø and Å.
std::string toLowerUtf8(const std::string& text) {
    std::string result = text;
    for (size_t i = 0; i < result.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(result[i]);
        if (c < 0x80) {
            result[i] = static_cast<char>(std::tolower(c));
        } else if (c == 0xC3 && i + 1 < result.size()) {
            unsigned char next = static_cast<unsigned char>(result[i + 1]);
            if (next >= 0x80 && next <= 0x9E && next != 0x97) {
                result[i + 1] = static_cast<char>(next + 0x20);
            }
            ++i;
        }
    }
    return result;
}

std::string collapseWhitespace(const std::string& text) {
    std::istringstream iss(text);
    std::string word;
    std::string result;
    while (iss >> word) {
        if (!result.empty()) {
            result += ' ';
        }
        result += word;
    }
    return result;
}

std::string sha256Hex(const std::string& text) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(text.data()), text.size(), hash);

    std::stringstream ss;
    for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return ss.str();
}

} // namespace

GeocodeCache::GeocodeCache(size_t capacity) : LruCache(capacity) {
    std::cout << "[INFO] GeocodeCache initialized with capacity " << this->capacity() << "\n";
}

std::string GeocodeCache::normalizeAddress(const std::string& address) {
    std::string normalized = collapseWhitespace(toLowerUtf8(address));
    if (normalized.size() > MAX_PLAIN_KEY_LENGTH) {
        return "addr_" + sha256Hex(normalized);
    }
    return "addr_" + normalized;
}

std::optional<Coordinate> GeocodeCache::getCoordinates(const std::string& address) {
    return get(normalizeAddress(address));
}

void GeocodeCache::setCoordinates(const std::string& address, double lat, double lon) {
    std::string key = normalizeAddress(address);
    set(key, Coordinate{lat, lon});
    std::cout << "[INFO] Geocode cache stored " << loggableKey(key) << "\n";
}
