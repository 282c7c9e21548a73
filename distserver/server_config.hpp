#pragma once

#include "distance_resolver.hpp"
#include <string>
#include <optional>
#include <ostream>
#include <cstdint>

struct ServerConfig {
    std::string listen_addr = "0.0.0.0:50061";
    std::string provider_addr = "localhost:50062";  // empty: no provider, geodesic only
    size_t geocode_cache_size = 1000;
    size_t route_cache_size = 1000;
    int request_timeout_seconds = 10;
    int route_attempts = 3;
    int geocode_attempts = 2;
    int64_t initial_delay_ms = 1000;
    int64_t max_delay_ms = 60000;
    std::string country_hint = "Denmark";
    std::string facility_file;
    bool parallel_geocoding = true;
};

void printServerUsage(const std::string& program, std::ostream& out);

// Returns nullopt after printing usage for --help. Throws
// std::invalid_argument for unknown options, missing or malformed values.
std::optional<ServerConfig> parseServerArgs(int argc, char* argv[], std::ostream& out);

ResolverOptions makeResolverOptions(const ServerConfig& config);
