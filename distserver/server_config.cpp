#include "server_config.hpp"
#include <stdexcept>
#include <limits>

namespace {

constexpr int64_t MAX_TIMEOUT_SECONDS = 3600;
constexpr int64_t MAX_ATTEMPTS = 100;
constexpr int64_t MAX_DELAY_MS = 3600 * 1000;

int64_t parseNumber(const std::string& option, const std::string& value, int64_t minimum,
                    int64_t maximum = std::numeric_limits<int64_t>::max()) {
    size_t consumed = 0;
    int64_t number = 0;
    try {
        number = std::stoll(value, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid value for " + option + ": '" + value + "'");
    }
    if (consumed != value.size()) {
        throw std::invalid_argument("Invalid value for " + option + ": '" + value + "'");
    }
    if (number < minimum) {
        throw std::invalid_argument(option + " must be at least " + std::to_string(minimum));
    }
    if (number > maximum) {
        throw std::invalid_argument(option + " must be at most " + std::to_string(maximum));
    }
    return number;
}

} // namespace

void printServerUsage(const std::string& program, std::ostream& out) {
    out << "Usage: " << program << " [options]\n"
        << "Options:\n"
        << "  --listen-addr <addr>         Listen address (default: 0.0.0.0:50061)\n"
        << "  --provider-addr <addr>       GeoProvider address, empty for geodesic only (default: localhost:50062)\n"
        << "  --geocode-cache-size <n>     Geocode cache capacity (default: 1000)\n"
        << "  --route-cache-size <n>       Route cache capacity (default: 1000)\n"
        << "  --request-timeout <seconds>  Timeout per provider call, at most 3600 (default: 10)\n"
        << "  --route-attempts <n>         Routing attempts before geodesic fallback, at most 100 (default: 3)\n"
        << "  --geocode-attempts <n>       Geocoding attempts, at most 100 (default: 2)\n"
        << "  --initial-delay <ms>         First retry delay, at most 3600000 (default: 1000)\n"
        << "  --max-delay <ms>             Retry delay cap, at most 3600000 (default: 60000)\n"
        << "  --country-hint <name>        Country appended to addresses, empty disables (default: Denmark)\n"
        << "  --facilities <file>          Facility table, one id;name;address per line\n"
        << "  --sequential-geocoding       Geocode origin and destination one after the other\n"
        << "  --help                       Show this help message\n";
}

std::optional<ServerConfig> parseServerArgs(int argc, char* argv[], std::ostream& out) {
    ServerConfig config;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--help") {
            printServerUsage(argv[0], out);
            return std::nullopt;
        }
        if (arg == "--sequential-geocoding") {
            config.parallel_geocoding = false;
            continue;
        }

        if (i + 1 >= argc) {
            throw std::invalid_argument("Missing value for " + arg);
        }
        std::string value = argv[++i];

        if (arg == "--listen-addr") {
            config.listen_addr = value;
        } else if (arg == "--provider-addr") {
            config.provider_addr = value;
        } else if (arg == "--geocode-cache-size") {
            config.geocode_cache_size = static_cast<size_t>(parseNumber(arg, value, 1));
        } else if (arg == "--route-cache-size") {
            config.route_cache_size = static_cast<size_t>(parseNumber(arg, value, 1));
        } else if (arg == "--request-timeout") {
            config.request_timeout_seconds = static_cast<int>(parseNumber(arg, value, 1, MAX_TIMEOUT_SECONDS));
        } else if (arg == "--route-attempts") {
            config.route_attempts = static_cast<int>(parseNumber(arg, value, 1, MAX_ATTEMPTS));
        } else if (arg == "--geocode-attempts") {
            config.geocode_attempts = static_cast<int>(parseNumber(arg, value, 1, MAX_ATTEMPTS));
        } else if (arg == "--initial-delay") {
            config.initial_delay_ms = parseNumber(arg, value, 0, MAX_DELAY_MS);
        } else if (arg == "--max-delay") {
            config.max_delay_ms = parseNumber(arg, value, 0, MAX_DELAY_MS);
        } else if (arg == "--country-hint") {
            config.country_hint = value;
        } else if (arg == "--facilities") {
            config.facility_file = value;
        } else {
            throw std::invalid_argument("Unknown option: " + arg);
        }
    }

    if (config.initial_delay_ms > config.max_delay_ms) {
        throw std::invalid_argument("--initial-delay must not exceed --max-delay");
    }
    return config;
}

ResolverOptions makeResolverOptions(const ServerConfig& config) {
    ResolverOptions options;
    options.request_timeout = std::chrono::seconds(config.request_timeout_seconds);

    options.routing_retry.max_attempts = config.route_attempts;
    options.routing_retry.initial_delay = std::chrono::milliseconds(config.initial_delay_ms);
    options.routing_retry.max_delay = std::chrono::milliseconds(config.max_delay_ms);

    options.geocoding_retry.max_attempts = config.geocode_attempts;
    options.geocoding_retry.initial_delay = std::chrono::milliseconds(config.initial_delay_ms);
    options.geocoding_retry.max_delay = std::chrono::milliseconds(config.max_delay_ms);

    options.country_hint = config.country_hint;
    options.parallel_geocoding = config.parallel_geocoding;
    return options;
}
