#include "route_dist_client.hpp"
#include <sstream>
#include <iomanip>
#include <fstream>
#include <grpcpp/grpcpp.h>

namespace {

std::string trim(const std::string& text) {
    size_t begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

std::vector<std::string> splitOn(const std::string& text, char separator) {
    std::vector<std::string> parts;
    std::stringstream ss(text);
    std::string part;
    while (std::getline(ss, part, separator)) {
        part = trim(part);
        if (!part.empty()) {
            parts.push_back(part);
        }
    }
    return parts;
}

const char* sourceLabel(routedist::DistanceSource source) {
    switch (source) {
        case routedist::SOURCE_ROUTED: return "routed";
        case routedist::SOURCE_GEODESIC: return "estimate, straight line";
        case routedist::SOURCE_CACHED: return "cached";
        default: break;
    }
    return "unknown";
}

std::string describeLocation(const routedist::ResolvedLocation& location) {
    std::ostringstream ss;
    ss << std::setprecision(7) << location.position().lat() << "," << location.position().lon();
    if (!location.facility_name().empty()) {
        ss << " (" << location.facility_name() << ", " << location.address() << ")";
    } else if (!location.address().empty()) {
        ss << " (" << location.address() << ")";
    }
    return ss.str();
}

void printStats(std::ostream& out, const std::string& name, const routedist::CacheStats& stats) {
    out << "  " << name << ": " << stats.size() << "/" << stats.capacity() << " entries, "
        << stats.hits() << " hits, " << stats.misses() << " misses, "
        << std::fixed << std::setprecision(2) << stats.hit_rate_percent() << "% hit rate, up "
        << stats.uptime_seconds() << "s\n";
    out.unsetf(std::ios::fixed);
}

} // namespace

RouteDistClient::RouteDistClient(std::shared_ptr<grpc::ChannelInterface> aChannel, std::ostream& anOut)
    : theStub{aChannel}, out(anOut) {}

std::optional<routedist::DistanceReply> RouteDistClient::ResolveDistance(const std::string& origin,
                                                                         const std::string& destination) {
    routedist::DistanceRequest request;
    request.set_origin(origin);
    request.set_destination(destination);

    routedist::DistanceReply reply;
    grpc::ClientContext context;
    grpc::Status status = theStub.ResolveDistance(&context, request, &reply);

    if (!status.ok()) {
        out << "[ERROR] " << status.error_message() << "\n";
        return std::nullopt;
    }

    out << "[SUCCESS] " << std::fixed << std::setprecision(2) << reply.distance_km() << " km ("
        << sourceLabel(reply.source()) << ")\n";
    out.unsetf(std::ios::fixed);
    out << "  from: " << describeLocation(reply.origin()) << "\n";
    out << "  to:   " << describeLocation(reply.destination()) << "\n";
    return reply;
}

std::optional<routedist::BatchReply> RouteDistClient::ResolveBatch(const std::vector<routedist::RouteEntry>& routes) {
    routedist::BatchRequest request;
    for (const auto& route : routes) {
        *request.add_routes() = route;
    }

    routedist::BatchReply reply;
    grpc::ClientContext context;
    grpc::Status status = theStub.ResolveBatch(&context, request, &reply);

    if (!status.ok()) {
        out << "[ERROR] Batch failed: " << status.error_message() << "\n";
        return std::nullopt;
    }

    for (const auto& outcome : reply.outcomes()) {
        if (outcome.ok()) {
            out << "  " << outcome.route_id() << ": " << std::fixed << std::setprecision(2)
                << outcome.distance_km() << " km (" << sourceLabel(outcome.source()) << ")\n";
            out.unsetf(std::ios::fixed);
        } else {
            out << "  " << outcome.route_id() << ": failed, " << outcome.error() << "\n";
        }
    }
    out << "[SUCCESS] Batch complete: " << reply.successful() << " successful, "
        << reply.failed() << " failed\n";
    return reply;
}

std::optional<routedist::BatchReply> RouteDistClient::ResolveBatchFile(const std::string& fileName) {
    std::ifstream file(fileName);
    if (!file.is_open()) {
        out << "[ERROR] Cannot open file: " << fileName << "\n";
        return std::nullopt;
    }

    std::vector<routedist::RouteEntry> routes;
    std::string line;
    int line_number = 0;
    while (std::getline(file, line)) {
        ++line_number;
        std::string text = trim(line);
        if (text.empty() || text[0] == '#') {
            continue;
        }

        std::vector<std::string> fields;
        std::stringstream ss(text);
        std::string field;
        while (std::getline(ss, field, ';')) {
            fields.push_back(trim(field));
        }
        if (fields.size() != 3) {
            out << "[ERROR] " << fileName << ":" << line_number
                << ": expected route_id;origin;destination\n";
            return std::nullopt;
        }

        routedist::RouteEntry entry;
        entry.set_route_id(fields[0]);
        entry.set_origin(fields[1]);
        entry.set_destination(fields[2]);
        routes.push_back(std::move(entry));
    }

    return ResolveBatch(routes);
}

std::optional<routedist::LocationReply> RouteDistClient::ResolveLocation(const std::string& token) {
    routedist::LocationRequest request;
    request.set_token(token);

    routedist::LocationReply reply;
    grpc::ClientContext context;
    grpc::Status status = theStub.ResolveLocation(&context, request, &reply);

    if (!status.ok()) {
        out << "[ERROR] " << status.error_message() << "\n";
        return std::nullopt;
    }

    out << "[SUCCESS] " << describeLocation(reply.location()) << "\n";
    return reply;
}

std::optional<routedist::WarmCacheReply> RouteDistClient::WarmCache(const std::vector<std::string>& tokens) {
    routedist::WarmCacheRequest request;
    for (const auto& token : tokens) {
        request.add_tokens(token);
    }

    routedist::WarmCacheReply reply;
    grpc::ClientContext context;
    grpc::Status status = theStub.WarmCache(&context, request, &reply);

    if (!status.ok()) {
        out << "[ERROR] Warm-up failed: " << status.error_message() << "\n";
        return std::nullopt;
    }

    out << "[SUCCESS] Geocoded " << reply.geocoded() << " of " << reply.processed()
        << " locations (" << reply.failed() << " failed)\n";
    return reply;
}

std::optional<routedist::CacheStatsReply> RouteDistClient::ShowStats() {
    routedist::CacheStatsRequest request;
    routedist::CacheStatsReply reply;
    grpc::ClientContext context;
    grpc::Status status = theStub.GetCacheStats(&context, request, &reply);

    if (!status.ok()) {
        out << "[ERROR] Failed to fetch cache statistics: " << status.error_message() << "\n";
        return std::nullopt;
    }

    out << "Cache statistics:\n";
    printStats(out, "geocode", reply.geocode());
    printStats(out, "route", reply.route());
    return reply;
}

bool RouteDistClient::ClearCaches() {
    routedist::ClearCachesRequest request;
    routedist::Ack ack;
    grpc::ClientContext context;
    grpc::Status status = theStub.ClearCaches(&context, request, &ack);

    if (!status.ok() || !ack.ok()) {
        out << "[ERROR] Failed to clear caches: " << status.error_message() << "\n";
        return false;
    }

    out << "[SUCCESS] " << ack.message() << "\n";
    return true;
}

bool RouteDistClient::RunCommand(const std::string& line) {
    std::string text = trim(line);
    if (text.empty()) {
        return true;
    }

    size_t space = text.find(' ');
    std::string cmd = text.substr(0, space);
    std::string rest = space == std::string::npos ? "" : trim(text.substr(space + 1));

    if (cmd == "exit") {
        return false;
    } else if (cmd == "distance") {
        auto endpoints = splitOn(rest, '|');
        if (endpoints.size() == 2) {
            ResolveDistance(endpoints[0], endpoints[1]);
        } else {
            out << "[ERROR] Usage: distance <origin> | <destination>\n";
        }
    } else if (cmd == "batch" && !rest.empty()) {
        ResolveBatchFile(rest);
    } else if (cmd == "locate" && !rest.empty()) {
        ResolveLocation(rest);
    } else if (cmd == "warm" && !rest.empty()) {
        WarmCache(splitOn(rest, '|'));
    } else if (cmd == "stats" && rest.empty()) {
        ShowStats();
    } else if (cmd == "clear" && rest.empty()) {
        ClearCaches();
    } else {
        out << "[ERROR] Invalid command.\n";
    }
    return true;
}
