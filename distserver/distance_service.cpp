#include "distance_service.hpp"
#include <iostream>

using grpc::Status;
using grpc::ServerContext;

namespace {

routedist::LocationKind toProto(LocationKind kind) {
    switch (kind) {
        case LocationKind::Coordinate: return routedist::LOCATION_COORDINATE;
        case LocationKind::Identifier: return routedist::LOCATION_IDENTIFIER;
        case LocationKind::Address: break;
    }
    return routedist::LOCATION_ADDRESS;
}

routedist::DistanceSource toProto(DistanceSource source) {
    switch (source) {
        case DistanceSource::Routed: return routedist::SOURCE_ROUTED;
        case DistanceSource::Geodesic: return routedist::SOURCE_GEODESIC;
        case DistanceSource::Cached: break;
    }
    return routedist::SOURCE_CACHED;
}

void fillLocation(const ResolvedLocation& location, routedist::ResolvedLocation* out) {
    out->set_input(location.input);
    out->set_kind(toProto(location.kind));
    out->mutable_position()->set_lat(location.position.lat);
    out->mutable_position()->set_lon(location.position.lon);
    out->set_facility_name(location.facility_name);
    out->set_address(location.address);
}

void fillStats(const CacheStats& stats, routedist::CacheStats* out) {
    out->set_size(stats.size);
    out->set_capacity(stats.capacity);
    out->set_hits(stats.hits);
    out->set_misses(stats.misses);
    out->set_total_requests(stats.total_requests);
    out->set_hit_rate_percent(stats.hit_rate_percent);
    out->set_uptime_seconds(stats.uptime_seconds);
}

Status internalError(const std::string& rpc, const std::exception& e) {
    std::cerr << "[ERROR] " << rpc << " failed unexpectedly: " << e.what() << "\n";
    return Status(grpc::StatusCode::INTERNAL, e.what());
}

} // namespace

grpc::Status statusFromResolutionError(const ResolutionError& error) {
    switch (error.kind()) {
        case ResolutionFailure::InvalidInput:
            return Status(grpc::StatusCode::INVALID_ARGUMENT, error.what());
        case ResolutionFailure::GeocodingFailed:
            return Status(grpc::StatusCode::NOT_FOUND, error.what());
        case ResolutionFailure::NoDistance:
            break;
    }
    return Status(grpc::StatusCode::FAILED_PRECONDITION, error.what());
}

DistanceServiceImpl::DistanceServiceImpl(DistanceResolver* aResolver) : theResolver(aResolver) {
}

Status DistanceServiceImpl::ResolveDistance(ServerContext* context,
                                            const routedist::DistanceRequest* request,
                                            routedist::DistanceReply* response) {
    try {
        DistanceResult result = theResolver->resolveDistance(request->origin(), request->destination());

        response->set_distance_km(result.distance_km);
        response->set_source(toProto(result.source));
        fillLocation(result.origin, response->mutable_origin());
        fillLocation(result.destination, response->mutable_destination());
        return Status::OK;
    } catch (const ResolutionError& e) {
        return statusFromResolutionError(e);
    } catch (const std::exception& e) {
        return internalError("ResolveDistance", e);
    }
}

Status DistanceServiceImpl::ResolveBatch(ServerContext* context,
                                         const routedist::BatchRequest* request,
                                         routedist::BatchReply* response) {
    std::vector<RouteQuery> routes;
    routes.reserve(request->routes_size());
    for (const auto& route : request->routes()) {
        routes.push_back(RouteQuery{route.route_id(), route.origin(), route.destination()});
    }

    try {
        BatchSummary summary = theResolver->resolveBatch(routes);

        for (const auto& outcome : summary.outcomes) {
            auto* out = response->add_outcomes();
            out->set_route_id(outcome.route_id);
            out->set_ok(outcome.result.has_value());
            if (outcome.result.has_value()) {
                out->set_distance_km(outcome.result->distance_km);
                out->set_source(toProto(outcome.result->source));
            } else {
                out->set_error(outcome.error);
            }
        }
        response->set_successful(summary.successful);
        response->set_failed(summary.failed);
        return Status::OK;
    } catch (const std::exception& e) {
        return internalError("ResolveBatch", e);
    }
}

Status DistanceServiceImpl::ResolveLocation(ServerContext* context,
                                            const routedist::LocationRequest* request,
                                            routedist::LocationReply* response) {
    try {
        ResolvedLocation location = theResolver->resolveLocation(request->token());
        fillLocation(location, response->mutable_location());
        return Status::OK;
    } catch (const ResolutionError& e) {
        return statusFromResolutionError(e);
    } catch (const std::exception& e) {
        return internalError("ResolveLocation", e);
    }
}

Status DistanceServiceImpl::WarmCache(ServerContext* context,
                                      const routedist::WarmCacheRequest* request,
                                      routedist::WarmCacheReply* response) {
    std::vector<std::string> tokens(request->tokens().begin(), request->tokens().end());

    try {
        WarmupSummary summary = theResolver->warmCache(tokens);
        response->set_processed(summary.processed);
        response->set_geocoded(summary.geocoded);
        response->set_failed(summary.failed);
        return Status::OK;
    } catch (const std::exception& e) {
        return internalError("WarmCache", e);
    }
}

Status DistanceServiceImpl::GetCacheStats(ServerContext* context,
                                          const routedist::CacheStatsRequest* request,
                                          routedist::CacheStatsReply* response) {
    ResolverCacheStats stats = theResolver->cacheStats();
    fillStats(stats.geocode, response->mutable_geocode());
    fillStats(stats.route, response->mutable_route());
    return Status::OK;
}

Status DistanceServiceImpl::ClearCaches(ServerContext* context,
                                        const routedist::ClearCachesRequest* request,
                                        routedist::Ack* response) {
    theResolver->clearCaches();
    response->set_ok(true);
    response->set_message("All caches cleared");
    return Status::OK;
}
