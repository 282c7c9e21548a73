#pragma once

#include "geo_services.hpp"
#include "retry.hpp"
#include "routedist.grpc.pb.h"
#include <grpcpp/grpcpp.h>
#include <memory>
#include <string>

// Trailing metadata key a provider may use to forward the upstream HTTP status
constexpr const char* UPSTREAM_STATUS_KEY = "x-upstream-status";

// DEADLINE_EXCEEDED -> timeout, RESOURCE_EXHAUSTED -> 429, UNAVAILABLE -> 503,
// anything else -> 500. A numeric upstream status (>= 400) overrides the mapping.
ServiceError serviceErrorFromStatus(const grpc::Status& status, const std::string& upstream_status = "");

// Geocoding and routing through a GeoProvider endpoint
class GrpcGeoProvider : public GeocodingService, public RoutingService {
private:
    std::unique_ptr<routedist::GeoProvider::Stub> theStub;

public:
    explicit GrpcGeoProvider(std::shared_ptr<grpc::ChannelInterface> aChannel);

    std::optional<Coordinate> geocode(const std::string& address,
                                      std::chrono::milliseconds timeout) override;

    std::optional<double> route(const Coordinate& from, const Coordinate& to,
                                std::chrono::milliseconds timeout) override;
};
