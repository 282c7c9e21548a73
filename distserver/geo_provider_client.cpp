#include "geo_provider_client.hpp"

namespace {

std::string upstreamStatus(const grpc::ClientContext& context) {
    const auto& trailers = context.GetServerTrailingMetadata();
    auto it = trailers.find(UPSTREAM_STATUS_KEY);
    if (it == trailers.end()) {
        return "";
    }
    return std::string(it->second.data(), it->second.length());
}

void setDeadline(grpc::ClientContext& context, std::chrono::milliseconds timeout) {
    context.set_deadline(std::chrono::system_clock::now() + timeout);
}

routedist::LatLon toLatLon(const Coordinate& c) {
    routedist::LatLon result;
    result.set_lat(c.lat);
    result.set_lon(c.lon);
    return result;
}

} // namespace

ServiceError serviceErrorFromStatus(const grpc::Status& status, const std::string& upstream_status) {
    const std::string message = status.error_message().empty()
        ? "provider call failed (gRPC code " + std::to_string(static_cast<int>(status.error_code())) + ")"
        : status.error_message();

    if (!upstream_status.empty()) {
        try {
            int http_status = std::stoi(upstream_status);
            if (http_status >= 400) {
                return ServiceError(FailureKind::HttpStatus, http_status, message);
            }
        } catch (const std::exception&) {
            // Not a number; fall back to the gRPC code
        }
    }

    switch (status.error_code()) {
        case grpc::StatusCode::DEADLINE_EXCEEDED:
            return ServiceError(FailureKind::Timeout, 0, message);
        case grpc::StatusCode::RESOURCE_EXHAUSTED:
            return ServiceError(FailureKind::HttpStatus, 429, message);
        case grpc::StatusCode::UNAVAILABLE:
            return ServiceError(FailureKind::HttpStatus, 503, message);
        default:
            return ServiceError(FailureKind::HttpStatus, 500, message);
    }
}

GrpcGeoProvider::GrpcGeoProvider(std::shared_ptr<grpc::ChannelInterface> aChannel)
    : theStub(routedist::GeoProvider::NewStub(aChannel)) {
}

std::optional<Coordinate> GrpcGeoProvider::geocode(const std::string& address,
                                                   std::chrono::milliseconds timeout) {
    routedist::GeocodeRequest request;
    request.set_address(address);

    routedist::GeocodeReply reply;
    grpc::ClientContext context;
    setDeadline(context, timeout);

    grpc::Status status = theStub->Geocode(&context, request, &reply);
    if (!status.ok()) {
        throw serviceErrorFromStatus(status, upstreamStatus(context));
    }

    if (!reply.found() || !reply.has_position()) {
        return std::nullopt;
    }
    return Coordinate{reply.position().lat(), reply.position().lon()};
}

std::optional<double> GrpcGeoProvider::route(const Coordinate& from, const Coordinate& to,
                                             std::chrono::milliseconds timeout) {
    routedist::RouteRequest request;
    *request.mutable_origin() = toLatLon(from);
    *request.mutable_destination() = toLatLon(to);

    routedist::RouteReply reply;
    grpc::ClientContext context;
    setDeadline(context, timeout);

    grpc::Status status = theStub->Route(&context, request, &reply);
    if (!status.ok()) {
        throw serviceErrorFromStatus(status, upstreamStatus(context));
    }

    if (!reply.found()) {
        return std::nullopt;
    }
    return reply.distance_km();
}
