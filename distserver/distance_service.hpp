#pragma once

#include "distance_resolver.hpp"
#include "routedist.grpc.pb.h"
#include <grpcpp/grpcpp.h>

// INVALID_ARGUMENT, NOT_FOUND or FAILED_PRECONDITION with the error text
grpc::Status statusFromResolutionError(const ResolutionError& error);

class DistanceServiceImpl final : public routedist::DistanceService::Service {
private:
    DistanceResolver* theResolver;

public:
    explicit DistanceServiceImpl(DistanceResolver* aResolver);

    grpc::Status ResolveDistance(grpc::ServerContext* context,
                                 const routedist::DistanceRequest* request,
                                 routedist::DistanceReply* response) override;

    grpc::Status ResolveBatch(grpc::ServerContext* context,
                              const routedist::BatchRequest* request,
                              routedist::BatchReply* response) override;

    grpc::Status ResolveLocation(grpc::ServerContext* context,
                                 const routedist::LocationRequest* request,
                                 routedist::LocationReply* response) override;

    grpc::Status WarmCache(grpc::ServerContext* context,
                           const routedist::WarmCacheRequest* request,
                           routedist::WarmCacheReply* response) override;

    grpc::Status GetCacheStats(grpc::ServerContext* context,
                               const routedist::CacheStatsRequest* request,
                               routedist::CacheStatsReply* response) override;

    grpc::Status ClearCaches(grpc::ServerContext* context,
                             const routedist::ClearCachesRequest* request,
                             routedist::Ack* response) override;
};
