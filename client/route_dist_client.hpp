#pragma once

#include <string>
#include <vector>
#include <optional>
#include <ostream>
#include <iostream>
#include "routedist.grpc.pb.h"

class RouteDistClient {
private:
    routedist::DistanceService::Stub theStub;
    std::ostream& out;

public:
    RouteDistClient(std::shared_ptr<grpc::ChannelInterface> aChannel, std::ostream& anOut = std::cout);

    std::optional<routedist::DistanceReply> ResolveDistance(const std::string& origin,
                                                            const std::string& destination);

    std::optional<routedist::BatchReply> ResolveBatch(const std::vector<routedist::RouteEntry>& routes);

    // Reads "route_id;origin;destination" lines and resolves them as one batch
    std::optional<routedist::BatchReply> ResolveBatchFile(const std::string& fileName);

    std::optional<routedist::LocationReply> ResolveLocation(const std::string& token);

    std::optional<routedist::WarmCacheReply> WarmCache(const std::vector<std::string>& tokens);

    std::optional<routedist::CacheStatsReply> ShowStats();

    bool ClearCaches();

    // Executes one REPL line. Returns false when the user asked to exit.
    bool RunCommand(const std::string& line);
};
