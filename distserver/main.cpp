#include <string>
#include <iostream>
#include <memory>
#include "server_config.hpp"
#include "distance_service.hpp"
#include "geo_provider_client.hpp"
#include "distance_resolver.hpp"
#include "facility_directory.hpp"
#include <grpcpp/server_builder.h>
#include <grpcpp/server.h>

using ::grpc::ServerBuilder;
using ::grpc::Server;

int RunServer(const ServerConfig& config) {
    GeocodeCache geocode_cache(config.geocode_cache_size);
    RouteCache route_cache(config.route_cache_size);

    FacilityDirectory facilities(defaultFacilities());
    if (!config.facility_file.empty()) {
        facilities.loadFromFile(config.facility_file);
    }
    std::cout << "[INFO] Facility table holds " << facilities.size() << " entries\n";

    std::unique_ptr<GrpcGeoProvider> provider;
    if (!config.provider_addr.empty()) {
        provider = std::make_unique<GrpcGeoProvider>(
            grpc::CreateChannel(config.provider_addr, grpc::InsecureChannelCredentials()));
        std::cout << "[INFO] Using GeoProvider at " << config.provider_addr << "\n";
    } else {
        std::cerr << "[WARNING] No GeoProvider configured; only coordinates resolve and "
                  << "distances are geodesic\n";
    }

    DistanceResolver resolver(&geocode_cache, &route_cache, &facilities,
                              provider.get(), provider.get(),
                              makeResolverOptions(config));
    DistanceServiceImpl service(&resolver);

    ServerBuilder server_builder;
    server_builder.AddListeningPort(config.listen_addr, grpc::InsecureServerCredentials());
    server_builder.RegisterService(&service);

    std::unique_ptr<Server> server{server_builder.BuildAndStart()};
    if (!server) {
        std::cerr << "[ERROR] Failed to start server on " << config.listen_addr << "\n";
        return 1;
    }

    std::cout << "[INFO] Distance server listening on " << config.listen_addr << "\n";
    server->Wait();
    return 0;
}

int main(int argc, char* argv[]) {
    try {
        auto config = parseServerArgs(argc, argv, std::cout);
        if (!config) {
            return 0;
        }
        return RunServer(*config);
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 1;
    }
}
