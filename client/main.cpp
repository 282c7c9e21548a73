#include <string>
#include <iostream>
#include "route_dist_client.hpp"
#include "routedist.grpc.pb.h"
#include <grpcpp/grpcpp.h>

void RunClient(const std::string& address) {
    std::shared_ptr<grpc::ChannelInterface> channel{
        grpc::CreateChannel(address, grpc::InsecureChannelCredentials())
    };

    RouteDistClient client{channel};

    std::cout << "RouteDist Client Started\n";
    std::cout << "Commands:\n";
    std::cout << "  distance <origin> | <destination>\n";
    std::cout << "  batch <route_file>\n";
    std::cout << "  locate <location>\n";
    std::cout << "  warm <location> | <location> ...\n";
    std::cout << "  stats\n";
    std::cout << "  clear\n";
    std::cout << "  exit\n";

    std::string line;
    while (true) {
        std::cout << "> ";
        if (!std::getline(std::cin, line)) {
            break;
        }
        if (!client.RunCommand(line)) {
            break;
        }
    }
}

int main(int argc, char* argv[]) {
    std::string server_addr = "localhost:50061";

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--server-addr" && i + 1 < argc) {
            server_addr = argv[++i];
        } else if (arg == "--help") {
            std::cout << "Usage: " << argv[0] << " [--server-addr <addr>]\n";
            return 0;
        } else {
            std::cerr << "[ERROR] Unknown option: " << arg << "\n";
            return 1;
        }
    }

    RunClient(server_addr);
    return 0;
}
