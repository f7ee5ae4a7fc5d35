#include <iostream>
#include <string>

#include "config.hpp"
#include "errors.hpp"
#include "network_store.hpp"
#include "routing_oracle.hpp"
#include "service_impl.hpp"
#include <grpcpp/grpcpp.h>

using grpc::Server;
using grpc::ServerBuilder;

int RunServer() {
  ServerConfig config = loadServerConfig();

  ChargeNetwork network(0, 0);
  try {
    network = NetworkStore::ImportFromFile(config.networkPath);
  } catch (const ChargeNetError &e) {
    std::cerr << "Failed to load charge network: " << e.what() << std::endl;
    std::cerr << "Ensure CHARGENET_NETWORK_PATH points to a JSON file "
                 "exported by chargenet_build."
              << std::endl;
    return 1;
  }

  if (network.stationCount() == 0) {
    std::cerr << "Charge network at " << config.networkPath
              << " has no charge stations." << std::endl;
    return 1;
  }

  EstimatedRoutingOracle oracle;
  ChargeRoutingServiceImpl service(network, oracle);

  ServerBuilder builder;
  builder.AddListeningPort(config.listenAddress,
                           grpc::InsecureServerCredentials());
  builder.RegisterService(&service);

  std::unique_ptr<Server> server(builder.BuildAndStart());
  if (!server) {
    std::cerr << "Failed to listen on " << config.listenAddress << std::endl;
    return 1;
  }
  std::cout << "Server listening on " << config.listenAddress << std::endl;
  std::cout << "Network loaded with " << network.stationCount()
            << " charge stations and " << network.legCount() << " legs."
            << std::endl;

  server->Wait();
  return 0;
}

int main(int argc, char **argv) { return RunServer(); }
