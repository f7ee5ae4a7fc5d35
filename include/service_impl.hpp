#ifndef SERVICE_IMPL_HPP
#define SERVICE_IMPL_HPP

#include "charge_network.hpp"
#include "charge_routing.grpc.pb.h"
#include "routing_oracle.hpp"
#include <grpcpp/grpcpp.h>

using chargenet::ChargeRoutingService;
using chargenet::PathRequest;
using chargenet::PathResponse;
using grpc::Server;
using grpc::ServerBuilder;
using grpc::ServerContext;
using grpc::Status;

// Serves trip plans over a network that is never mutated after load, so
// concurrent handlers share it without locking.
class ChargeRoutingServiceImpl final : public ChargeRoutingService::Service {
public:
  ChargeRoutingServiceImpl(const ChargeNetwork &network, RoutingOracle &oracle)
      : network_(network), oracle_(oracle) {}

  Status GetPath(ServerContext *context, const PathRequest *request,
                 PathResponse *reply) override;

private:
  const ChargeNetwork &network_;
  RoutingOracle &oracle_;
};

#endif // SERVICE_IMPL_HPP
