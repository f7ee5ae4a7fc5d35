#ifndef NETWORK_BUILDER_HPP
#define NETWORK_BUILDER_HPP

#include "charge_network.hpp"
#include "routing_oracle.hpp"
#include <functional>
#include <vector>

// Asked once before a batch of `calls` oracle requests; false aborts it.
using ConfirmBatch = std::function<bool(size_t calls)>;

struct LegResolution {
  std::vector<Leg> legs;
  size_t resolved = 0;
  size_t failed = 0; // dropped after an oracle failure
};

struct BuildSummary {
  size_t inputStations = 0;
  size_t clusters = 0;
  size_t candidateLegs = 0;
  size_t resolvedLegs = 0;
  size_t failedLegs = 0;
  size_t committedLegs = 0;
};

// Turns a dense station network into a sparse routable one:
// cluster -> candidate legs -> routing oracle -> commit.
class NetworkBuilder {
public:
  NetworkBuilder(RoutingOracle &oracle, ConfirmBatch confirm);

  // One oracle call per candidate. A leg whose call fails is dropped and
  // counted; nothing is retried. Throws BatchDeclined if not confirmed.
  LegResolution resolveLegs(const std::vector<UnresolvedLeg> &candidates);

  // A new network over the cluster centroids of `full`, with the same
  // min_chargers_at_station and ev_range, and every admissible leg.
  ChargeNetwork buildSimplified(const ChargeNetwork &full,
                                double maxClusterDiameter,
                                BuildSummary *summary = nullptr);

private:
  RoutingOracle &oracle_;
  ConfirmBatch confirm_;
};

#endif // NETWORK_BUILDER_HPP
