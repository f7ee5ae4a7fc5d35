#include "network_builder.hpp"
#include "cluster_tree.hpp"
#include "errors.hpp"
#include <iostream>

NetworkBuilder::NetworkBuilder(RoutingOracle &oracle, ConfirmBatch confirm)
    : oracle_(oracle), confirm_(std::move(confirm)) {}

LegResolution
NetworkBuilder::resolveLegs(const std::vector<UnresolvedLeg> &candidates) {
  LegResolution result;
  if (candidates.empty())
    return result;

  if (!confirm_ || !confirm_(candidates.size()))
    throw BatchDeclined(candidates.size());

  result.legs.reserve(candidates.size());
  for (const auto &candidate : candidates) {
    try {
      Directions directions = oracle_.directions(
          {candidate.endpoints.first->coord, candidate.endpoints.second->coord});
      if (directions.legs.size() != 1)
        throw OracleFailure("expected 1 leg, got " +
                            std::to_string(directions.legs.size()));

      const DrivingLeg &measured = directions.legs.front();
      result.legs.emplace_back(candidate, measured.drivingDistance,
                               measured.drivingTime);
      result.resolved++;
    } catch (const OracleFailure &e) {
      std::cerr << "[Builder] Dropping leg: " << e.what() << std::endl;
      result.failed++;
    }
  }

  std::cout << "[Builder] Successfully completed " << result.resolved << "/"
            << candidates.size() << " legs." << std::endl;
  return result;
}

ChargeNetwork NetworkBuilder::buildSimplified(const ChargeNetwork &full,
                                              double maxClusterDiameter,
                                              BuildSummary *summary) {
  BuildSummary stats;
  stats.inputStations = full.stationCount();

  ChargeNetwork simplified(full.minChargersAtStation(), full.evRange());
  if (full.stationCount() == 0) {
    if (summary)
      *summary = stats;
    return simplified;
  }

  ClusterTree tree(full.stations(), maxClusterDiameter);
  for (const auto &centroid : tree.finalCentroids())
    simplified.addStation(centroid);
  stats.clusters = simplified.stationCount();

  auto candidates = simplified.candidateLegs();
  stats.candidateLegs = candidates.size();

  LegResolution resolution = resolveLegs(candidates);
  stats.resolvedLegs = resolution.resolved;
  stats.failedLegs = resolution.failed;
  stats.committedLegs = simplified.commitLegs(resolution.legs);

  std::cout << "[Builder] Network has " << simplified.stationCount()
            << " charge stations (from " << stats.inputStations << ") and "
            << simplified.legCount() << " legs." << std::endl;

  if (summary)
    *summary = stats;
  return simplified;
}
