#ifndef CONFIG_HPP
#define CONFIG_HPP

#include "types.hpp"
#include <string>
#include <vector>

// Parameters of the network build pipeline.
struct BuildParams {
  std::string inputPath;
  std::string outputPath;
  int minChargers = DEFAULT_MIN_CHARGERS;
  double evRangeKm = DEFAULT_EV_RANGE_KM;
  double clusterDiameterKm = DEFAULT_CLUSTER_DIAMETER_KM;
  bool assumeYes = false; // skip the confirmation prompt
};

// Server settings, read from CHARGENET_NETWORK_PATH and
// CHARGENET_LISTEN_ADDRESS.
struct ServerConfig {
  std::string networkPath = DEFAULT_NETWORK_PATH;
  std::string listenAddress = DEFAULT_LISTEN_ADDRESS;
};

// Usage: <input.csv> <output.json> [--min-chargers N] [--ev-range-km KM]
//        [--cluster-diameter-km KM] [--yes]
// Throws std::invalid_argument on bad or missing arguments.
BuildParams parseBuildParams(const std::vector<std::string> &args);

ServerConfig loadServerConfig();

#endif // CONFIG_HPP
