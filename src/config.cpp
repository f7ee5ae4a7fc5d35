#include "config.hpp"
#include <cstdlib>
#include <stdexcept>

namespace {
double parseNumber(const std::string &flag, const std::string &value) {
  std::string message = flag + " expects a number, got '" + value + "'";
  size_t used = 0;
  double result = 0;
  try {
    result = std::stod(value, &used);
  } catch (const std::logic_error &) {
    throw std::invalid_argument(message);
  }
  if (used != value.size())
    throw std::invalid_argument(message);
  return result;
}
} // namespace

BuildParams parseBuildParams(const std::vector<std::string> &args) {
  BuildParams params;
  std::vector<std::string> positional;

  for (size_t i = 0; i < args.size(); ++i) {
    const std::string &arg = args[i];
    if (arg == "--yes") {
      params.assumeYes = true;
      continue;
    }
    if (arg.rfind("--", 0) != 0) {
      positional.push_back(arg);
      continue;
    }
    if (i + 1 >= args.size())
      throw std::invalid_argument(arg + " needs a value");

    const std::string &value = args[++i];
    if (arg == "--min-chargers")
      params.minChargers = (int)parseNumber(arg, value);
    else if (arg == "--ev-range-km")
      params.evRangeKm = parseNumber(arg, value);
    else if (arg == "--cluster-diameter-km")
      params.clusterDiameterKm = parseNumber(arg, value);
    else
      throw std::invalid_argument("unknown option " + arg);
  }

  if (positional.size() != 2)
    throw std::invalid_argument("expected <input.csv> <output.json>");
  params.inputPath = positional[0];
  params.outputPath = positional[1];

  if (params.minChargers < 0)
    throw std::invalid_argument("--min-chargers must be >= 0");
  if (!(params.evRangeKm > 0))
    throw std::invalid_argument("--ev-range-km must be positive");
  if (!(params.clusterDiameterKm >= 0))
    throw std::invalid_argument("--cluster-diameter-km must be >= 0");
  return params;
}

ServerConfig loadServerConfig() {
  ServerConfig config;
  if (const char *env_p = std::getenv("CHARGENET_NETWORK_PATH"))
    config.networkPath = env_p;
  if (const char *env_p = std::getenv("CHARGENET_LISTEN_ADDRESS"))
    config.listenAddress = env_p;
  return config;
}
