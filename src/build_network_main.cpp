#include <iostream>
#include <string>
#include <vector>

#include "config.hpp"
#include "errors.hpp"
#include "network_builder.hpp"
#include "network_store.hpp"
#include "station_loader.hpp"

namespace {
bool promptForBatch(size_t calls) {
  std::cout << "You are about to make " << calls
            << " calls to the routing oracle (Y/N): " << std::flush;
  std::string answer;
  std::getline(std::cin, answer);
  return answer == "Y" || answer == "y";
}

void printUsage(const char *program) {
  std::cerr << "Usage: " << program
            << " <stations.csv> <network.json> [--min-chargers N]"
               " [--ev-range-km KM] [--cluster-diameter-km KM] [--yes]"
            << std::endl;
}
} // namespace

int main(int argc, char **argv) {
  BuildParams params;
  try {
    params = parseBuildParams(std::vector<std::string>(argv + 1, argv + argc));
  } catch (const std::invalid_argument &e) {
    std::cerr << e.what() << std::endl;
    printUsage(argv[0]);
    return 2;
  }

  try {
    ChargeNetwork full(params.minChargers, params.evRangeKm * 1000.0);
    loadStationsFromCsv(full, params.inputPath);

    EstimatedRoutingOracle oracle;
    ConfirmBatch confirm = params.assumeYes
                               ? ConfirmBatch([](size_t) { return true; })
                               : ConfirmBatch(promptForBatch);
    NetworkBuilder builder(oracle, confirm);

    BuildSummary summary;
    ChargeNetwork simplified =
        builder.buildSimplified(full, params.clusterDiameterKm, &summary);
    if (summary.failedLegs > 0)
      std::cerr << "[Builder] " << summary.failedLegs
                << " legs were dropped after routing failures." << std::endl;

    NetworkStore::ExportToFile(simplified, params.outputPath);
  } catch (const BatchDeclined &e) {
    std::cerr << "Aborted: " << e.what() << std::endl;
    return 1;
  } catch (const ChargeNetError &e) {
    std::cerr << "Failed to build network: " << e.what() << std::endl;
    return 1;
  } catch (const std::runtime_error &e) {
    std::cerr << "Failed to build network: " << e.what() << std::endl;
    return 1;
  }
  return 0;
}
