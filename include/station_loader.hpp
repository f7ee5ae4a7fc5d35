#ifndef STATION_LOADER_HPP
#define STATION_LOADER_HPP

#include "charge_network.hpp"
#include <string>
#include <vector>

std::vector<std::string> parseCSVLine(const std::string &rawLine);

// Column layout of the Alternative Fuels Data Center station export.
namespace afdc {
const size_t NAME = 1;
const size_t ADDRESS = 2;
const size_t PHONE = 8;
const size_t HOURS = 12;
const size_t DC_FAST_COUNT = 19;
const size_t LATITUDE = 24;
const size_t LONGITUDE = 25;
const size_t OPEN_DATE = 32;
const size_t MIN_COLUMNS = OPEN_DATE + 1;
} // namespace afdc

struct LoadSummary {
  size_t loaded = 0;
  size_t filtered = 0; // fewer DC fast chargers than required
  size_t skipped = 0;  // malformed rows
};

// Adds every station with at least network.minChargersAtStation() DC fast
// chargers. The first line is a header. Throws std::runtime_error if the
// file cannot be opened.
LoadSummary loadStationsFromCsv(ChargeNetwork &network,
                                const std::string &filepath);

#endif // STATION_LOADER_HPP
