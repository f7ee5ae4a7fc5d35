#include "station_loader.hpp"
#include <fstream>
#include <iostream>
#include <stdexcept>

// --- CSV Parsing ---

std::vector<std::string> parseCSVLine(const std::string &rawLine) {
  std::string line = rawLine;
  while (!line.empty() && (line.back() == '\r' || line.back() == '\n'))
    line.pop_back();

  std::vector<std::string> cols;
  std::string field;
  bool inQuotes = false;

  for (size_t i = 0; i < line.size(); ++i) {
    char c = line[i];
    if (c == '"') {
      if (inQuotes && i + 1 < line.size() && line[i + 1] == '"') {
        field += '"'; // escaped quote
        ++i;
      } else {
        inQuotes = !inQuotes;
      }
    } else if (c == ',' && !inQuotes) {
      cols.push_back(field);
      field.clear();
    } else {
      field += c;
    }
  }
  cols.push_back(field);
  return cols;
}

namespace {
std::optional<std::string> optionalField(const std::string &value) {
  if (value.empty())
    return std::nullopt;
  return value;
}

bool parseDouble(const std::string &text, double &out) {
  try {
    size_t used = 0;
    out = std::stod(text, &used);
    return used == text.size();
  } catch (const std::logic_error &) {
    return false;
  }
}

bool parseCount(const std::string &text, int &out) {
  if (text.empty()) {
    out = 0;
    return true;
  }
  try {
    size_t used = 0;
    out = std::stoi(text, &used);
    return used == text.size();
  } catch (const std::logic_error &) {
    return false;
  }
}
} // namespace

// --- Station Loading ---

LoadSummary loadStationsFromCsv(ChargeNetwork &network,
                                const std::string &filepath) {
  std::ifstream file(filepath);
  if (!file.is_open())
    throw std::runtime_error("cannot open station file " + filepath);

  std::cout << "[Loader] Loading charge stations from " << filepath << "..."
            << std::endl;

  LoadSummary summary;
  std::string line;
  std::getline(file, line); // Header

  while (std::getline(file, line)) {
    if (line.empty() || line == "\r")
      continue;

    auto cols = parseCSVLine(line);
    if (cols.size() < afdc::MIN_COLUMNS) {
      summary.skipped++;
      continue;
    }

    int dcFastCount = 0;
    double lat = 0.0, lng = 0.0;
    if (!parseCount(cols[afdc::DC_FAST_COUNT], dcFastCount) ||
        !parseDouble(cols[afdc::LATITUDE], lat) ||
        !parseDouble(cols[afdc::LONGITUDE], lng) ||
        !isValidCoordinate(Coordinates(lat, lng))) {
      summary.skipped++;
      continue;
    }

    std::optional<CalendarDate> openDate;
    if (!cols[afdc::OPEN_DATE].empty()) {
      openDate = CalendarDate::parse(cols[afdc::OPEN_DATE]);
      if (!openDate) {
        summary.skipped++;
        continue;
      }
    }

    if (dcFastCount < network.minChargersAtStation()) {
      summary.filtered++;
      continue;
    }

    network.addStation(makeStation(
        optionalField(cols[afdc::NAME]), optionalField(cols[afdc::ADDRESS]),
        optionalField(cols[afdc::HOURS]), optionalField(cols[afdc::PHONE]),
        lat, lng, openDate));
    summary.loaded++;
  }

  std::cout << "[Loader] Loaded " << summary.loaded << " charge stations ("
            << summary.filtered << " below " << network.minChargersAtStation()
            << " DC fast chargers, " << summary.skipped << " malformed rows)."
            << std::endl;
  return summary;
}
