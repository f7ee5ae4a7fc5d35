#include "types.hpp"
#include <functional>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace {
const char *const MONTH_NAMES[] = {"January",   "February", "March",
                                   "April",     "May",      "June",
                                   "July",      "August",   "September",
                                   "October",   "November", "December"};

int daysInMonth(int year, int month) {
  static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
  if (month == 2 && leap)
    return 29;
  return days[month - 1];
}
} // namespace

// --- CalendarDate ---

std::optional<CalendarDate> CalendarDate::parse(const std::string &text) {
  if (text.size() != 10 || text[4] != '-' || text[7] != '-')
    return std::nullopt;
  for (size_t i = 0; i < text.size(); ++i) {
    if (i == 4 || i == 7)
      continue;
    if (text[i] < '0' || text[i] > '9')
      return std::nullopt;
  }

  CalendarDate date;
  date.year = std::stoi(text.substr(0, 4));
  date.month = std::stoi(text.substr(5, 2));
  date.day = std::stoi(text.substr(8, 2));

  if (date.month < 1 || date.month > 12)
    return std::nullopt;
  if (date.day < 1 || date.day > daysInMonth(date.year, date.month))
    return std::nullopt;
  return date;
}

std::string CalendarDate::toString() const {
  std::ostringstream out;
  out << std::setfill('0') << std::setw(4) << year << '-' << std::setw(2)
      << month << '-' << std::setw(2) << day;
  return out.str();
}

std::string CalendarDate::displayString() const {
  std::ostringstream out;
  out << MONTH_NAMES[month - 1] << ' ' << day << ' ' << year;
  return out.str();
}

// --- Stations and Legs ---

StationPtr makeStation(std::optional<std::string> name,
                       std::optional<std::string> address,
                       std::optional<std::string> hours,
                       std::optional<std::string> phone, double lat, double lng,
                       std::optional<CalendarDate> openDate) {
  auto cs = std::make_shared<ChargeStation>();
  cs->name = std::move(name);
  cs->address = std::move(address);
  cs->hours = std::move(hours);
  cs->phone = std::move(phone);
  cs->coord = Coordinates(lat, lng);
  cs->openDate = openDate;
  return cs;
}

LegEndpoints::LegEndpoints(StationPtr a, StationPtr b) {
  if (!a || !b)
    throw std::invalid_argument("leg endpoint is null");
  if (a == b)
    throw std::invalid_argument("leg endpoints must be two distinct stations");

  if (std::less<const ChargeStation *>()(b.get(), a.get()))
    std::swap(a, b);
  first = std::move(a);
  second = std::move(b);
}

const StationPtr &LegEndpoints::otherEndpoint(const ChargeStation *cs) const {
  if (first.get() == cs)
    return second;
  if (second.get() == cs)
    return first;
  throw std::invalid_argument("station is not an endpoint of this leg");
}

std::vector<StationPtr> pathStations(const std::vector<Leg> &path,
                                     const StationPtr &start) {
  std::vector<StationPtr> stations;
  stations.reserve(path.size() + 1);
  stations.push_back(start);
  for (const auto &leg : path) {
    // otherEndpoint throws if the path is not contiguous
    stations.push_back(leg.otherEndpoint(stations.back().get()));
  }
  return stations;
}
