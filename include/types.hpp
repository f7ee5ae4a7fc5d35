#ifndef TYPES_HPP
#define TYPES_HPP

#include <cmath>
#include <cstddef>
#include <functional>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// --- Core Type Aliases ---
using StationID = int;
using LegID = int;
using Meters = double;
using Seconds = double;

// --- Constants ---
const double INF = std::numeric_limits<double>::max();
const double R_EARTH_KM = 6371.0;
const double PI = 3.14159265358979323846;

// Routing oracle fallbacks
const double DEFAULT_DETOUR_FACTOR = 1.25;     // road distance / great circle
const double DEFAULT_DRIVING_SPEED_MPS = 25.0; // ~90 km/h

// Network build defaults
const int DEFAULT_MIN_CHARGERS = 4;
const double DEFAULT_EV_RANGE_KM = 700.0;
const double DEFAULT_CLUSTER_DIAMETER_KM = 60.0;

// Server defaults
const char *const DEFAULT_LISTEN_ADDRESS = "0.0.0.0:50051";
const char *const DEFAULT_NETWORK_PATH = "network.json";

// --- Coordinates ---
struct Coordinates {
  double lat = 0.0;
  double lng = 0.0;

  Coordinates() = default;
  Coordinates(double latitude, double longitude)
      : lat(latitude), lng(longitude) {}

  bool operator==(const Coordinates &other) const {
    return lat == other.lat && lng == other.lng;
  }
};

inline bool isValidCoordinate(const Coordinates &c) {
  return c.lat >= -90.0 && c.lat <= 90.0 && c.lng >= -180.0 && c.lng <= 180.0;
}

// --- Great Circle Distance (haversine) ---
inline double toRadians(double degree) { return degree * PI / 180.0; }

inline double hav(double angle) {
  double s = std::sin(angle / 2);
  return s * s;
}

// Kilometers. Every term is symmetric in (p1, p2), so the result is too.
inline double greatCircleDistance(const Coordinates &p1,
                                  const Coordinates &p2) {
  double lat1 = toRadians(p1.lat);
  double lat2 = toRadians(p2.lat);
  double latDiff = std::fabs(lat1 - lat2);
  double lngDiff = std::fabs(toRadians(p1.lng) - toRadians(p2.lng));

  double a = hav(latDiff) + (1 - hav(latDiff) - hav(lat1 + lat2)) * hav(lngDiff);
  if (a < 0.0)
    a = 0.0;
  if (a > 1.0)
    a = 1.0;
  return R_EARTH_KM * 2 * std::asin(std::sqrt(a));
}

inline double greatCircleDistanceMeters(const Coordinates &p1,
                                        const Coordinates &p2) {
  return greatCircleDistance(p1, p2) * 1000.0;
}

// --- Calendar Date (YYYY-MM-DD) ---
struct CalendarDate {
  int year = 0;
  int month = 0;
  int day = 0;

  static std::optional<CalendarDate> parse(const std::string &text);
  std::string toString() const;     // 2020-03-05
  std::string displayString() const; // March 5 2020

  bool operator==(const CalendarDate &other) const {
    return year == other.year && month == other.month && day == other.day;
  }
};

// --- Graph Vertices ---
// Stations are compared by identity: two stations with identical fields are
// still different vertices.
struct ChargeStation {
  std::optional<std::string> name;
  std::optional<std::string> address;
  std::optional<std::string> hours;
  std::optional<std::string> phone;
  Coordinates coord;
  std::optional<CalendarDate> openDate;
};

using StationPtr = std::shared_ptr<const ChargeStation>;

StationPtr makeStation(std::optional<std::string> name,
                       std::optional<std::string> address,
                       std::optional<std::string> hours,
                       std::optional<std::string> phone, double lat, double lng,
                       std::optional<CalendarDate> openDate = std::nullopt);

// --- Graph Edges ---
// Unordered endpoint pair, normalized by address so (a,b) == (b,a).
struct LegEndpoints {
  StationPtr first;
  StationPtr second;

  LegEndpoints(StationPtr a, StationPtr b);

  bool contains(const ChargeStation *cs) const {
    return first.get() == cs || second.get() == cs;
  }
  const StationPtr &otherEndpoint(const ChargeStation *cs) const;

  bool operator==(const LegEndpoints &other) const {
    return first == other.first && second == other.second;
  }
};

struct LegEndpointsHash {
  std::size_t operator()(const LegEndpoints &e) const {
    auto h1 = std::hash<const ChargeStation *>{}(e.first.get());
    auto h2 = std::hash<const ChargeStation *>{}(e.second.get());
    return h1 ^ (h2 + 0x9e3779b9 + (h1 << 6) + (h1 >> 2));
  }
};

// Candidate edge, not yet measured by the routing oracle.
struct UnresolvedLeg {
  LegEndpoints endpoints;

  UnresolvedLeg(StationPtr a, StationPtr b)
      : endpoints(std::move(a), std::move(b)) {}

  bool operator==(const UnresolvedLeg &other) const {
    return endpoints == other.endpoints;
  }
};

// Resolved edge. Equality ignores distance and time.
struct Leg {
  LegEndpoints endpoints;
  Meters drivingDistance;
  Seconds drivingTime;

  Leg(StationPtr a, StationPtr b, Meters distance, Seconds time)
      : endpoints(std::move(a), std::move(b)), drivingDistance(distance),
        drivingTime(time) {}
  Leg(const UnresolvedLeg &leg, Meters distance, Seconds time)
      : endpoints(leg.endpoints), drivingDistance(distance),
        drivingTime(time) {}

  const StationPtr &otherEndpoint(const ChargeStation *cs) const {
    return endpoints.otherEndpoint(cs);
  }

  bool operator==(const Leg &other) const {
    return endpoints == other.endpoints;
  }
};

// One driving leg as measured by the routing oracle.
struct DrivingLeg {
  Meters drivingDistance;
  Seconds drivingTime;
};

// Stations visited by a path, starting with `start`.
std::vector<StationPtr> pathStations(const std::vector<Leg> &path,
                                     const StationPtr &start);

#endif // TYPES_HPP
