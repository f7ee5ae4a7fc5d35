#include "routing_oracle.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

// --- Polyline Encoding ---

namespace {
void encodeValue(long long value, std::string &out) {
  unsigned long long v = value < 0 ? ~((unsigned long long)value << 1)
                                   : ((unsigned long long)value << 1);
  while (v >= 0x20) {
    out += (char)((0x20 | (v & 0x1f)) + 63);
    v >>= 5;
  }
  out += (char)(v + 63);
}

long long decodeValue(const std::string &encoded, size_t &pos) {
  unsigned long long result = 0;
  int shift = 0;
  int chunk;
  do {
    if (pos >= encoded.size())
      throw std::invalid_argument("truncated polyline");
    chunk = encoded[pos++] - 63;
    if (chunk < 0 || chunk > 63)
      throw std::invalid_argument("invalid polyline character");
    result |= (unsigned long long)(chunk & 0x1f) << shift;
    shift += 5;
  } while (chunk >= 0x20);
  return (result & 1) ? ~(long long)(result >> 1) : (long long)(result >> 1);
}
} // namespace

std::string encodePolyline(const std::vector<Coordinates> &points) {
  std::string out;
  long long prevLat = 0, prevLng = 0;
  for (const auto &p : points) {
    long long lat = std::llround(p.lat * 1e5);
    long long lng = std::llround(p.lng * 1e5);
    encodeValue(lat - prevLat, out);
    encodeValue(lng - prevLng, out);
    prevLat = lat;
    prevLng = lng;
  }
  return out;
}

std::vector<Coordinates> decodePolyline(const std::string &encoded) {
  std::vector<Coordinates> points;
  size_t pos = 0;
  long long lat = 0, lng = 0;
  while (pos < encoded.size()) {
    lat += decodeValue(encoded, pos);
    lng += decodeValue(encoded, pos);
    points.emplace_back(lat / 1e5, lng / 1e5);
  }
  return points;
}

Bounds boundsOf(const std::vector<Coordinates> &points) {
  Bounds b;
  if (points.empty())
    return b;
  b.northeast = b.southwest = points[0];
  for (const auto &p : points) {
    b.northeast.lat = std::max(b.northeast.lat, p.lat);
    b.northeast.lng = std::max(b.northeast.lng, p.lng);
    b.southwest.lat = std::min(b.southwest.lat, p.lat);
    b.southwest.lng = std::min(b.southwest.lng, p.lng);
  }
  return b;
}

// --- EstimatedRoutingOracle ---

EstimatedRoutingOracle::EstimatedRoutingOracle(double detourFactor,
                                               double drivingSpeedMps)
    : detourFactor_(detourFactor), drivingSpeedMps_(drivingSpeedMps) {
  if (detourFactor < 1.0)
    throw std::invalid_argument("detour factor must be >= 1");
  if (!(drivingSpeedMps > 0.0))
    throw std::invalid_argument("driving speed must be positive");
}

Directions
EstimatedRoutingOracle::directions(const std::vector<Coordinates> &waypoints) {
  if (waypoints.size() < 2)
    throw OracleFailure("directions need at least 2 waypoints");
  for (const auto &p : waypoints) {
    if (!isValidCoordinate(p))
      throw OracleFailure("waypoint out of range");
  }

  Directions result;
  for (size_t i = 1; i < waypoints.size(); ++i) {
    Meters distance =
        greatCircleDistanceMeters(waypoints[i - 1], waypoints[i]) *
        detourFactor_;
    result.legs.push_back({distance, distance / drivingSpeedMps_});
  }
  result.polyline = encodePolyline(waypoints);
  result.bounds = boundsOf(waypoints);
  return result;
}
