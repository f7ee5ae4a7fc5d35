#ifndef ROUTING_ORACLE_HPP
#define ROUTING_ORACLE_HPP

#include "types.hpp"
#include <string>
#include <vector>

struct Bounds {
  Coordinates northeast;
  Coordinates southwest;
};

// Result of one directions request through two or more waypoints.
struct Directions {
  std::vector<DrivingLeg> legs; // one per consecutive waypoint pair
  std::string polyline;         // encoded polyline of the whole route
  Bounds bounds;
};

// Source of real-world driving distances, e.g. a maps directions service.
// Implementations throw OracleFailure on any fault.
class RoutingOracle {
public:
  virtual ~RoutingOracle() = default;

  virtual Directions directions(const std::vector<Coordinates> &waypoints) = 0;
};

// Offline oracle: road distance is the great circle distance stretched by a
// detour factor (>= 1, so A* stays admissible) and driven at a constant speed.
class EstimatedRoutingOracle : public RoutingOracle {
public:
  explicit EstimatedRoutingOracle(
      double detourFactor = DEFAULT_DETOUR_FACTOR,
      double drivingSpeedMps = DEFAULT_DRIVING_SPEED_MPS);

  Directions directions(const std::vector<Coordinates> &waypoints) override;

private:
  double detourFactor_;
  double drivingSpeedMps_;
};

// Encoded polyline algorithm format (1e-5 degree precision).
std::string encodePolyline(const std::vector<Coordinates> &points);
std::vector<Coordinates> decodePolyline(const std::string &encoded);

Bounds boundsOf(const std::vector<Coordinates> &points);

#endif // ROUTING_ORACLE_HPP
