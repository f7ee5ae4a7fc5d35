#ifndef TRIP_PLANNER_HPP
#define TRIP_PLANNER_HPP

#include "charge_network.hpp"
#include "path_simulator.hpp"
#include "routing_oracle.hpp"
#include <string>
#include <vector>

struct TripRequest {
  Coordinates start;
  Coordinates end;
  Meters minLegLength = 0;
  Meters evRange = 0;
  double minBattery = 0;
  double maxBattery = 1;
  double startBattery = 1;
};

struct TripPlan {
  std::vector<StationPtr> stations; // origin station first, destination last
  std::vector<Leg> path;
  std::vector<StopInfo> stops; // one per leg, from the oracle's measurements
  std::string polyline;
  Bounds bounds;
  double destinationBattery = 0;

  Meters totalDrivingDistance = 0;
  Seconds totalDrivingTime = 0;
  Seconds totalChargeTime = 0;

  Seconds totalTime() const { return totalDrivingTime + totalChargeTime; }
};

// Plans a charging trip between two coordinates on a read-only network.
class TripPlanner {
public:
  TripPlanner(const ChargeNetwork &network, RoutingOracle &oracle,
              ChargeCurve curve = genericChargeCurve);

  // Routes between the stations nearest to the request's coordinates, using
  // legs no longer than (maxBattery - minBattery) * evRange. Throws
  // std::invalid_argument, PathNotNeeded, PathNotFound or OracleFailure.
  TripPlan plan(const TripRequest &request) const;

private:
  void validate(const TripRequest &request) const;

  const ChargeNetwork &network_;
  RoutingOracle &oracle_;
  ChargeCurve curve_;
};

// --- Display Formatting ---
std::string formatSeconds(Seconds seconds); // "1 hrs 2 mins 3 secs"
std::string formatMeters(Meters meters);    // "1,234.5 kms"
std::string formatBattery(double fraction); // "83.2%"
std::string displayField(const std::optional<std::string> &value);
std::string displayDate(const std::optional<CalendarDate> &date);

#endif // TRIP_PLANNER_HPP
