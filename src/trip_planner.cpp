#include "trip_planner.hpp"
#include "errors.hpp"
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

TripPlanner::TripPlanner(const ChargeNetwork &network, RoutingOracle &oracle,
                         ChargeCurve curve)
    : network_(network), oracle_(oracle), curve_(std::move(curve)) {}

void TripPlanner::validate(const TripRequest &request) const {
  if (!isValidCoordinate(request.start) || !isValidCoordinate(request.end))
    throw std::invalid_argument("start and end must be valid coordinates");
  if (!(request.evRange > 0))
    throw std::invalid_argument("ev range must be positive");
  if (!(0 <= request.minBattery && request.minBattery <= request.maxBattery &&
        request.maxBattery <= 1))
    throw std::invalid_argument(
        "battery limits must satisfy 0 <= min <= max <= 1");
  if (!(0 <= request.startBattery && request.startBattery <= 1))
    throw std::invalid_argument("start battery must be between 0 and 1");

  Meters maxLegLength =
      (request.maxBattery - request.minBattery) * request.evRange;
  if (request.minLegLength > maxLegLength)
    throw std::invalid_argument(
        "min leg length exceeds the usable range of the vehicle");
  if (maxLegLength > network_.evRange())
    throw std::invalid_argument(
        "usable range of the vehicle exceeds the range of the network");
}

TripPlan TripPlanner::plan(const TripRequest &request) const {
  validate(request);

  StationPtr start = network_.findNearestStation(request.start);
  StationPtr goal = network_.findNearestStation(request.end);

  Meters maxLegLength =
      (request.maxBattery - request.minBattery) * request.evRange;

  TripPlan plan;
  plan.path = network_.getShortestPath(start, goal, request.minLegLength,
                                       maxLegLength);
  plan.stations = pathStations(plan.path, start);

  std::vector<Coordinates> waypoints;
  waypoints.reserve(plan.stations.size());
  for (const auto &cs : plan.stations)
    waypoints.push_back(cs->coord);

  // Fresh distances: the oracle may disagree slightly with the stored legs.
  Directions directions = oracle_.directions(waypoints);
  if (directions.legs.size() != plan.path.size())
    throw OracleFailure("expected " + std::to_string(plan.path.size()) +
                        " legs, got " +
                        std::to_string(directions.legs.size()));

  SimulationResult sim =
      simulatePathCharging(request.evRange, request.minBattery,
                           request.startBattery, curve_, directions.legs);

  plan.stops = std::move(sim.stops);
  plan.destinationBattery = sim.destinationBattery;
  plan.polyline = std::move(directions.polyline);
  plan.bounds = directions.bounds;

  for (const auto &stop : plan.stops) {
    plan.totalDrivingDistance += stop.drivingDistance;
    plan.totalDrivingTime += stop.drivingTime;
    plan.totalChargeTime += stop.chargeTime;
  }

  std::cout << "[Planner] " << plan.path.size() << " legs, "
            << formatMeters(plan.totalDrivingDistance) << ", "
            << formatSeconds(plan.totalTime()) << " total." << std::endl;
  return plan;
}

// --- Display Formatting ---

std::string formatSeconds(Seconds seconds) {
  long long total = seconds <= 0 ? 0 : std::llround(seconds);
  long long hours = total / 3600;
  long long minutes = total % 3600 / 60;
  long long secs = total % 60;

  if (hours > 0)
    return std::to_string(hours) + " hrs " + std::to_string(minutes) +
           " mins " + std::to_string(secs) + " secs";
  return std::to_string(minutes) + " mins " + std::to_string(secs) + " secs";
}

std::string formatMeters(Meters meters) {
  long long tenths = std::llround(meters / 100.0);
  bool negative = tenths < 0;
  if (negative)
    tenths = -tenths;

  std::string whole = std::to_string(tenths / 10);
  std::string grouped;
  for (size_t i = 0; i < whole.size(); ++i) {
    if (i > 0 && (whole.size() - i) % 3 == 0)
      grouped += ',';
    grouped += whole[i];
  }

  return (negative ? "-" : "") + grouped + "." +
         std::to_string(tenths % 10) + " kms";
}

std::string formatBattery(double fraction) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(1) << fraction * 100.0 << "%";
  return out.str();
}

std::string displayField(const std::optional<std::string> &value) {
  return value ? *value : "not available";
}

std::string displayDate(const std::optional<CalendarDate> &date) {
  return date ? date->displayString() : "not available";
}
