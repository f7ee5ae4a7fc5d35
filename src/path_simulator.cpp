#include "path_simulator.hpp"
#include <algorithm>
#include <stdexcept>

namespace {
const double SLOPE_STEP = 1e-3;

Seconds extendedCurve(const ChargeCurve &curve, double x) {
  if (x <= 0.0)
    return curve(0.0);
  if (x <= 1.0)
    return curve(x);

  Seconds atFull = curve(1.0);
  double slope = (atFull - curve(1.0 - SLOPE_STEP)) / SLOPE_STEP;
  return atFull + slope * (x - 1.0);
}
} // namespace

Seconds genericChargeCurve(double charge) {
  const double f = 3618.27;
  const double g = -17215.3;
  const double h = 55352.6;
  const double i = -71588.6;
  const double j = 33607.2;
  double x = charge;
  return x * (f + x * (g + x * (h + x * (i + x * j))));
}

Seconds chargeTimeBetween(const ChargeCurve &curve, double from, double to) {
  Seconds t = extendedCurve(curve, to) - extendedCurve(curve, from);
  return std::max(0.0, t);
}

SimulationResult simulatePathCharging(Meters evRange, double minBattery,
                                      double startBattery,
                                      const ChargeCurve &curve,
                                      const std::vector<DrivingLeg> &legs) {
  if (!(evRange > 0.0))
    throw std::invalid_argument("ev range must be positive");

  SimulationResult result;
  result.destinationBattery = startBattery;
  result.stops.reserve(legs.size());

  for (size_t i = 0; i < legs.size(); ++i) {
    StopInfo stop;
    stop.drivingDistance = legs[i].drivingDistance;
    stop.drivingTime = legs[i].drivingTime;

    if (i == 0) {
      stop.batteryStart = startBattery;
    } else {
      const StopInfo &prev = result.stops.back();
      stop.batteryStart = prev.batteryEnd - prev.drivingDistance / evRange;
    }

    double required = minBattery + stop.drivingDistance / evRange;
    if (stop.batteryStart < required) {
      stop.batteryEnd = required;
      stop.chargeTime = chargeTimeBetween(curve, stop.batteryStart, required);
    } else {
      stop.batteryEnd = stop.batteryStart;
      stop.chargeTime = 0;
    }
    stop.exceedsCapacity = stop.batteryEnd > 1.0;

    result.destinationBattery =
        stop.batteryEnd - stop.drivingDistance / evRange;
    result.stops.push_back(stop);
  }

  return result;
}

SimulationResult simulatePathCharging(Meters evRange, double minBattery,
                                      double startBattery,
                                      const ChargeCurve &curve,
                                      const std::vector<Leg> &path) {
  std::vector<DrivingLeg> legs;
  legs.reserve(path.size());
  for (const auto &leg : path)
    legs.push_back({leg.drivingDistance, leg.drivingTime});
  return simulatePathCharging(evRange, minBattery, startBattery, curve, legs);
}
