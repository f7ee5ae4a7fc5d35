#ifndef PATH_SIMULATOR_HPP
#define PATH_SIMULATOR_HPP

#include "types.hpp"
#include <functional>
#include <vector>

// Seconds needed to charge from 0.0 to the given battery fraction.
// Must be increasing on [0, 1].
using ChargeCurve = std::function<Seconds(double)>;

// Generic fast-charging profile: quick up to ~80%, then tapering.
Seconds genericChargeCurve(double charge);

// Seconds to charge from `from` to `to` on the curve. Fractions below 0 are
// clamped to 0; above 1 the curve continues linearly with its slope at 1.0.
// Never negative.
Seconds chargeTimeBetween(const ChargeCurve &curve, double from, double to);

// Charging and driving at the station that starts a leg.
struct StopInfo {
  Meters drivingDistance = 0;
  Seconds drivingTime = 0;
  Seconds chargeTime = 0;
  double batteryStart = 0; // on arrival
  double batteryEnd = 0;   // on departure; may exceed 1.0
  bool exceedsCapacity = false;
};

struct SimulationResult {
  std::vector<StopInfo> stops;
  double destinationBattery = 0; // on arrival at the last station
};

// Charges at each stop just enough to finish the next leg with min_battery
// left. ev_range is in meters.
SimulationResult simulatePathCharging(Meters evRange, double minBattery,
                                      double startBattery,
                                      const ChargeCurve &curve,
                                      const std::vector<DrivingLeg> &legs);

// Same, using the distances stored on the graph legs.
SimulationResult simulatePathCharging(Meters evRange, double minBattery,
                                      double startBattery,
                                      const ChargeCurve &curve,
                                      const std::vector<Leg> &path);

#endif // PATH_SIMULATOR_HPP
