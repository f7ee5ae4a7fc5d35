#ifndef CHARGE_NETWORK_HPP
#define CHARGE_NETWORK_HPP

#include "types.hpp"
#include <unordered_map>
#include <unordered_set>
#include <vector>

// A graph of charge stations joined by drivable legs.
//
// Stations below min_chargers_at_station are filtered out at ingestion; the
// network does not re-check it. Legs longer than ev_range (meters) are never
// admitted. ev_range is fixed at construction, so admitted legs stay valid.
class ChargeNetwork {
public:
  // Adjacency entry: a committed leg and the station at its other end.
  struct Incidence {
    LegID leg;
    StationID other;
  };

  ChargeNetwork(int minChargersAtStation, Meters evRange);

  int minChargersAtStation() const { return minChargersAtStation_; }
  Meters evRange() const { return evRange_; }

  // Throws DuplicateVertex if cs (by identity) is already present.
  void addStation(StationPtr cs);

  bool hasStation(const ChargeStation *cs) const;
  size_t stationCount() const { return stations_.size(); }
  size_t legCount() const { return legs_.size(); }

  // Stations in insertion order.
  const std::vector<StationPtr> &stations() const { return stations_; }

  // Every committed leg, once.
  const std::vector<Leg> &legs() const { return legs_; }

  std::vector<Leg> legsAt(const ChargeStation &cs) const;

  // Every unordered station pair closer than ev_range by great circle. Road
  // distance is never shorter, so no admissible leg is missed.
  std::vector<UnresolvedLeg> candidateLegs() const;

  // Attaches legs with drivingDistance <= ev_range to both endpoints and
  // silently drops the rest. Returns the number admitted. Throws
  // UnknownStation, before committing anything, if an endpoint is missing.
  size_t commitLegs(const std::vector<Leg> &legs);

  // A* by driving distance, using only legs whose length lies in
  // [minLegLength, maxLegLength] (meters). Throws PathNotNeeded, PathNotFound
  // or UnknownStation.
  std::vector<Leg> getShortestPath(const StationPtr &start,
                                   const StationPtr &goal, Meters minLegLength,
                                   Meters maxLegLength) const;

  // Nearest station by great circle distance. Throws UnknownStation when the
  // network is empty.
  StationPtr findNearestStation(const Coordinates &coord) const;

  // --- Dense index access, used by the pathfinder ---
  StationID stationId(const ChargeStation *cs) const;
  const StationPtr &station(StationID id) const { return stations_[id]; }
  const Leg &leg(LegID id) const { return legs_[id]; }
  const std::vector<Incidence> &incidences(StationID id) const {
    return adjacency_[id];
  }

private:
  int minChargersAtStation_;
  Meters evRange_;

  std::vector<StationPtr> stations_;
  std::unordered_map<const ChargeStation *, StationID> index_;
  std::vector<std::vector<Incidence>> adjacency_;

  std::vector<Leg> legs_;
  std::unordered_set<LegEndpoints, LegEndpointsHash> committed_;
};

#endif // CHARGE_NETWORK_HPP
