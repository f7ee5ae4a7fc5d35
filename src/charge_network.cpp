#include "charge_network.hpp"
#include "errors.hpp"
#include "pathfinder.hpp"
#include <iostream>

ChargeNetwork::ChargeNetwork(int minChargersAtStation, Meters evRange)
    : minChargersAtStation_(minChargersAtStation), evRange_(evRange) {}

// --- Vertices ---

void ChargeNetwork::addStation(StationPtr cs) {
  if (!cs)
    throw std::invalid_argument("cannot add a null charge station");
  if (index_.count(cs.get()))
    throw DuplicateVertex();

  StationID id = (StationID)stations_.size();
  index_[cs.get()] = id;
  stations_.push_back(std::move(cs));
  adjacency_.emplace_back();
}

bool ChargeNetwork::hasStation(const ChargeStation *cs) const {
  return index_.count(cs) > 0;
}

StationID ChargeNetwork::stationId(const ChargeStation *cs) const {
  auto it = index_.find(cs);
  if (it == index_.end()) {
    if (cs)
      throw UnknownStation("(" + std::to_string(cs->coord.lat) + ", " +
                           std::to_string(cs->coord.lng) + ")");
    throw UnknownStation("null");
  }
  return it->second;
}

std::vector<Leg> ChargeNetwork::legsAt(const ChargeStation &cs) const {
  std::vector<Leg> result;
  for (const auto &inc : adjacency_[stationId(&cs)])
    result.push_back(legs_[inc.leg]);
  return result;
}

StationPtr ChargeNetwork::findNearestStation(const Coordinates &coord) const {
  if (stations_.empty())
    throw UnknownStation("network has no charge stations");

  StationID best = 0;
  double minDist = INF;
  for (size_t i = 0; i < stations_.size(); ++i) {
    double dist = greatCircleDistance(coord, stations_[i]->coord);
    if (dist < minDist) {
      minDist = dist;
      best = (StationID)i;
    }
  }
  return stations_[best];
}

// --- Edges ---

std::vector<UnresolvedLeg> ChargeNetwork::candidateLegs() const {
  std::vector<UnresolvedLeg> result;

  for (size_t i = 0; i < stations_.size(); ++i) {
    for (size_t j = i + 1; j < stations_.size(); ++j) {
      double dist = greatCircleDistanceMeters(stations_[i]->coord,
                                              stations_[j]->coord);
      if (dist < evRange_)
        result.emplace_back(stations_[i], stations_[j]);
    }
  }

  std::cout << "[ChargeNetwork] " << result.size() << " candidate legs among "
            << stations_.size() << " charge stations." << std::endl;
  return result;
}

size_t ChargeNetwork::commitLegs(const std::vector<Leg> &legs) {
  // An unknown endpoint aborts the batch before any leg is committed.
  std::vector<std::pair<StationID, StationID>> ends;
  ends.reserve(legs.size());
  for (const auto &leg : legs)
    ends.emplace_back(stationId(leg.endpoints.first.get()),
                      stationId(leg.endpoints.second.get()));

  size_t admitted = 0;
  for (size_t i = 0; i < legs.size(); ++i) {
    const Leg &leg = legs[i];
    StationID u = ends[i].first;
    StationID v = ends[i].second;

    if (leg.drivingDistance > evRange_)
      continue;
    if (!committed_.insert(leg.endpoints).second)
      continue; // same endpoints already committed

    LegID id = (LegID)legs_.size();
    legs_.push_back(leg);
    adjacency_[u].push_back({id, v});
    adjacency_[v].push_back({id, u});
    admitted++;
  }

  std::cout << "[ChargeNetwork] Committed " << admitted << "/" << legs.size()
            << " legs." << std::endl;
  return admitted;
}

std::vector<Leg> ChargeNetwork::getShortestPath(const StationPtr &start,
                                                const StationPtr &goal,
                                                Meters minLegLength,
                                                Meters maxLegLength) const {
  return Pathfinder::FindShortestPath(*this, start, goal, minLegLength,
                                      maxLegLength);
}
