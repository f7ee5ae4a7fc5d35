#ifndef PATHFINDER_HPP
#define PATHFINDER_HPP

#include "charge_network.hpp"
#include <vector>

class Pathfinder {
public:
  enum class Heuristic {
    GreatCircle, // A*: admissible because roads are never shorter
    None         // plain Dijkstra
  };

  // Shortest path by driving distance from start to goal, ordered start->goal.
  // Legs outside [minLegLength, maxLegLength] are never taken.
  // Among frontier entries with equal f-score, the most recently pushed one is
  // expanded first.
  static std::vector<Leg> FindShortestPath(
      const ChargeNetwork &network, const StationPtr &start,
      const StationPtr &goal, Meters minLegLength, Meters maxLegLength,
      Heuristic heuristic = Heuristic::GreatCircle);
};

#endif // PATHFINDER_HPP
