#include "pathfinder.hpp"
#include "errors.hpp"
#include <algorithm>
#include <queue>
#include <vector>

// --- A* Search State ---
struct State {
  StationID u;
  Meters g_score;
  Meters f_score;
  long long seq; // decreasing, so later pushes win f-score ties

  bool operator>(const State &other) const {
    if (f_score != other.f_score)
      return f_score > other.f_score;
    return seq > other.seq;
  }
};

struct PathInfo {
  Meters g_score = INF;
  LegID parent_leg = -1;
  StationID parent = -1;
};

std::vector<Leg> Pathfinder::FindShortestPath(const ChargeNetwork &network,
                                              const StationPtr &start,
                                              const StationPtr &goal,
                                              Meters minLegLength,
                                              Meters maxLegLength,
                                              Heuristic heuristic) {
  if (start == goal)
    throw PathNotNeeded();

  StationID startNode = network.stationId(start.get());
  StationID endNode = network.stationId(goal.get());
  const Coordinates &goalCoord = goal->coord;

  auto estimate = [&](StationID u) -> Meters {
    if (heuristic == Heuristic::None)
      return 0.0;
    return greatCircleDistanceMeters(network.station(u)->coord, goalCoord);
  };

  std::vector<PathInfo> info(network.stationCount());
  std::priority_queue<State, std::vector<State>, std::greater<State>> pq;
  long long seq = -1;

  info[startNode].g_score = 0;
  pq.push({startNode, 0, 0, seq--});

  bool found = false;
  while (!pq.empty()) {
    State top = pq.top();
    pq.pop();

    // Stale entry: a shorter route to this station was pushed later.
    if (top.g_score > info[top.u].g_score)
      continue;
    if (top.u == endNode) {
      found = true;
      break;
    }

    for (const auto &inc : network.incidences(top.u)) {
      const Leg &leg = network.leg(inc.leg);

      // Length window: legs outside it are not routable at all.
      if (leg.drivingDistance < minLegLength ||
          leg.drivingDistance > maxLegLength)
        continue;

      Meters newG = top.g_score + leg.drivingDistance;
      if (newG < info[inc.other].g_score) {
        info[inc.other].g_score = newG;
        info[inc.other].parent = top.u;
        info[inc.other].parent_leg = inc.leg;

        pq.push({inc.other, newG, newG + estimate(inc.other), seq--});
      }
    }
  }

  if (!found)
    throw PathNotFound();

  // --- Reconstruct Path ---
  std::vector<Leg> path;
  StationID curr = endNode;
  while (curr != startNode) {
    path.push_back(network.leg(info[curr].parent_leg));
    curr = info[curr].parent;
  }
  std::reverse(path.begin(), path.end());
  return path;
}
