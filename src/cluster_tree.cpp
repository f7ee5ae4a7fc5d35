#include "cluster_tree.hpp"
#include <algorithm>
#include <iostream>
#include <memory>
#include <stdexcept>

StationPtr lowestAverageDistance(const std::vector<StationPtr> &stations) {
  if (stations.empty())
    throw std::invalid_argument("cannot pick a centroid of no stations");

  StationPtr best;
  double minAverage = INF;
  for (const auto &i : stations) {
    double sum = 0.0;
    for (const auto &j : stations)
      sum += greatCircleDistance(i->coord, j->coord);

    double average = sum / stations.size();
    if (average < minAverage) {
      minAverage = average;
      best = i;
    }
  }
  return best;
}

std::pair<StationPtr, StationPtr>
furthestApart(const std::vector<StationPtr> &stations) {
  if (stations.empty())
    throw std::invalid_argument("cannot pick a diameter of no stations");

  std::pair<StationPtr, StationPtr> best(stations[0], stations[0]);
  double maxDist = 0.0;
  for (size_t i = 0; i < stations.size(); ++i) {
    for (size_t j = i + 1; j < stations.size(); ++j) {
      double dist = greatCircleDistance(stations[i]->coord, stations[j]->coord);
      if (dist > maxDist) {
        maxDist = dist;
        best = {stations[i], stations[j]};
      }
    }
  }
  return best;
}

// --- ClusterTree ---

ClusterTree::ClusterTree(std::vector<StationPtr> stations,
                         double maxClusterDiameter)
    : maxClusterDiameter_(maxClusterDiameter) {
  if (stations.empty())
    throw std::invalid_argument("cluster tree needs at least one station");
  if (!(maxClusterDiameter >= 0.0))
    throw std::invalid_argument("max cluster diameter must be >= 0");

  std::stable_sort(stations.begin(), stations.end(),
                   [](const StationPtr &a, const StationPtr &b) {
                     if (a->coord.lat != b->coord.lat)
                       return a->coord.lat < b->coord.lat;
                     return a->coord.lng < b->coord.lng;
                   });

  size_t count = stations.size();
  build(std::move(stations));

  std::cout << "[ClusterTree] Clustered " << count << " charge stations into "
            << finalCentroids().size() << " clusters (max diameter "
            << maxClusterDiameter_ << " km)." << std::endl;
}

ClusterTree::ClusterTree(Presorted, std::vector<StationPtr> stations,
                         double maxClusterDiameter)
    : maxClusterDiameter_(maxClusterDiameter) {
  if (!(maxClusterDiameter >= 0.0))
    throw std::invalid_argument("max cluster diameter must be >= 0");
  build(std::move(stations));
}

void ClusterTree::build(std::vector<StationPtr> stations) {
  centroid_ = lowestAverageDistance(stations);

  auto ends = furthestApart(stations);
  double diameter = greatCircleDistance(ends.first->coord, ends.second->coord);

  if (diameter <= maxClusterDiameter_) {
    node_ = Leaf{std::move(stations)};
    return;
  }

  std::vector<StationPtr> near;
  std::vector<StationPtr> other;
  for (auto &cs : stations) {
    if (greatCircleDistance(cs->coord, ends.first->coord) <
        greatCircleDistance(cs->coord, ends.second->coord))
      near.push_back(std::move(cs));
    else
      other.push_back(std::move(cs));
  }

  Split split;
  split.near = std::make_unique<ClusterTree>(Presorted{}, std::move(near),
                                             maxClusterDiameter_);
  split.other = std::make_unique<ClusterTree>(Presorted{}, std::move(other),
                                              maxClusterDiameter_);
  node_ = std::move(split);
}

// --- Traversals ---

std::vector<std::vector<StationPtr>> ClusterTree::leafClusters() const {
  std::vector<std::vector<StationPtr>> result;
  collectClusters(result);
  return result;
}

std::vector<StationPtr> ClusterTree::finalCentroids() const {
  std::vector<StationPtr> result;
  collectCentroids(result);
  return result;
}

void ClusterTree::collectClusters(
    std::vector<std::vector<StationPtr>> &out) const {
  if (const Leaf *leaf = std::get_if<Leaf>(&node_)) {
    out.push_back(leaf->stations);
    return;
  }
  const Split &split = std::get<Split>(node_);
  split.near->collectClusters(out);
  split.other->collectClusters(out);
}

void ClusterTree::collectCentroids(std::vector<StationPtr> &out) const {
  if (std::holds_alternative<Leaf>(node_)) {
    out.push_back(centroid_);
    return;
  }
  const Split &split = std::get<Split>(node_);
  split.near->collectCentroids(out);
  split.other->collectCentroids(out);
}
