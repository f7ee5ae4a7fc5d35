#ifndef CLUSTER_TREE_HPP
#define CLUSTER_TREE_HPP

#include "types.hpp"
#include <memory>
#include <variant>
#include <vector>

// Divisive hierarchical clustering of charge stations.
//
// Every node picks a centroid (the station with the lowest average great
// circle distance to the rest of its set). A set whose diameter fits in
// max_cluster_diameter (km) becomes a leaf; otherwise it is split between the
// two stations furthest apart and both halves are clustered again.
//
// Stations are visited in (lat, lng) order so the result is reproducible.
class ClusterTree {
public:
  ClusterTree(std::vector<StationPtr> stations, double maxClusterDiameter);

  // Input already in (lat, lng) order; used for every subtree.
  struct Presorted {};
  ClusterTree(Presorted, std::vector<StationPtr> stations,
              double maxClusterDiameter);

  const StationPtr &centroid() const { return centroid_; }
  double maxClusterDiameter() const { return maxClusterDiameter_; }
  bool isLeaf() const { return std::holds_alternative<Leaf>(node_); }

  // Every leaf's stations, in tree order.
  std::vector<std::vector<StationPtr>> leafClusters() const;

  // The centroid of every leaf, in the same order as leafClusters().
  std::vector<StationPtr> finalCentroids() const;

private:
  struct Leaf {
    std::vector<StationPtr> stations;
  };
  struct Split {
    std::unique_ptr<ClusterTree> near;  // closer to the first diameter end
    std::unique_ptr<ClusterTree> other; // closer to (or tied with) the second
  };

  void build(std::vector<StationPtr> stations);

  void collectClusters(std::vector<std::vector<StationPtr>> &out) const;
  void collectCentroids(std::vector<StationPtr> &out) const;

  StationPtr centroid_;
  double maxClusterDiameter_;
  std::variant<Leaf, Split> node_;
};

// Station minimizing the average great circle distance to every station in
// the set (first one wins ties).
StationPtr lowestAverageDistance(const std::vector<StationPtr> &stations);

// The two stations furthest apart (first pair wins ties). A single station is
// paired with itself.
std::pair<StationPtr, StationPtr>
furthestApart(const std::vector<StationPtr> &stations);

#endif // CLUSTER_TREE_HPP
