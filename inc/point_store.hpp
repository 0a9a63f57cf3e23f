//
// Created by lucius on 10/17/26.
//

#ifndef LIDAR_FUSE_POINT_STORE_HPP
#define LIDAR_FUSE_POINT_STORE_HPP

#include <unordered_map>
#include <utility>
#include <vector>
#include <boost/thread/shared_mutex.hpp>
#include <Eigen/Core>
#include "color_decoder.hpp"
#include "grid_key.hpp"

struct Vertex {
  Eigen::Vector3f position;
  Color4f color;
};

typedef std::pair<GridKey, Vertex> KeyedVertex;

// deduplicated point set keyed by grid cell. first insertion of a cell wins,
// vertices are never modified afterwards. writers take the lock exclusively,
// readers get copies.
class PointStore {
public:
  PointStore() = default;
  PointStore(const PointStore &) = delete;
  PointStore &operator=(const PointStore &) = delete;

  bool insert_if_absent(const GridKey &key, const Vertex &vertex);
  // applied under a single exclusive lock, returns how many were new
  size_t insert_batch(const std::vector<KeyedVertex> &vertices);

  bool contains(const GridKey &key) const;
  void clear();
  size_t count() const;

  std::vector<Vertex> snapshot() const;
  // every stride-th vertex (1-based), what the viewer draws
  std::vector<Vertex> snapshot_decimated(size_t stride) const;

private:
  mutable boost::shared_mutex mutex_;
  std::unordered_map<GridKey, Vertex, GridKeyHash> vertices_;
};

#endif //LIDAR_FUSE_POINT_STORE_HPP
