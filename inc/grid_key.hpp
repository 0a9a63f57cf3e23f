//
// Created by lucius on 10/17/26.
//

#ifndef LIDAR_FUSE_GRID_KEY_HPP
#define LIDAR_FUSE_GRID_KEY_HPP

#include <cstddef>
#include <Eigen/Core>

// integer voxel cell of a world position at `density` cells per meter.
// equality is on the integer triple, the hash only picks the bucket, so two
// distinct cells never alias.
struct GridKey {
  Eigen::Vector3i cell = Eigen::Vector3i::Zero();

  // false if the scaled position is not finite or does not fit an int
  static bool from_position(const Eigen::Vector3f &position, float density, GridKey &key);

  size_t hash() const;

  bool operator==(const GridKey &other) const { return cell == other.cell; }
  bool operator!=(const GridKey &other) const { return cell != other.cell; }
};

struct GridKeyHash {
  size_t operator()(const GridKey &key) const { return key.hash(); }
};

#endif //LIDAR_FUSE_GRID_KEY_HPP
