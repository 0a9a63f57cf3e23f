//
// Created by lucius on 10/17/26.
//

#include "grid_key.hpp"
#include <boost/functional/hash.hpp>
#include <cmath>
#include <limits>

bool GridKey::from_position(const Eigen::Vector3f &position, float density, GridKey &key) {
  static const double kLimit = static_cast<double>(std::numeric_limits<int>::max());
  for (int i = 0; i < 3; i++) {
    const double scaled = std::round(static_cast<double>(position[i]) * density);
    if (!std::isfinite(scaled) or std::abs(scaled) > kLimit) {
      return false;
    }
    key.cell[i] = static_cast<int>(scaled);
  }
  return true;
}

size_t GridKey::hash() const {
  size_t seed = 0;
  boost::hash_combine(seed, cell.x());
  boost::hash_combine(seed, cell.y());
  boost::hash_combine(seed, cell.z());
  return seed;
}
