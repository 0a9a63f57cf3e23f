//
// Created by lucius on 10/17/26.
//

#include "point_store.hpp"
#include <boost/thread/locks.hpp>

bool PointStore::insert_if_absent(const GridKey &key, const Vertex &vertex) {
  boost::unique_lock<boost::shared_mutex> lock(mutex_);
  return vertices_.emplace(key, vertex).second;
}

size_t PointStore::insert_batch(const std::vector<KeyedVertex> &vertices) {
  boost::unique_lock<boost::shared_mutex> lock(mutex_);
  size_t inserted = 0;
  for (const auto &it : vertices) {
    if (vertices_.emplace(it.first, it.second).second) {
      inserted++;
    }
  }
  return inserted;
}

bool PointStore::contains(const GridKey &key) const {
  boost::shared_lock<boost::shared_mutex> lock(mutex_);
  return vertices_.count(key) != 0;
}

void PointStore::clear() {
  boost::unique_lock<boost::shared_mutex> lock(mutex_);
  vertices_.clear();
}

size_t PointStore::count() const {
  boost::shared_lock<boost::shared_mutex> lock(mutex_);
  return vertices_.size();
}

std::vector<Vertex> PointStore::snapshot() const {
  boost::shared_lock<boost::shared_mutex> lock(mutex_);
  std::vector<Vertex> result;
  result.reserve(vertices_.size());
  for (const auto &it : vertices_) {
    result.push_back(it.second);
  }
  return result;
}

std::vector<Vertex> PointStore::snapshot_decimated(size_t stride) const {
  if (stride <= 1) {
    return snapshot();
  }
  boost::shared_lock<boost::shared_mutex> lock(mutex_);
  std::vector<Vertex> result;
  result.reserve(vertices_.size() / stride);
  size_t index = 0;
  for (const auto &it : vertices_) {
    if (index % stride == stride - 1) {
      result.push_back(it.second);
    }
    index++;
  }
  return result;
}
