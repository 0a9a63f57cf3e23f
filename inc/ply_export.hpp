//
// Created by lucius on 10/17/26.
//

#ifndef LIDAR_FUSE_PLY_EXPORT_HPP
#define LIDAR_FUSE_PLY_EXPORT_HPP

#include <stdexcept>
#include <string>
#include <vector>
#include "point_store.hpp"

class PlyExportError : public std::runtime_error {
public:
  explicit PlyExportError(const std::string &what) : std::runtime_error(what) {}
};

// ascii ply with x y z as float and red green blue alpha as uchar.
// throws PlyExportError on a vertex that can not be written as text.
std::string format_ascii_ply(const std::vector<Vertex> &vertices);

// all or nothing, the target is only replaced once the whole file is written
void write_ascii_ply(const std::string &path, const std::vector<Vertex> &vertices);

// snapshots the store and writes it, returns the vertex count written
size_t export_point_store(const std::string &path, const PointStore &store);

#endif //LIDAR_FUSE_PLY_EXPORT_HPP
