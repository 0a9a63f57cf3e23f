//
// Created by lucius on 10/17/26.
//

#ifndef LIDAR_FUSE_POINT_FUSION_HPP
#define LIDAR_FUSE_POINT_FUSION_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <Eigen/Core>
#include "camera_transform.hpp"
#include "plane_sampler.hpp"
#include "point_store.hpp"

enum ConfidenceLevel : uint8_t {
  kConfidenceLow = 0,
  kConfidenceMedium = 1,
  kConfidenceHigh = 2,
};

struct Frame {
  std::shared_ptr<PixelBuffer> depth;          // float32 meters
  std::shared_ptr<PixelBuffer> smoothed_depth; // optional, preferred over depth
  std::shared_ptr<PixelBuffer> confidence;     // uint8 ConfidenceLevel
  std::shared_ptr<PixelBuffer> color;          // nv12, plane 0 luma, plane 1 cbcr

  Eigen::Matrix3f intrinsics = Eigen::Matrix3f::Identity();
  Eigen::Matrix4f pose = Eigen::Matrix4f::Identity();  // camera to world
  Orientation orientation = Orientation::kPortrait;

  EIGEN_MAKE_ALIGNED_OPERATOR_NEW
};

struct FuseParams {
  float density = 100.f;   // grid cells per meter
  float max_depth = 2.f;   // meters, deeper samples are dropped
  float min_w = 1e-6f;     // smallest acceptable homogeneous divisor
};

struct FuseStats {
  bool skipped = false;
  size_t inserted = 0;
  size_t duplicates = 0;
  size_t rejected_confidence = 0;
  size_t rejected_range = 0;
  size_t rejected_geometry = 0;
};

// unprojects every high confidence depth sample of the frame into world
// space and adds a colored vertex for each grid cell not yet in the store.
// a frame without readable depth, confidence or color planes is skipped with
// no effect on the store.
FuseStats fuse_frame(const Frame &frame, const FuseParams &params, PointStore &store);

#endif //LIDAR_FUSE_POINT_FUSION_HPP
