//
// Created by lucius on 10/17/26.
//

#include "point_fusion.hpp"
#include "color_decoder.hpp"
#include <boost/log/trivial.hpp>
#include <Eigen/Geometry>
#include <Eigen/LU>
#include <algorithm>
#include <cmath>
#include <unordered_set>
#include <vector>

namespace {

struct Candidate {
  GridKey key;
  Eigen::Vector3f position;
  int color_col;
  int color_row;
};

struct RowResult {
  std::vector<Candidate> candidates;
  size_t rejected_confidence = 0;
  size_t rejected_range = 0;
  size_t rejected_geometry = 0;
};

inline int to_pixel(float coord, int size) {
  const long pixel = std::lround(coord);
  return static_cast<int>(std::max(0L, std::min(static_cast<long>(size - 1), pixel)));
}

FuseStats skip_frame(const char *reason) {
  BOOST_LOG_TRIVIAL(debug) << "skip frame: " << reason;
  FuseStats stats;
  stats.skipped = true;
  return stats;
}

}

FuseStats fuse_frame(const Frame &frame, const FuseParams &params, PointStore &store) {
  PixelBuffer *depth_buffer = frame.smoothed_depth ? frame.smoothed_depth.get() : frame.depth.get();

  // held for the whole pass, released on every return below
  ScopedBufferLock depth_lock(depth_buffer);
  ScopedBufferLock confidence_lock(frame.confidence.get());
  ScopedBufferLock color_lock(frame.color.get());
  if (!depth_lock.owns_lock() or !confidence_lock.owns_lock() or !color_lock.owns_lock()) {
    return skip_frame("missing depth, confidence or color buffer");
  }

  PlaneDesc depth_desc, confidence_desc, luma_desc, chroma_desc;
  if (!depth_buffer->plane(0, depth_desc) or !frame.confidence->plane(0, confidence_desc) or
      !frame.color->plane(0, luma_desc) or !frame.color->plane(1, chroma_desc)) {
    return skip_frame("missing plane");
  }

  const PlaneSampler<float> depth_plane(depth_desc);
  const PlaneSampler<uint8_t> confidence_plane(confidence_desc);
  const YCbCrSampler image(luma_desc, chroma_desc);
  if (!depth_plane.valid() or !confidence_plane.valid() or !image.valid()) {
    return skip_frame("unexpected plane layout");
  }

  const Eigen::Matrix3f intrinsics_inv = frame.intrinsics.inverse();
  if (!intrinsics_inv.allFinite()) {
    return skip_frame("singular intrinsics");
  }
  const Eigen::Matrix4f camera_transform = build_camera_transform(frame.pose, frame.orientation);

  const int depth_width = depth_plane.width();
  const int depth_height = depth_plane.height();
  const int confidence_width = confidence_plane.width();
  const int confidence_height = confidence_plane.height();
  const bool co_registered = confidence_width == depth_width and confidence_height == depth_height;
  const Eigen::Vector2f image_size(static_cast<float>(image.width()), static_cast<float>(image.height()));

  std::vector<RowResult> rows(depth_height);

#pragma omp parallel for schedule(static)
  for (int row = 0; row < depth_height; row++) {
    auto &result = rows[row];
    const int confidence_row = co_registered ? row :
        static_cast<int>(static_cast<int64_t>(row) * confidence_height / depth_height);
    for (int col = 0; col < depth_width; col++) {
      const int confidence_col = co_registered ? col :
          static_cast<int>(static_cast<int64_t>(col) * confidence_width / depth_width);
      if (confidence_plane.value(confidence_col, confidence_row) != kConfidenceHigh) {
        result.rejected_confidence++;
        continue;
      }

      const float depth = depth_plane.value(col, row);
      if (depth > params.max_depth) {
        result.rejected_range++;
        continue;
      }
      if (!std::isfinite(depth) or depth <= 0.f) {
        result.rejected_geometry++;
        continue;
      }

      const Eigen::Vector2f normalized(static_cast<float>(col) / static_cast<float>(depth_width),
                                       static_cast<float>(row) / static_cast<float>(depth_height));
      const Eigen::Vector2f screen = normalized.cwiseProduct(image_size);
      const Eigen::Vector3f local = intrinsics_inv * screen.homogeneous() * depth;
      const Eigen::Vector4f world = camera_transform * local.homogeneous();
      if (!std::isfinite(world.w()) or world.w() < params.min_w) {
        result.rejected_geometry++;
        continue;
      }

      Candidate candidate;
      candidate.position = world.head<3>() / world.w();
      if (!candidate.position.allFinite() or
          !GridKey::from_position(candidate.position, params.density, candidate.key)) {
        result.rejected_geometry++;
        continue;
      }
      candidate.color_col = to_pixel(screen.x(), image.width());
      candidate.color_row = to_pixel(screen.y(), image.height());
      result.candidates.push_back(candidate);
    }
  }

  // rows are merged in scan order, so the first sample of a cell wins exactly
  // as it would in a serial pass. cells already in the store are resolved by
  // insert_batch alone, under the same lock that applies the frame.
  FuseStats stats;
  std::vector<KeyedVertex> fresh;
  std::unordered_set<GridKey, GridKeyHash> seen;
  for (const auto &result : rows) {
    stats.rejected_confidence += result.rejected_confidence;
    stats.rejected_range += result.rejected_range;
    stats.rejected_geometry += result.rejected_geometry;
    for (const auto &candidate : result.candidates) {
      if (!seen.insert(candidate.key).second) {
        stats.duplicates++;
        continue;
      }
      uint8_t y, cb, cr;
      image.sample(candidate.color_col, candidate.color_row, y, cb, cr);
      Vertex vertex;
      vertex.position = candidate.position;
      vertex.color = decode_ycbcr(y, cb, cr);
      fresh.emplace_back(candidate.key, vertex);
    }
  }

  stats.inserted = store.insert_batch(fresh);
  stats.duplicates += fresh.size() - stats.inserted;

  BOOST_LOG_TRIVIAL(debug) << "fused " << depth_width << "x" << depth_height << " depth: "
                           << stats.inserted << " new, " << stats.duplicates << " known, "
                           << stats.rejected_confidence << " low confidence, "
                           << stats.rejected_range << " out of range, "
                           << stats.rejected_geometry << " degenerate";
  return stats;
}
