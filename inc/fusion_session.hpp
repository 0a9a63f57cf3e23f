//
// Created by lucius on 10/17/26.
//

#ifndef LIDAR_FUSE_FUSION_SESSION_HPP
#define LIDAR_FUSE_FUSION_SESSION_HPP

#include <atomic>
#include <cstddef>
#include <functional>
#include <mutex>
#include "point_fusion.hpp"
#include "point_store.hpp"

// drives fusion of incoming frames into one store. at most one pass runs at
// a time, a frame arriving while a pass is in flight is dropped, not queued.
class FusionSession {
public:
  enum class SubmitResult {
    kNotCapturing,
    kBusy,
    kSkipped,
    kFused,
  };

  typedef std::function<void(const FuseStats &)> PassListener;

  explicit FusionSession(PointStore &store, const FuseParams &params = FuseParams());

  FusionSession(const FusionSession &) = delete;
  FusionSession &operator=(const FusionSession &) = delete;

  SubmitResult submit(const Frame &frame);

  void set_capturing(bool capturing) { capturing_ = capturing; }
  bool toggle_capturing();
  bool is_capturing() const { return capturing_; }

  // called on the submitting thread after every completed pass
  void set_pass_listener(PassListener listener);

  void reset() { store_.clear(); }

  const PointStore &store() const { return store_; }
  const FuseParams &params() const { return params_; }
  size_t frames_fused() const { return frames_fused_; }
  size_t frames_dropped() const { return frames_dropped_; }

private:
  PointStore &store_;
  const FuseParams params_;

  std::atomic<bool> capturing_{false};
  std::atomic<bool> busy_{false};
  std::atomic<size_t> frames_fused_{0};
  std::atomic<size_t> frames_dropped_{0};

  std::mutex listener_mutex_;
  PassListener listener_;
};

const char *submit_result_name(FusionSession::SubmitResult result);

#endif //LIDAR_FUSE_FUSION_SESSION_HPP
