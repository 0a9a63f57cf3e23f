//
// Created by lucius on 10/17/26.
//

#include "fusion_session.hpp"
#include <boost/log/trivial.hpp>
#include <utility>

namespace {

class BusyFlag {
public:
  explicit BusyFlag(std::atomic<bool> &flag) : flag_(flag) {}
  ~BusyFlag() { flag_ = false; }

  BusyFlag(const BusyFlag &) = delete;
  BusyFlag &operator=(const BusyFlag &) = delete;

private:
  std::atomic<bool> &flag_;
};

}

FusionSession::FusionSession(PointStore &store, const FuseParams &params) : store_(store), params_(params) {}

FusionSession::SubmitResult FusionSession::submit(const Frame &frame) {
  if (!capturing_) {
    return SubmitResult::kNotCapturing;
  }
  bool expected = false;
  if (!busy_.compare_exchange_strong(expected, true)) {
    frames_dropped_++;
    BOOST_LOG_TRIVIAL(debug) << "fusion busy, dropping frame";
    return SubmitResult::kBusy;
  }
  BusyFlag busy(busy_);

  const FuseStats stats = fuse_frame(frame, params_, store_);
  if (stats.skipped) {
    return SubmitResult::kSkipped;
  }
  frames_fused_++;

  PassListener listener;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listener = listener_;
  }
  if (listener) {
    listener(stats);
  }
  return SubmitResult::kFused;
}

bool FusionSession::toggle_capturing() {
  bool current = capturing_;
  while (!capturing_.compare_exchange_weak(current, !current)) {
  }
  return !current;
}

void FusionSession::set_pass_listener(PassListener listener) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listener_ = std::move(listener);
}

const char *submit_result_name(FusionSession::SubmitResult result) {
  switch (result) {
    case FusionSession::SubmitResult::kNotCapturing:
      return "not capturing";
    case FusionSession::SubmitResult::kBusy:
      return "busy";
    case FusionSession::SubmitResult::kSkipped:
      return "skipped";
    case FusionSession::SubmitResult::kFused:
    default:
      return "fused";
  }
}
