/**
 * @file test_fusion_session.cpp
 * @brief Capture gate and drop-while-busy policy
 */

#include <gtest/gtest.h>
#include <chrono>
#include <future>
#include <thread>
#include "fusion_session.hpp"
#include "test_frames.hpp"

namespace {

// blocks the first lock until released, so a pass can be held in flight
class GateBuffer : public PixelBuffer {
public:
  explicit GateBuffer(std::shared_ptr<PixelBuffer> inner) : inner_(std::move(inner)), released_(release_.get_future()) {}

  bool lock_read() override {
    entered_.set_value();
    released_.wait();
    return inner_->lock_read();
  }
  void unlock_read() override { inner_->unlock_read(); }
  int width() const override { return inner_->width(); }
  int height() const override { return inner_->height(); }
  int plane_count() const override { return inner_->plane_count(); }
  bool plane(int index, PlaneDesc &desc) const override { return inner_->plane(index, desc); }

  std::future<void> entered() { return entered_.get_future(); }
  void release() { release_.set_value(); }

private:
  std::shared_ptr<PixelBuffer> inner_;
  std::promise<void> entered_;
  std::promise<void> release_;
  std::shared_future<void> released_;
};

}

TEST(FusionSessionTest, IgnoresFramesWhileNotCapturing) {
  PointStore store;
  FusionSession session(store);
  EXPECT_FALSE(session.is_capturing());
  EXPECT_EQ(session.submit(make_frame(4, 4, 1.f, kConfidenceHigh, 8, 8)),
            FusionSession::SubmitResult::kNotCapturing);
  EXPECT_EQ(store.count(), 0u);
  EXPECT_EQ(session.frames_fused(), 0u);
}

TEST(FusionSessionTest, FusesWhileCapturing) {
  PointStore store;
  FusionSession session(store);
  EXPECT_TRUE(session.toggle_capturing());
  EXPECT_TRUE(session.is_capturing());
  EXPECT_EQ(session.submit(make_frame(4, 4, 1.f, kConfidenceHigh, 8, 8)), FusionSession::SubmitResult::kFused);
  EXPECT_EQ(store.count(), 16u);
  EXPECT_EQ(session.frames_fused(), 1u);

  EXPECT_FALSE(session.toggle_capturing());
  EXPECT_EQ(session.submit(make_frame(4, 4, 0.5f, kConfidenceHigh, 8, 8)),
            FusionSession::SubmitResult::kNotCapturing);
  EXPECT_EQ(store.count(), 16u);
}

TEST(FusionSessionTest, ReportsSkippedFrames) {
  PointStore store;
  FusionSession session(store);
  session.set_capturing(true);
  auto frame = make_frame(4, 4, 1.f, kConfidenceHigh, 8, 8);
  frame.confidence.reset();
  EXPECT_EQ(session.submit(frame), FusionSession::SubmitResult::kSkipped);
  EXPECT_EQ(session.frames_fused(), 0u);
  // the session is free again afterwards
  EXPECT_EQ(session.submit(make_frame(4, 4, 1.f, kConfidenceHigh, 8, 8)), FusionSession::SubmitResult::kFused);
}

TEST(FusionSessionTest, UsesItsParams) {
  PointStore store;
  FuseParams params;
  params.max_depth = 0.5f;
  FusionSession session(store, params);
  session.set_capturing(true);
  EXPECT_EQ(session.submit(make_frame(4, 4, 1.f, kConfidenceHigh, 8, 8)), FusionSession::SubmitResult::kFused);
  EXPECT_EQ(store.count(), 0u);
}

TEST(FusionSessionTest, DropsFramesWhileAPassIsInFlight) {
  PointStore store;
  FusionSession session(store);
  session.set_capturing(true);

  auto slow_frame = make_frame(4, 4, 1.f, kConfidenceHigh, 8, 8);
  auto gate = std::make_shared<GateBuffer>(slow_frame.depth);
  slow_frame.depth = gate;
  auto entered = gate->entered();

  std::future<FusionSession::SubmitResult> first =
      std::async(std::launch::async, [&]() { return session.submit(slow_frame); });
  ASSERT_EQ(entered.wait_for(std::chrono::seconds(10)), std::future_status::ready);

  EXPECT_EQ(session.submit(make_frame(4, 4, 0.5f, kConfidenceHigh, 8, 8)), FusionSession::SubmitResult::kBusy);
  EXPECT_EQ(session.frames_dropped(), 1u);
  // toggling does not interrupt the pass in flight
  session.set_capturing(false);

  gate->release();
  EXPECT_EQ(first.get(), FusionSession::SubmitResult::kFused);
  EXPECT_EQ(store.count(), 16u);
  EXPECT_EQ(session.frames_fused(), 1u);
}

TEST(FusionSessionTest, ResetDuringAPassNeverLeavesPartOfAFrame) {
  // the store starts with the top half of the frame, the pass adds the rest.
  // a reset racing the pass must end with nothing or the whole frame.
  const int kSize = 64;
  const size_t kCells = kSize * kSize;
  auto top_half = make_frame(kSize, kSize, 1.f, kConfidenceHigh, kSize * 2, kSize * 2);
  cv::Mat confidence(kSize, kSize, CV_8UC1, cv::Scalar(kConfidenceLow));
  confidence.rowRange(0, kSize / 2).setTo(kConfidenceHigh);
  top_half.confidence = make_confidence_buffer(confidence);

  for (int round = 0; round < 50; round++) {
    PointStore store;
    ASSERT_EQ(fuse_frame(top_half, FuseParams(), store).inserted, kCells / 2);

    FusionSession session(store);
    session.set_capturing(true);
    auto frame = make_frame(kSize, kSize, 1.f, kConfidenceHigh, kSize * 2, kSize * 2);
    auto gate = std::make_shared<GateBuffer>(frame.depth);
    frame.depth = gate;
    auto entered = gate->entered();

    std::promise<void> go;
    std::shared_future<void> started(go.get_future());
    std::thread resetter([&]() {
      started.wait();
      session.reset();
    });
    std::future<FusionSession::SubmitResult> pass =
        std::async(std::launch::async, [&]() { return session.submit(frame); });
    ASSERT_EQ(entered.wait_for(std::chrono::seconds(10)), std::future_status::ready);

    gate->release();
    go.set_value();
    resetter.join();
    EXPECT_EQ(pass.get(), FusionSession::SubmitResult::kFused);

    const size_t count = store.count();
    EXPECT_TRUE(count == 0 or count == kCells) << "round " << round << " left " << count << " points";
  }
}

TEST(FusionSessionTest, NotifiesListenerAfterEachPass) {
  PointStore store;
  FusionSession session(store);
  session.set_capturing(true);
  size_t calls = 0;
  size_t inserted = 0;
  session.set_pass_listener([&](const FuseStats &stats) {
    calls++;
    inserted += stats.inserted;
  });
  session.submit(make_frame(4, 4, 1.f, kConfidenceHigh, 8, 8));
  session.submit(make_frame(4, 4, 1.f, kConfidenceHigh, 8, 8));
  EXPECT_EQ(calls, 2u);
  EXPECT_EQ(inserted, 16u);
}

TEST(FusionSessionTest, ResetStartsFromEmpty) {
  PointStore store;
  FusionSession session(store);
  session.set_capturing(true);
  session.submit(make_frame(4, 4, 1.f, kConfidenceHigh, 8, 8));
  ASSERT_EQ(store.count(), 16u);
  session.reset();
  EXPECT_EQ(store.count(), 0u);
  EXPECT_TRUE(store.snapshot().empty());
  session.submit(make_frame(4, 4, 1.f, kConfidenceHigh, 8, 8));
  EXPECT_EQ(store.count(), 16u);
}
