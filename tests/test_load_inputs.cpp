/**
 * @file test_load_inputs.cpp
 * @brief Recorded frame directories
 */

#include <gtest/gtest.h>
#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>
#include <opencv2/imgcodecs.hpp>
#include "load_inputs.hpp"
#include "test_frames.hpp"

namespace fs = boost::filesystem;

namespace {

const char *kCamera =
    "extrinsic\n"
    "1 0 0 0.5\n"
    "0 1 0 -1\n"
    "0 0 1 2\n"
    "0 0 0 1\n"
    "intrinsic\n"
    "1 0 0\n"
    "0 1 0\n"
    "0 0 1\n"
    "orientation\n"
    "landscape_left\n";

class LoadInputsTest : public ::testing::Test {
protected:
  void SetUp() override {
    dir_ = fs::temp_directory_path() / fs::unique_path("lidar_fuse_%%%%-%%%%");
    fs::create_directories(dir_);
  }
  void TearDown() override {
    boost::system::error_code ec;
    fs::remove_all(dir_, ec);
  }

  fs::path write_text(const std::string &name, const std::string &content) {
    const auto path = dir_ / name;
    fs::ofstream out(path);
    out << content;
    return path;
  }

  fs::path dir_;
};

}

TEST_F(LoadInputsTest, ReadsCameraFile) {
  Frame frame;
  ASSERT_TRUE(read_camera_file(write_text("0001.txt", kCamera), frame));
  EXPECT_FLOAT_EQ(frame.pose(0, 3), 0.5f);
  EXPECT_FLOAT_EQ(frame.pose(1, 3), -1.f);
  EXPECT_FLOAT_EQ(frame.pose(2, 3), 2.f);
  EXPECT_TRUE(frame.intrinsics.isIdentity());
  EXPECT_EQ(frame.orientation, Orientation::kLandscapeLeft);
}

TEST_F(LoadInputsTest, RejectsMalformedCameraFiles) {
  Frame frame;
  EXPECT_FALSE(read_camera_file(dir_ / "absent.txt", frame));
  EXPECT_FALSE(read_camera_file(write_text("a.txt", "pose\n1 0 0 0\n"), frame));
  EXPECT_FALSE(read_camera_file(write_text("b.txt", "extrinsic\n1 0 0 0\n0 1 0 0\n"), frame));

  std::string sideways(kCamera);
  sideways.replace(sideways.find("landscape_left"), 14, "sideways");
  EXPECT_FALSE(read_camera_file(write_text("c.txt", sideways), frame));
  EXPECT_TRUE(frame.pose.isIdentity());
}

TEST_F(LoadInputsTest, SequenceIsOrderedByStem) {
  write_text("0002.txt", kCamera);
  write_text("0001.txt", kCamera);
  write_text("notes.md", "not a frame");

  std::vector<FrameInfo> frames;
  load_sequence(dir_.string(), frames);
  ASSERT_EQ(frames.size(), 2u);
  EXPECT_EQ(frames[0].stem, "0001");
  EXPECT_EQ(frames[1].stem, "0002");
  EXPECT_EQ(frames[0].depth.filename().string(), "0001_depth.pfm");
  EXPECT_EQ(frames[0].confidence.filename().string(), "0001_conf.png");
  EXPECT_EQ(frames[0].color.filename().string(), "0001_color.png");
}

TEST_F(LoadInputsTest, MissingPlanesLeaveFrameEmpty) {
  write_text("0001.txt", kCamera);
  std::vector<FrameInfo> frames;
  load_sequence(dir_.string(), frames);
  ASSERT_EQ(frames.size(), 1u);

  Frame frame;
  ASSERT_TRUE(load_frame(frames[0], frame));
  EXPECT_TRUE(frame.depth == nullptr);
  EXPECT_TRUE(frame.confidence == nullptr);
  EXPECT_TRUE(frame.color == nullptr);

  PointStore store;
  EXPECT_TRUE(fuse_frame(frame, FuseParams(), store).skipped);
  EXPECT_EQ(store.count(), 0u);
}

TEST_F(LoadInputsTest, RecordedFrameFuses) {
  std::string camera(kCamera);
  camera.replace(camera.find("landscape_left"), 14, "portrait");
  write_text("0001.txt", camera);
  ASSERT_TRUE(cv::imwrite((dir_ / "0001_depth.pfm").string(), cv::Mat(4, 4, CV_32FC1, cv::Scalar(1.f))));
  ASSERT_TRUE(cv::imwrite((dir_ / "0001_conf.png").string(), cv::Mat(4, 4, CV_8UC1, cv::Scalar(kConfidenceHigh))));
  ASSERT_TRUE(cv::imwrite((dir_ / "0001_color.png").string(), make_nv12(8, 8, 235, 128, 128)));

  std::vector<FrameInfo> frames;
  load_sequence(dir_.string(), frames);
  ASSERT_EQ(frames.size(), 1u);
  Frame frame;
  ASSERT_TRUE(load_frame(frames[0], frame));
  ASSERT_TRUE(frame.depth != nullptr);
  ASSERT_TRUE(frame.confidence != nullptr);
  ASSERT_TRUE(frame.color != nullptr);
  EXPECT_TRUE(frame.smoothed_depth == nullptr);
  EXPECT_EQ(frame.color->width(), 8);
  EXPECT_EQ(frame.color->height(), 8);

  PointStore store;
  const auto stats = fuse_frame(frame, FuseParams(), store);
  EXPECT_EQ(stats.inserted, 16u);
  // translated by the pose
  bool found = false;
  for (const auto &vertex : store.snapshot()) {
    found = found or vertex.position.isApprox(Eigen::Vector3f(0.5f, -1.f, 1.f), 1e-5f);
  }
  EXPECT_TRUE(found);
}
