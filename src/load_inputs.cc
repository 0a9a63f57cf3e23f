//
// Created by lucius on 10/10/20.
//

#include "load_inputs.hpp"
#include <boost/log/trivial.hpp>
#include <boost/filesystem/fstream.hpp>
#include <opencv2/imgcodecs.hpp>
#include <algorithm>
#include <cstdlib>

namespace fs = boost::filesystem;

namespace {

bool expect_signature(std::istream &in, const char *expected, const fs::path &path) {
  std::string signature;
  in >> signature;
  if (signature != expected) {
    BOOST_LOG_TRIVIAL(error) << path << ": expect " << expected << " got \"" << signature << "\"";
    return false;
  }
  return true;
}

cv::Mat read_plane(const fs::path &path) {
  if (!fs::is_regular_file(path)) {
    return cv::Mat();
  }
  cv::Mat plane = cv::imread(path.string(), cv::IMREAD_UNCHANGED);
  if (plane.empty()) {
    BOOST_LOG_TRIVIAL(warning) << "can not decode " << path;
  }
  return plane;
}

}

void load_sequence(const std::string &inputs_dir, std::vector<FrameInfo> &frames)
{
  fs::path proj_dir(inputs_dir);
  try
  {
    if (!fs::exists(proj_dir)) {
      BOOST_LOG_TRIVIAL(fatal) << proj_dir << " does not exist";
      exit(EXIT_FAILURE);
    }
    if (!fs::is_directory(proj_dir)) {
      BOOST_LOG_TRIVIAL(fatal) << proj_dir << " exists, but is not a directory";
      exit(EXIT_FAILURE);
    }

    std::vector<fs::path> cameras;
    for(const auto &it: fs::directory_iterator(proj_dir)){
      const auto &p = it.path();
      if(p.extension() == ".txt" and fs::is_regular_file(p)){
        cameras.push_back(p);
      }
    }
    std::sort(cameras.begin(), cameras.end());

    frames.clear();
    frames.reserve(cameras.size());
    for(const auto &it: cameras){
      FrameInfo info;
      info.stem = it.stem().string();
      info.camera = it;
      info.depth = it.parent_path()/(info.stem + "_depth.pfm");
      info.smoothed_depth = it.parent_path()/(info.stem + "_smooth.pfm");
      info.confidence = it.parent_path()/(info.stem + "_conf.png");
      info.color = it.parent_path()/(info.stem + "_color.png");
      if(!fs::is_regular_file(info.depth) or !fs::is_regular_file(info.confidence) or !fs::is_regular_file(info.color)){
        BOOST_LOG_TRIVIAL(warning) << "frame " << info.stem << " is missing planes, it will be dropped";
      }
      frames.push_back(info);
    }
    BOOST_LOG_TRIVIAL(info) << "sequence have " << frames.size() << " frames";
  }
  catch (const fs::filesystem_error& ex)
  {
    BOOST_LOG_TRIVIAL(fatal) << ex.what();
    exit(EXIT_FAILURE);
  }
}

bool read_camera_file(const fs::path &path, Frame &frame)
{
  fs::ifstream in(path);
  if (!in.is_open()) {
    BOOST_LOG_TRIVIAL(error) << "can not open camera file " << path;
    return false;
  }

  Eigen::Matrix4f pose;
  Eigen::Matrix3f intrinsics;
  std::string orientation_name;
  if (!expect_signature(in, "extrinsic", path)) {
    return false;
  }
  for(int j = 0; j < 4; j++){
    for(int k = 0; k < 4; k++){
      in >> pose(j, k);
    }
  }
  if (!expect_signature(in, "intrinsic", path)) {
    return false;
  }
  for(int j = 0; j < 3; j++){
    for(int k = 0; k < 3; k++){
      in >> intrinsics(j, k);
    }
  }
  if (!expect_signature(in, "orientation", path)) {
    return false;
  }
  in >> orientation_name;
  if (in.fail()) {
    BOOST_LOG_TRIVIAL(error) << "truncated camera file " << path;
    return false;
  }

  Orientation orientation;
  if (!parse_orientation(orientation_name, orientation)) {
    BOOST_LOG_TRIVIAL(error) << path << ": unknown orientation " << orientation_name;
    return false;
  }

  frame.pose = pose;
  frame.intrinsics = intrinsics;
  frame.orientation = orientation;
  return true;
}

bool load_frame(const FrameInfo &info, Frame &frame)
{
  if (!read_camera_file(info.camera, frame)) {
    return false;
  }

  frame.depth.reset();
  frame.smoothed_depth.reset();
  frame.confidence.reset();
  frame.color.reset();

  const auto depth = read_plane(info.depth);
  if (!depth.empty()) {
    frame.depth = make_depth_buffer(depth);
  }
  const auto smoothed_depth = read_plane(info.smoothed_depth);
  if (!smoothed_depth.empty()) {
    frame.smoothed_depth = make_depth_buffer(smoothed_depth);
  }
  const auto confidence = read_plane(info.confidence);
  if (!confidence.empty()) {
    frame.confidence = make_confidence_buffer(confidence);
  }
  const auto color = read_plane(info.color);
  if (!color.empty()) {
    frame.color = make_nv12_buffer(color);
  }
  return true;
}
