//
// Created by lucius on 10/10/20.
//

#ifndef LIDAR_FUSE_LOAD_INPUTS_HPP
#define LIDAR_FUSE_LOAD_INPUTS_HPP


#include <vector>
#include <Eigen/Eigen>
#include <boost/filesystem.hpp>
#include "point_fusion.hpp"

struct FrameInfo {
  std::string stem;
  boost::filesystem::path camera;
  boost::filesystem::path depth;
  boost::filesystem::path smoothed_depth;
  boost::filesystem::path confidence;
  boost::filesystem::path color;
};

// every <stem>.txt camera file in inputs_dir, sorted by stem
void load_sequence(const std::string &inputs_dir, std::vector<FrameInfo> &frames);

// extrinsic (4x4 camera to world), intrinsic (3x3) and orientation tag
bool read_camera_file(const boost::filesystem::path &path, Frame &frame);

// false only if the camera file is unusable. missing plane files leave the
// plane empty, fusion then skips the frame.
bool load_frame(const FrameInfo &info, Frame &frame);


#endif //LIDAR_FUSE_LOAD_INPUTS_HPP
