//
// Created by lucius on 10/17/26.
//

#ifndef LIDAR_FUSE_CAMERA_TRANSFORM_HPP
#define LIDAR_FUSE_CAMERA_TRANSFORM_HPP

#include <string>
#include <Eigen/Core>

enum class Orientation {
  kLandscapeRight,
  kLandscapeLeft,
  kPortrait,
  kPortraitUpsideDown,
};

bool parse_orientation(const std::string &name, Orientation &orientation);
const char *orientation_name(Orientation orientation);

// rotation the compositor applies about the viewing axis for the orientation
float orientation_angle(Orientation orientation);

// sensor camera space (y down, z forward) -> camera space (y up, z backward)
Eigen::Matrix4f axis_flip_matrix();
Eigen::Matrix4f orientation_rotation(Orientation orientation);

// world -> display aligned camera for a camera-to-world pose
Eigen::Matrix4f view_matrix(const Eigen::Matrix4f &pose, Orientation orientation);

// maps unprojected sensor space points to world space
Eigen::Matrix4f build_camera_transform(const Eigen::Matrix4f &pose, Orientation orientation);

#endif //LIDAR_FUSE_CAMERA_TRANSFORM_HPP
