//
// Created by lucius on 10/17/26.
//

#include "camera_transform.hpp"
#include <Eigen/Geometry>
#include <Eigen/LU>

bool parse_orientation(const std::string &name, Orientation &orientation) {
  if (name == "landscape_right") {
    orientation = Orientation::kLandscapeRight;
  } else if (name == "landscape_left") {
    orientation = Orientation::kLandscapeLeft;
  } else if (name == "portrait") {
    orientation = Orientation::kPortrait;
  } else if (name == "portrait_upside_down") {
    orientation = Orientation::kPortraitUpsideDown;
  } else {
    return false;
  }
  return true;
}

const char *orientation_name(Orientation orientation) {
  switch (orientation) {
    case Orientation::kLandscapeLeft:
      return "landscape_left";
    case Orientation::kPortrait:
      return "portrait";
    case Orientation::kPortraitUpsideDown:
      return "portrait_upside_down";
    case Orientation::kLandscapeRight:
    default:
      return "landscape_right";
  }
}

float orientation_angle(Orientation orientation) {
  switch (orientation) {
    case Orientation::kLandscapeLeft:
      return static_cast<float>(EIGEN_PI);
    case Orientation::kPortrait:
      return static_cast<float>(EIGEN_PI / 2);
    case Orientation::kPortraitUpsideDown:
      return static_cast<float>(-EIGEN_PI / 2);
    case Orientation::kLandscapeRight:
    default:
      return 0.f;
  }
}

Eigen::Matrix4f axis_flip_matrix() {
  return Eigen::Vector4f(1.f, -1.f, -1.f, 1.f).asDiagonal();
}

Eigen::Matrix4f orientation_rotation(Orientation orientation) {
  Eigen::Matrix4f rotation = Eigen::Matrix4f::Identity();
  rotation.block<3, 3>(0, 0) =
      Eigen::AngleAxisf(orientation_angle(orientation), Eigen::Vector3f::UnitZ()).toRotationMatrix();
  return rotation;
}

Eigen::Matrix4f view_matrix(const Eigen::Matrix4f &pose, Orientation orientation) {
  const Eigen::Matrix4f display_pose = pose * orientation_rotation(orientation);
  return display_pose.inverse();
}

Eigen::Matrix4f build_camera_transform(const Eigen::Matrix4f &pose, Orientation orientation) {
  return view_matrix(pose, orientation).inverse() * axis_flip_matrix() * orientation_rotation(orientation);
}
