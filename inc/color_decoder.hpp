//
// Created by lucius on 10/17/26.
//

#ifndef LIDAR_FUSE_COLOR_DECODER_HPP
#define LIDAR_FUSE_COLOR_DECODER_HPP

#include <cstdint>
#include <Eigen/Core>

// rgba in [0, 1]. DontAlign keeps it safe inside std containers.
typedef Eigen::Matrix<float, 4, 1, Eigen::DontAlign> Color4f;

// limited range (video) BT.601 ycbcr -> rgb, alpha is always 1
Color4f decode_ycbcr(uint8_t y, uint8_t cb, uint8_t cr);

#endif //LIDAR_FUSE_COLOR_DECODER_HPP
