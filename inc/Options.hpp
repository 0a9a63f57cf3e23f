//
// Created by lucius on 9/26/20.
//

#ifndef LIDAR_FUSE_OPTIONS_HPP
#define LIDAR_FUSE_OPTIONS_HPP

#include <string>

struct Options {
  std::string inputs_dir;
  std::string output_file;
  std::string config_file;
  std::string orientation;

  bool debug = false;

  float density = 100.f;
  float max_depth = 2.f;
};

extern Options options;

void parse_commandline(int argc, char *argv[]);

#endif //LIDAR_FUSE_OPTIONS_HPP
