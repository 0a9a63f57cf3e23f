//
// Created by lucius on 9/26/20.
//

#include <boost/program_options.hpp>
#include <boost/log/trivial.hpp>
#include "Options.hpp"
#include "camera_transform.hpp"

namespace po = boost::program_options;

Options options;

void parse_commandline(int argc, char *argv[]) {
  try {
    po::options_description desc{"Options"};
    desc.add_options()("help,h", "Help screen")
        ("inputs_dir", po::value<std::string>(&options.inputs_dir), "directory of recorded frames")
        ("output_file", po::value<std::string>(&options.output_file), "ply file to write")
        ("config", po::value<std::string>(&options.config_file), "ini file with any of these options")
        ("orientation", po::value<std::string>(&options.orientation),
         "override frame orientation [portrait|portrait_upside_down|landscape_left|landscape_right]")
        ("debug", po::bool_switch(&options.debug), "debug")
        ("density", po::value<float>(&options.density), "grid cells per meter")
        ("max_depth", po::value<float>(&options.max_depth), "farthest accepted depth in meters");

    po::positional_options_description pos_desc;
    pos_desc.add("inputs_dir", 1).add("output_file", 1);

    po::command_line_parser parser{argc, argv};
    parser.options(desc).positional(pos_desc);
    po::parsed_options parsed_options = parser.run();

    po::variables_map vm;
    store(parsed_options, vm);
    if (vm.count("config")) {
      const auto config_file = vm["config"].as<std::string>();
      store(po::parse_config_file<char>(config_file.c_str(), desc), vm);
    }
    notify(vm);

    if (vm.count("help")) {
      BOOST_LOG_TRIVIAL(error) << desc << '\n';
      exit(EXIT_FAILURE);
    }

    if (options.inputs_dir.empty() or options.output_file.empty()) {
      BOOST_LOG_TRIVIAL(error) << "you must provide [inputs_dir output_file]";
      exit(EXIT_FAILURE);
    }

    if (!(options.density > 0.f) or !(options.max_depth > 0.f)) {
      BOOST_LOG_TRIVIAL(error) << "density and max_depth must be positive";
      exit(EXIT_FAILURE);
    }

    Orientation orientation;
    if (!options.orientation.empty() and !parse_orientation(options.orientation, orientation)) {
      BOOST_LOG_TRIVIAL(error) << "unknown orientation " << options.orientation;
      exit(EXIT_FAILURE);
    }
  }
  catch (const po::error &ex) {
    BOOST_LOG_TRIVIAL(error) << ex.what() << '\n';
    exit(EXIT_FAILURE);
  }
}
