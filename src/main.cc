#include <boost/log/trivial.hpp>
#include <boost/log/expressions.hpp>
#include <cstdlib>
#include "Options.hpp"
#include "load_inputs.hpp"
#include "fusion_session.hpp"
#include "ply_export.hpp"

int main(int argc, char *argv[]) {
  boost::log::core::get()->set_filter(
      boost::log::trivial::severity >= boost::log::trivial::info
  );

  parse_commandline(argc, argv);
  if (options.debug) {
    boost::log::core::get()->set_filter(
        boost::log::trivial::severity >= boost::log::trivial::debug
    );
  }

  std::vector<FrameInfo> frames;
  load_sequence(options.inputs_dir, frames);

  Orientation orientation_override = Orientation::kPortrait;
  const bool override_orientation = !options.orientation.empty();
  if (override_orientation) {
    parse_orientation(options.orientation, orientation_override);
  }

  FuseParams params;
  params.density = options.density;
  params.max_depth = options.max_depth;

  PointStore store;
  FusionSession session(store, params);
  session.set_pass_listener([&store](const FuseStats &stats) {
    BOOST_LOG_TRIVIAL(debug) << "+" << stats.inserted << " points, total " << store.count();
  });
  session.set_capturing(true);

  size_t skipped = 0;
  for (const auto &info : frames) {
    Frame frame;
    if (!load_frame(info, frame)) {
      BOOST_LOG_TRIVIAL(error) << "drop frame " << info.stem;
      skipped++;
      continue;
    }
    if (override_orientation) {
      frame.orientation = orientation_override;
    }
    const auto result = session.submit(frame);
    if (result != FusionSession::SubmitResult::kFused) {
      BOOST_LOG_TRIVIAL(info) << "frame " << info.stem << " " << submit_result_name(result);
      skipped++;
    }
  }
  BOOST_LOG_TRIVIAL(info) << "fused " << session.frames_fused() << " frames, dropped " << skipped
                          << ", " << store.count() << " points";

  BOOST_LOG_TRIVIAL(info) << "write ply file ...";
  try {
    export_point_store(options.output_file, store);
  }
  catch (const PlyExportError &ex) {
    BOOST_LOG_TRIVIAL(fatal) << "export failed: " << ex.what();
    return EXIT_FAILURE;
  }
  BOOST_LOG_TRIVIAL(info) << "done";
  return 0;
}
