//
// Created by lucius on 10/17/26.
//

#include "ply_export.hpp"
#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>
#include <boost/log/trivial.hpp>
#include <cmath>
#include <iomanip>
#include <limits>
#include <locale>
#include <sstream>

namespace fs = boost::filesystem;

namespace {

inline unsigned to_byte(float channel) {
  if (!(channel > 0.f)) {
    return 0;
  }
  if (channel >= 1.f) {
    return 255;
  }
  return static_cast<unsigned>(channel * 255.f);
}

}

std::string format_ascii_ply(const std::vector<Vertex> &vertices) {
  std::ostringstream out;
  out.imbue(std::locale::classic());
  out << "ply\n"
      << "format ascii 1.0\n"
      << "element vertex " << vertices.size() << "\n"
      << "property float x\n"
      << "property float y\n"
      << "property float z\n"
      << "property uchar red\n"
      << "property uchar green\n"
      << "property uchar blue\n"
      << "property uchar alpha\n"
      << "end_header";

  // enough digits for every float to read back bit-exact
  out << std::setprecision(std::numeric_limits<float>::max_digits10);
  for (size_t i = 0; i < vertices.size(); i++) {
    const auto &vertex = vertices[i];
    if (!vertex.position.allFinite()) {
      throw PlyExportError("vertex " + std::to_string(i) + " has a non finite position");
    }
    out << "\n" << vertex.position.x() << " " << vertex.position.y() << " " << vertex.position.z()
        << " " << to_byte(vertex.color[0]) << " " << to_byte(vertex.color[1])
        << " " << to_byte(vertex.color[2]) << " " << to_byte(vertex.color[3]);
  }
  out << "\n";
  return out.str();
}

void write_ascii_ply(const std::string &path, const std::vector<Vertex> &vertices) {
  const std::string content = format_ascii_ply(vertices);

  const fs::path target(path);
  fs::path temp = target;
  temp += ".partial";
  try {
    {
      fs::ofstream out(temp, std::ios::out | std::ios::binary | std::ios::trunc);
      if (!out.is_open()) {
        throw PlyExportError("can not open " + temp.string() + " for writing");
      }
      out.write(content.data(), static_cast<std::streamsize>(content.size()));
      out.close();
      if (out.fail()) {
        throw PlyExportError("failed writing " + temp.string());
      }
    }
    fs::rename(temp, target);
  }
  catch (const fs::filesystem_error &ex) {
    boost::system::error_code ec;
    fs::remove(temp, ec);
    throw PlyExportError(ex.what());
  }
  catch (const PlyExportError &) {
    boost::system::error_code ec;
    fs::remove(temp, ec);
    throw;
  }
  BOOST_LOG_TRIVIAL(info) << "wrote " << vertices.size() << " vertices to " << target;
}

size_t export_point_store(const std::string &path, const PointStore &store) {
  const auto vertices = store.snapshot();
  write_ascii_ply(path, vertices);
  return vertices.size();
}
