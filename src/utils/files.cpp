#include "files.hpp"
#include "errors.hpp"
#include <fstream>
#include <sstream>

std::string read_file(const fs::path &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    throw KilnError(ErrorKind::Io, "Cannot open file: " + path.string(), path);
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

void write_file(const fs::path &path, const std::string &content) {
  std::error_code ec;
  if (path.has_parent_path()) {
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
      throw KilnError(ErrorKind::Io,
                      "Cannot create directory " +
                          path.parent_path().string() + ": " + ec.message(),
                      path);
    }
  }
  std::ofstream file(path, std::ios::binary);
  if (!file.is_open()) {
    throw KilnError(ErrorKind::Io, "Cannot write file: " + path.string(), path);
  }
  file << content;
  if (!file) {
    throw KilnError(ErrorKind::Io, "Write failed: " + path.string(), path);
  }
}
