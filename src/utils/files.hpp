#ifndef FILES_HPP
#define FILES_HPP

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

// Both throw KilnError(ErrorKind::Io) with the path attached.
std::string read_file(const fs::path &path);
void write_file(const fs::path &path, const std::string &content);

#endif
