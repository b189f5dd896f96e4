#include "walker.hpp"
#include "utils/errors.hpp"
#include <algorithm>
#include <fstream>

DirectoryWalker::DirectoryWalker(fs::path root, std::vector<fs::path> exclusions,
                                 bool follow_links)
    : root_(std::move(root)), follow_links_(follow_links) {
  for (auto &path : exclusions) {
    exclusions_.push_back(path.lexically_normal());
  }
  load_ignore_file();
}

void DirectoryWalker::load_ignore_file() {
  std::ifstream file(root_ / IGNORE_FILE);
  if (!file.is_open()) {
    return;
  }
  std::string line;
  while (std::getline(file, line)) {
    while (!line.empty() && (line.back() == '\r' || line.back() == ' ' ||
                             line.back() == '/')) {
      line.pop_back();
    }
    if (line.empty() || line[0] == '#') {
      continue;
    }
    if (line.find('/') != std::string::npos) {
      exclusions_.push_back((root_ / line).lexically_normal());
    } else {
      ignored_names_.insert(line);
    }
  }
}

bool DirectoryWalker::is_excluded(const fs::path &path) const {
  fs::path root = root_.lexically_normal();
  for (fs::path p = path.lexically_normal(); p.has_filename() && p != root;
       p = p.parent_path()) {
    if (is_excluded_entry(p)) {
      return true;
    }
  }
  return false;
}

bool DirectoryWalker::is_excluded_entry(const fs::path &path) const {
  std::string name = path.filename().string();
  if (!name.empty() && name[0] == '.') {
    return true;
  }
  if (ignored_names_.count(name) > 0) {
    return true;
  }
  fs::path normal = path.lexically_normal();
  return std::find(exclusions_.begin(), exclusions_.end(), normal) !=
         exclusions_.end();
}

std::vector<WalkEntry> DirectoryWalker::walk() const {
  std::vector<WalkEntry> entries;
  if (!fs::is_directory(root_)) {
    throw KilnError(ErrorKind::Io,
                    "Source directory not found: " + root_.string(), root_);
  }

  auto options = follow_links_ ? fs::directory_options::follow_directory_symlink
                               : fs::directory_options::none;
  fs::recursive_directory_iterator it(root_, options);
  for (; it != fs::recursive_directory_iterator(); ++it) {
    const fs::path &path = it->path();
    if (is_excluded_entry(path)) {
      if (it->is_directory()) {
        it.disable_recursion_pending();
      }
      continue;
    }
    entries.push_back({path, it->is_regular_file()});
  }

  std::sort(entries.begin(), entries.end(),
            [](const WalkEntry &a, const WalkEntry &b) {
              return a.path < b.path;
            });
  return entries;
}
