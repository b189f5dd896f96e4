#ifndef WALKER_HPP
#define WALKER_HPP

#include <filesystem>
#include <set>
#include <string>
#include <vector>

namespace fs = std::filesystem;

struct WalkEntry {
  fs::path path;
  bool is_file = false;
};

class DirectoryWalker {
public:
  static constexpr const char *IGNORE_FILE = ".kilnignore";

  DirectoryWalker(fs::path root, std::vector<fs::path> exclusions = {},
                  bool follow_links = true);

  // Entries in lexical order. Hidden names, excluded roots and names listed
  // in the root ignore file are skipped along with everything below them.
  std::vector<WalkEntry> walk() const;

  // True when the path or any of its ancestors below the root is skipped.
  bool is_excluded(const fs::path &path) const;

private:
  bool is_excluded_entry(const fs::path &path) const;
  void load_ignore_file();

  fs::path root_;
  std::vector<fs::path> exclusions_;
  std::set<std::string> ignored_names_;
  bool follow_links_;
};

#endif
