#ifndef MANIFEST_HPP
#define MANIFEST_HPP

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace fs = std::filesystem;

// Incremental build cache: source path -> modification time at the last
// successful build. Shared by scheduler workers.
class Manifest {
public:
  Manifest(fs::path file, bool incremental);

  // `<name>.json` beside the target directory.
  static fs::path file_for(const fs::path &target);

  bool is_dirty(const fs::path &source, const fs::path &destination,
                bool force) const;
  void touch(const fs::path &source);
  bool contains(const fs::path &source) const;
  std::size_t size() const;

  void load();
  void save() const;

  bool incremental() const { return incremental_; }
  const fs::path &file() const { return file_; }

private:
  static std::optional<std::int64_t> modified_time(const fs::path &path);

  fs::path file_;
  bool incremental_;
  mutable std::mutex mutex_;
  std::map<std::string, std::int64_t> entries_;
};

#endif
