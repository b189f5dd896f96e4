#pragma once

#include <chrono>
#include <condition_variable>
#include <efsw/efsw.hpp>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <vector>

class SiteBuilder;

enum class ChangeKind { Upsert, Remove };

struct FileChange {
  std::filesystem::path path;
  ChangeKind kind;
};

// Collects efsw notifications from the watcher thread. The watch loop drains
// them on the main thread, so the collation is only touched between passes.
class SiteChangeListener : public efsw::FileWatchListener {
private:
  std::filesystem::path project_root;
  std::filesystem::path output_dir;
  std::mutex mutex_;
  std::condition_variable changed_;
  std::map<std::filesystem::path, ChangeKind> pending_;

  void push(const std::filesystem::path &path, ChangeKind kind);

public:
  SiteChangeListener(const std::filesystem::path &root,
                     const std::filesystem::path &output);

  void handleFileAction(efsw::WatchID watchid, const std::string &dir,
                        const std::string &filename, efsw::Action action,
                        std::string oldFilename = "") override;

  bool is_ignored(const std::filesystem::path &path) const;

  // Blocks until something changed, then waits for `quiet` without further
  // events before returning the batch. Later events for a path replace
  // earlier ones.
  std::vector<FileChange> wait(std::chrono::milliseconds quiet);
};

// Builds once, then rebuilds changed files until the process is stopped.
void watch_site(SiteBuilder &builder);
