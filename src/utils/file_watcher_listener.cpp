#include "file_watcher_listener.hpp"
#include "core/site_builder.hpp"
#include "utils/errors.hpp"
#include "utils/log.hpp"
#include <ctime>
#include <iomanip>
#include <iostream>
#include <termcolor/termcolor.hpp>

namespace fs = std::filesystem;

SiteChangeListener::SiteChangeListener(const fs::path &root,
                                       const fs::path &output)
    : project_root(root.lexically_normal()),
      output_dir(output.lexically_normal()) {}

bool SiteChangeListener::is_ignored(const fs::path &path) const {
  std::string name = path.filename().string();
  if (name.empty() || name[0] == '.' || name[0] == '~' ||
      name.back() == '~') {
    return true;
  }
  fs::path rel = path.lexically_normal().lexically_relative(output_dir);
  return !rel.empty() && *rel.begin() != "..";
}

void SiteChangeListener::push(const fs::path &path, ChangeKind kind) {
  if (is_ignored(path)) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_[path.lexically_normal()] = kind;
  }
  changed_.notify_one();
}

void SiteChangeListener::handleFileAction(efsw::WatchID watchid,
                                          const std::string &dir,
                                          const std::string &filename,
                                          efsw::Action action,
                                          std::string oldFilename) {
  (void)watchid;

  fs::path modified = fs::path(dir) / filename;

  switch (action) {
  case efsw::Actions::Add:
  case efsw::Actions::Modified:
    push(modified, ChangeKind::Upsert);
    break;
  case efsw::Actions::Delete:
    push(modified, ChangeKind::Remove);
    break;
  case efsw::Actions::Moved:
    if (!oldFilename.empty()) {
      push(fs::path(dir) / oldFilename, ChangeKind::Remove);
    }
    push(modified, ChangeKind::Upsert);
    break;
  }
}

std::vector<FileChange>
SiteChangeListener::wait(std::chrono::milliseconds quiet) {
  std::unique_lock<std::mutex> lock(mutex_);
  changed_.wait(lock, [this] { return !pending_.empty(); });

  // Editors tend to write a file in several steps.
  std::size_t seen = pending_.size();
  while (changed_.wait_for(lock, quiet,
                           [&] { return pending_.size() != seen; })) {
    seen = pending_.size();
  }

  std::vector<FileChange> changes;
  for (const auto &[path, kind] : pending_) {
    changes.push_back({path, kind});
  }
  pending_.clear();
  return changes;
}

namespace {

void print_change(const FileChange &change, const fs::path &root) {
  auto now = std::chrono::system_clock::now();
  auto time = std::chrono::system_clock::to_time_t(now);
  std::tm tm = *std::localtime(&time);

  std::cout << "\n"
            << termcolor::bright_blue << std::put_time(&tm, "%H:%M:%S")
            << termcolor::reset << " ";

  if (change.kind == ChangeKind::Remove) {
    std::cout << termcolor::bright_red << "➖ Removed" << termcolor::reset;
  } else {
    std::cout << termcolor::bright_cyan << "📝 Modified" << termcolor::reset;
  }

  std::cout << " " << termcolor::bright_white
            << change.path.lexically_relative(root).generic_string()
            << termcolor::reset << "\n";
}

} // namespace

void watch_site(SiteBuilder &builder) {
  builder.build();

  const RuntimeOptions &options = builder.get_options();
  SiteChangeListener listener(builder.project_root(), options.output);
  efsw::FileWatcher watcher;

  std::cout << "\n"
            << termcolor::bright_cyan << "👁️  Setting up file watchers"
            << termcolor::reset << "\n";

  efsw::WatchID source_watch =
      watcher.addWatch(options.source.string(), &listener, true);
  efsw::WatchID config_watch =
      watcher.addWatch(builder.project_root().string(), &listener, false);
  if (source_watch < 0 || config_watch < 0) {
    throw KilnError(ErrorKind::Io,
                    "Cannot watch " + options.source.string() + ": " +
                        efsw::Errors::Log::getLastErrorLog(),
                    options.source);
  }
  Log::success("Watching " + options.source.string());

  watcher.watch();

  while (true) {
    std::vector<FileChange> changes =
        listener.wait(std::chrono::milliseconds(150));
    auto rebuild_start = std::chrono::high_resolution_clock::now();

    for (const auto &change : changes) {
      // Only the configuration file matters outside the source tree.
      fs::path rel = change.path.lexically_relative(options.source);
      bool in_source = !rel.empty() && *rel.begin() != "..";
      if (!in_source && !builder.is_config_file(change.path)) {
        continue;
      }

      print_change(change, builder.project_root());
      try {
        BuildReport report = change.kind == ChangeKind::Remove
                                 ? builder.remove(change.path)
                                 : builder.update(change.path);
        auto rebuild_end = std::chrono::high_resolution_clock::now();
        auto rebuild_duration =
            std::chrono::duration_cast<std::chrono::milliseconds>(
                rebuild_end - rebuild_start);
        std::cout << termcolor::bright_green << "  ✓ " << termcolor::reset
                  << "Rebuilt " << termcolor::bright_white
                  << report.processed() << termcolor::reset << " file(s) in "
                  << termcolor::bright_white << rebuild_duration.count()
                  << "ms" << termcolor::reset << "\n";
      } catch (const std::exception &e) {
        // A broken page should not end the watch session.
        Log::error(std::string("Rebuild failed: ") + e.what());
      }
    }
  }
}
