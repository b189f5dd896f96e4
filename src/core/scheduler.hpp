#ifndef SCHEDULER_HPP
#define SCHEDULER_HPP

#include "collation.hpp"
#include "renderer.hpp"
#include "utils/config.hpp"
#include <boost/asio/thread_pool.hpp>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <vector>

namespace fs = std::filesystem;

using FileTask = std::function<RenderOutcome(const fs::path &)>;

struct SchedulerOptions {
  bool parallel = true;
  // 0 means one worker per hardware thread.
  std::size_t workers = 0;
  bool fail_fast = true;
  bool force = false;

  static SchedulerOptions from(const ProfileSettings &settings);
};

// Which sources a pass covers. Empty means the whole collation; a directory
// entry covers everything below it, a file entry only itself.
struct BuildScope {
  std::vector<fs::path> paths;

  bool empty() const { return paths.empty(); }
  bool matches(const fs::path &source) const;
};

struct BuildReport {
  std::size_t rendered = 0;
  std::size_t copied = 0;
  std::size_t skipped = 0;
  std::size_t noop = 0;
  std::size_t unchanged = 0;
  std::vector<RenderOutcome> outcomes;

  void record(RenderOutcome outcome);
  void merge(BuildReport other);
  std::size_t processed() const { return rendered + copied + skipped + noop; }
};

class Scheduler {
public:
  explicit Scheduler(SchedulerOptions options);
  ~Scheduler();

  Scheduler(const Scheduler &) = delete;
  Scheduler &operator=(const Scheduler &) = delete;

  std::vector<fs::path> select(const Collation &collation,
                               const BuildScope &scope) const;
  std::vector<fs::path> prune(const Collation &collation,
                              const std::vector<fs::path> &sources) const;

  // Runs `task` for every selected, dirty source of the collation. A failed
  // fail-fast pass throws the first error as soon as it is seen; queued
  // work is dropped and tasks already running finish in the background
  // until the scheduler is destroyed.
  BuildReport run(const Collation &collation, const BuildScope &scope,
                  const FileTask &task);

  std::size_t worker_count(std::size_t jobs) const;
  const SchedulerOptions &options() const { return options_; }

private:
  BuildReport run_sequential(const Collation &collation,
                             const std::vector<fs::path> &sources,
                             const FileTask &task) const;
  BuildReport run_parallel(const Collation &collation,
                           const std::vector<fs::path> &sources,
                           const FileTask &task);

  SchedulerOptions options_;
  std::vector<std::shared_ptr<boost::asio::thread_pool>> abandoned_;
};

#endif
