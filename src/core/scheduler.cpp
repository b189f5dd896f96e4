#include "scheduler.hpp"
#include "utils/errors.hpp"
#include "utils/log.hpp"
#include <algorithm>
#include <boost/asio/post.hpp>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <thread>

namespace {

bool is_component_prefix(const fs::path &prefix, const fs::path &path) {
  auto p = prefix.begin();
  auto q = path.begin();
  for (; p != prefix.end(); ++p, ++q) {
    if (p->empty()) {
      // Trailing separator.
      continue;
    }
    if (q == path.end() || *p != *q) {
      return false;
    }
  }
  return true;
}

KilnError wrap_error(const std::exception &e, const fs::path &source) {
  return KilnError(ErrorKind::Build, source.string() + ": " + e.what(),
                   source);
}

struct PassState {
  std::mutex mutex;
  std::condition_variable done;
  std::size_t pending = 0;
  std::vector<KilnError> errors;
  std::vector<RenderOutcome> outcomes;
};

} // namespace

SchedulerOptions SchedulerOptions::from(const ProfileSettings &settings) {
  SchedulerOptions options;
  options.parallel = settings.parallel;
  options.workers = settings.workers;
  options.fail_fast = settings.fail_fast;
  options.force = settings.force;
  return options;
}

bool BuildScope::matches(const fs::path &source) const {
  if (paths.empty()) {
    return true;
  }
  fs::path normal = source.lexically_normal();
  return std::any_of(paths.begin(), paths.end(), [&](const fs::path &entry) {
    return is_component_prefix(entry.lexically_normal(), normal);
  });
}

void BuildReport::record(RenderOutcome outcome) {
  switch (outcome.action) {
  case RenderOutcome::Action::Rendered:
    ++rendered;
    break;
  case RenderOutcome::Action::Copied:
  case RenderOutcome::Action::Linked:
    ++copied;
    break;
  case RenderOutcome::Action::Skipped:
    ++skipped;
    break;
  case RenderOutcome::Action::Noop:
    ++noop;
    break;
  }
  outcomes.push_back(std::move(outcome));
}

void BuildReport::merge(BuildReport other) {
  rendered += other.rendered;
  copied += other.copied;
  skipped += other.skipped;
  noop += other.noop;
  unchanged += other.unchanged;
  for (auto &outcome : other.outcomes) {
    outcomes.push_back(std::move(outcome));
  }
}

Scheduler::Scheduler(SchedulerOptions options) : options_(options) {}

Scheduler::~Scheduler() {
  for (auto &pool : abandoned_) {
    pool->join();
  }
}

std::size_t Scheduler::worker_count(std::size_t jobs) const {
  std::size_t workers = options_.workers;
  if (workers == 0) {
    workers = std::max(1u, std::thread::hardware_concurrency());
  }
  return std::max<std::size_t>(1, std::min(workers, jobs));
}

std::vector<fs::path> Scheduler::select(const Collation &collation,
                                        const BuildScope &scope) const {
  std::vector<fs::path> selected;
  for (const auto &[source, page] : collation.pages()) {
    if (scope.matches(source)) {
      selected.push_back(source);
    }
  }
  for (const auto &[source, resource] : collation.targets()) {
    if (scope.matches(source)) {
      selected.push_back(source);
    }
  }
  std::sort(selected.begin(), selected.end());
  return selected;
}

std::vector<fs::path>
Scheduler::prune(const Collation &collation,
                 const std::vector<fs::path> &sources) const {
  auto manifest = collation.manifest();
  if (!manifest) {
    return sources;
  }

  std::vector<fs::path> dirty;
  for (const auto &source : sources) {
    auto destination = collation.destination(source);
    fs::path output =
        destination ? collation.path() / *destination : fs::path();
    if (manifest->is_dirty(source, output, options_.force)) {
      dirty.push_back(source);
    }
  }
  return dirty;
}

BuildReport Scheduler::run(const Collation &collation, const BuildScope &scope,
                           const FileTask &task) {
  std::vector<fs::path> selected = select(collation, scope);
  std::vector<fs::path> dirty = prune(collation, selected);

  BuildReport report;
  if (!dirty.empty()) {
    if (options_.parallel && dirty.size() > 1) {
      report = run_parallel(collation, dirty, task);
    } else {
      report = run_sequential(collation, dirty, task);
    }
  }
  report.unchanged = selected.size() - dirty.size();
  return report;
}

BuildReport Scheduler::run_sequential(const Collation &collation,
                                      const std::vector<fs::path> &sources,
                                      const FileTask &task) const {
  BuildReport report;
  auto manifest = collation.manifest();
  for (const auto &source : sources) {
    try {
      report.record(task(source));
    } catch (const KilnError &) {
      throw;
    } catch (const std::exception &e) {
      throw wrap_error(e, source);
    }
    if (manifest) {
      manifest->touch(source);
    }
  }
  return report;
}

BuildReport Scheduler::run_parallel(const Collation &collation,
                                    const std::vector<fs::path> &sources,
                                    const FileTask &task) {
  auto state = std::make_shared<PassState>();
  state->pending = sources.size();
  auto work = std::make_shared<FileTask>(task);
  auto manifest = collation.manifest();
  auto pool = std::make_shared<boost::asio::thread_pool>(
      worker_count(sources.size()));

  Log::debug("Dispatching " + std::to_string(sources.size()) + " files to " +
             std::to_string(worker_count(sources.size())) + " workers");

  for (const auto &source : sources) {
    boost::asio::post(*pool, [state, work, manifest, source]() {
      std::optional<RenderOutcome> outcome;
      std::optional<KilnError> error;
      try {
        outcome = (*work)(source);
        if (manifest) {
          manifest->touch(source);
        }
      } catch (const KilnError &e) {
        error = e;
      } catch (const std::exception &e) {
        error = wrap_error(e, source);
      }

      std::lock_guard<std::mutex> lock(state->mutex);
      if (error) {
        state->errors.push_back(std::move(*error));
      } else {
        state->outcomes.push_back(std::move(*outcome));
      }
      --state->pending;
      state->done.notify_all();
    });
  }

  if (options_.fail_fast) {
    std::unique_lock<std::mutex> lock(state->mutex);
    state->done.wait(lock, [&state] {
      return state->pending == 0 || !state->errors.empty();
    });
    if (!state->errors.empty()) {
      KilnError first = state->errors.front();
      lock.unlock();
      pool->stop();
      abandoned_.push_back(pool);
      throw first;
    }
  }

  pool->join();

  if (!state->errors.empty()) {
    std::sort(state->errors.begin(), state->errors.end(),
              [](const KilnError &a, const KilnError &b) {
                return a.path() < b.path();
              });
    throw MultiError(std::move(state->errors));
  }

  std::sort(state->outcomes.begin(), state->outcomes.end(),
            [](const RenderOutcome &a, const RenderOutcome &b) {
              return a.source < b.source;
            });

  BuildReport report;
  for (auto &outcome : state->outcomes) {
    report.record(std::move(outcome));
  }
  return report;
}
