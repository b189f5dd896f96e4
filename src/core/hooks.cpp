#include "hooks.hpp"
#include "utils/errors.hpp"
#include "utils/log.hpp"
#include <algorithm>
#include <reproc++/run.hpp>

HookRunner::HookRunner(const SiteConfig &config, const RuntimeOptions &options)
    : config_(config), options_(options) {}

std::vector<const HookConfig *> HookRunner::collect(HookPhase phase) const {
  std::vector<const HookConfig *> hooks;
  for (const auto &hook : config_.hooks) {
    bool after = hook.after.value_or(false);
    if ((phase == HookPhase::After) != after) {
      continue;
    }
    if (!hook.profiles.empty() &&
        std::find(hook.profiles.begin(), hook.profiles.end(),
                  options_.settings.name) == hook.profiles.end()) {
      continue;
    }
    hooks.push_back(&hook);
  }
  return hooks;
}

void HookRunner::run(HookPhase phase) const {
  for (const HookConfig *hook : collect(phase)) {
    exec(*hook);
  }
}

fs::path HookRunner::command_path(const HookConfig &hook) const {
  if (!hook.path.empty() && hook.path[0] == '.') {
    return (options_.project / hook.path).lexically_normal();
  }
  return fs::path(hook.path);
}

std::map<std::string, std::string> HookRunner::environment() const {
  std::error_code ec;
  fs::path root = fs::weakly_canonical(options_.project, ec);
  if (ec) {
    root = fs::absolute(options_.project);
  }
  fs::path target = fs::weakly_canonical(options_.target, ec);
  if (ec) {
    target = fs::absolute(options_.target);
  }

  std::map<std::string, std::string> env;
  env["NODE_ENV"] = options_.settings.release ? "production" : "development";
  env["PROJECT_ROOT"] = root.string();
  env["BUILD_SOURCE"] = options_.source.lexically_relative(options_.project)
                            .generic_string();
  env["BUILD_TARGET"] = target.lexically_relative(root).generic_string();
  return env;
}

void HookRunner::exec(const HookConfig &hook) const {
  if (hook.path.empty()) {
    throw KilnError(ErrorKind::Hook, "Hook '" + hook.name + "' has no path");
  }

  std::vector<std::string> args;
  args.push_back(command_path(hook).string());
  args.insert(args.end(), hook.args.begin(), hook.args.end());

  std::string line;
  for (const auto &arg : args) {
    line += (line.empty() ? "" : " ") + arg;
  }
  Log::info("Hook " + hook.name + ": " + line);

  std::map<std::string, std::string> env = environment();
  std::vector<std::string> env_strings;
  std::vector<const char *> env_ptrs;
  for (const auto &[key, value] : env) {
    Log::debug(key + "=" + value);
    env_strings.push_back(key + "=" + value);
  }
  for (const auto &s : env_strings) {
    env_ptrs.push_back(s.c_str());
  }
  env_ptrs.push_back(nullptr);

  std::string working_dir = options_.project.string();

  reproc::options options;
  options.redirect.out.type = reproc::redirect::parent;
  options.redirect.err.type = reproc::redirect::parent;
  options.working_directory = working_dir.c_str();
  options.env.behavior = reproc::env::extend;
  options.env.extra = env_ptrs.data();

  auto [status, ec] = reproc::run(args, options);

  if (ec) {
    throw KilnError(ErrorKind::Hook,
                    "Hook '" + hook.name + "' could not run: " + ec.message(),
                    command_path(hook));
  }
  if (status != 0) {
    throw KilnError(ErrorKind::Hook,
                    "Hook '" + hook.name + "' exited with status " +
                        std::to_string(status),
                    command_path(hook));
  }
}
