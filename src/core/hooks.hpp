#ifndef HOOKS_HPP
#define HOOKS_HPP

#include "utils/config.hpp"
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace fs = std::filesystem;

enum class HookPhase { Before, After };

// External commands run around a build. Hooks of a phase run one after the
// other, in configuration order, with the project root as working directory.
class HookRunner {
public:
  HookRunner(const SiteConfig &config, const RuntimeOptions &options);

  std::vector<const HookConfig *> collect(HookPhase phase) const;
  void run(HookPhase phase) const;
  void exec(const HookConfig &hook) const;

  // Relative commands ("./scripts/x") resolve against the project root.
  fs::path command_path(const HookConfig &hook) const;
  std::map<std::string, std::string> environment() const;

private:
  const SiteConfig &config_;
  const RuntimeOptions &options_;
};

#endif
