#ifndef SITE_BUILDER_HPP
#define SITE_BUILDER_HPP

#include "collaborators.hpp"
#include "collation.hpp"
#include "href.hpp"
#include "redirect.hpp"
#include "scheduler.hpp"
#include "utils/config.hpp"
#include <chrono>
#include <filesystem>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace fs = std::filesystem;

// Command line overrides applied on top of the chosen profile.
struct BuildFlags {
  std::string profile = "debug";
  bool force = false;
};

class SiteBuilder {
public:
  SiteBuilder(const fs::path &root, BuildFlags flags = BuildFlags());

  // Reads kiln.yaml and resolves the profile. Called by the constructor and
  // again by the watch loop when the configuration file changes.
  void load_config();
  void collate();

  BuildReport build(const BuildScope &scope = BuildScope(),
                    bool force = false);
  // Collates and validates redirects without writing anything.
  void check();

  // Watch mode: apply one changed or deleted file and rebuild what it
  // affects. Returns the sources that were rebuilt.
  BuildReport update(const fs::path &file);
  BuildReport remove(const fs::path &file);

  RedirectMap redirects(const Collation &collation) const;
  BuildScope scope_for(const std::vector<std::string> &paths) const;

  void set_highlighter(std::unique_ptr<SyntaxHighlighter> highlighter) {
    highlighter_ = std::move(highlighter);
  }
  void set_book_compiler(std::unique_ptr<BookCompiler> compiler) {
    book_compiler_ = std::move(compiler);
  }

  const SiteConfig &get_config() const { return config_; }
  const RuntimeOptions &get_options() const { return options_; }
  const std::vector<std::shared_ptr<Collation>> &collations() const {
    return collations_;
  }
  const fs::path &project_root() const { return project_root_; }
  bool is_config_file(const fs::path &file) const;
  bool is_layout(const fs::path &file) const;

private:
  BuildReport build_collation(Collation &collation, const BuildScope &scope,
                              bool force);
  void clean_target(const BuildScope &scope) const;
  void compile_books(const Collation &collation) const;
  void validate_redirects() const;
  void write_redirects(const Collation &collation) const;
  void save_manifests() const;
  nlohmann::json site_data() const;
  void stamp_version();

  void print_build_summary(
      const BuildReport &report,
      const std::chrono::high_resolution_clock::time_point &start) const;

  fs::path project_root_;
  BuildFlags flags_;

  SiteConfig config_;
  RuntimeOptions options_;
  std::unique_ptr<HrefResolver> resolver_;
  std::unique_ptr<CollationBuilder> collation_builder_;
  std::vector<std::shared_ptr<Collation>> collations_;

  LanguageAliases aliases_;
  std::unique_ptr<SyntaxHighlighter> highlighter_;
  std::unique_ptr<BookCompiler> book_compiler_;
  std::string version_;
};

#endif
