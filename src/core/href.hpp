#ifndef HREF_HPP
#define HREF_HPP

#include "utils/config.hpp"
#include <filesystem>
#include <optional>
#include <string>

namespace fs = std::filesystem;

constexpr const char *INDEX_STEM = "index";
constexpr const char *INDEX_FILE = "index.html";

struct LinkOptions {
  bool leading = true;
  bool trailing = true;
  bool transpose = true;
  bool rewrite = true;
  bool include_index = false;
  // Page-level override of the profile's clean URL setting.
  std::optional<bool> rewrite_index;
};

struct HrefOptions {
  fs::path source;
  RenderTypes types;
  bool rewrite_index = false;
  bool include_index = false;
  std::optional<std::string> base_href;

  static HrefOptions from(const SiteConfig &config,
                          const RuntimeOptions &options);
};

// Maps source files to output paths and URLs. Apart from the check for a
// sibling `stem/index.<ext>` file every method is pure.
class HrefResolver {
public:
  explicit HrefResolver(HrefOptions options);

  fs::path compute_destination(const fs::path &file, bool exact = false) const;
  fs::path compute_destination(const fs::path &file, bool exact,
                               bool rewrite_index) const;

  std::string compute_absolute_href(const fs::path &file,
                                    const LinkOptions &opts = {}) const;

  std::string compute_relative_href(const std::string &href,
                                    const fs::path &current) const;

  // Source path relative to the source root.
  fs::path strip_source(const fs::path &file) const;
  // As strip_source, with any base href prefix removed as well.
  fs::path relative_to_source(const fs::path &file) const;

  bool is_page(const fs::path &file) const;
  bool is_markdown(const fs::path &file) const;
  bool is_clean(const fs::path &file) const;
  bool is_clean(const fs::path &file, bool rewrite_index) const;

  const HrefOptions &options() const { return options_; }

  static std::string extension_of(const fs::path &file);

private:
  std::optional<fs::path> rewrite_index_file(const fs::path &file,
                                             const fs::path &result) const;
  fs::path strip_base_href(const fs::path &rel) const;
  fs::path transpose(fs::path rel) const;

  HrefOptions options_;
};

bool is_external_href(const std::string &href);

#endif
