#ifndef PAGE_HPP
#define PAGE_HPP

#include "frontmatter.hpp"
#include "href.hpp"
#include "utils/config.hpp"
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace fs = std::filesystem;

struct Page {
  fs::path source;
  fs::path destination;
  fs::path template_path;
  std::string href;

  std::string title;
  std::optional<std::string> layout;
  bool standalone = false;
  bool draft = false;
  bool render = true;
  std::optional<bool> rewrite_index;
  std::optional<std::string> permalink;
  std::string lang;

  nlohmann::json data = nlohmann::json::object();

  bool is_draft(bool release) const { return release && draft; }

  // Shallow merge; keys in `overlay` win.
  void merge(const nlohmann::json &overlay);
  // Re-read the reserved keys (title, layout, draft...) from `data`.
  void update_fields();

  nlohmann::json to_json() const;
};

// Title Case of the file stem; an index file takes its directory name.
std::string file_auto_title(const fs::path &file);

FrontMatterConfig front_matter_config(const HrefResolver &resolver,
                                      const fs::path &file, bool bail = false);

class PageLoader {
public:
  PageLoader(const SiteConfig &config, const RuntimeOptions &options,
             const HrefResolver &resolver);

  // `output_path` is the path used for destination and href; it differs
  // from `file` for locale variants (about.fr.md builds as about.md).
  Page load(const fs::path &file, const fs::path &output_path) const;
  Page load(const fs::path &file) const { return load(file, file); }

  // Compute destination and href from the page fields.
  void locate(Page &page, const fs::path &output_path) const;

  // Every key in the pages table must name an existing source file.
  void verify_pages() const;

  nlohmann::json read_front_matter(const fs::path &file) const;

private:
  const SiteConfig &config_;
  const RuntimeOptions &options_;
  const HrefResolver &resolver_;
};

#endif
