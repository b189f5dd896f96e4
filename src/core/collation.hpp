#ifndef COLLATION_HPP
#define COLLATION_HPP

#include "href.hpp"
#include "manifest.hpp"
#include "page.hpp"
#include "resource.hpp"
#include "utils/config.hpp"
#include <filesystem>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace fs = std::filesystem;

// The resolved view of one locale of the site: which sources render, which
// copy, where each lands and which href reaches it. A source appears in
// exactly one of pages() and targets(). Read-only while a build pass runs.
class Collation {
public:
  Collation(std::string lang, fs::path path);

  const std::string &lang() const { return lang_; }
  const fs::path &path() const { return path_; }

  const Page *resolve(const fs::path &source) const;
  const Resource *get_resource(const fs::path &source) const;
  std::optional<fs::path> destination(const fs::path &source) const;
  bool contains(const fs::path &source) const;
  std::vector<fs::path> sources() const;

  std::optional<fs::path> get_link(const std::string &href) const;
  std::optional<fs::path> find_link(const std::string &href) const;
  std::optional<std::string> get_href(const fs::path &source) const;
  bool is_allowed(const std::string &href) const;

  std::optional<fs::path> find_layout(const fs::path &source) const;
  std::optional<fs::path> find_named_layout(const std::string &name) const;
  std::optional<fs::path> default_layout() const { return default_layout_; }

  void add_page(Page page, const std::string &link);
  void add_file(const fs::path &source, Resource resource,
                const std::string &link);
  bool remove(const fs::path &source);

  void set_default_layout(const fs::path &layout) { default_layout_ = layout; }
  void set_layout(const fs::path &source, const fs::path &layout);
  void add_layout(const std::string &name, const fs::path &layout);
  void remove_layout(const fs::path &layout);

  // Drops menus and permalinks ahead of recomputing them.
  void clear_derived();
  void add_menu(const std::string &name, std::vector<std::string> hrefs);
  void add_permalink(const std::string &permalink, const std::string &href,
                     const fs::path &source);
  void allow(const std::string &href);

  nlohmann::json menu_hrefs() const;

  const std::map<fs::path, Page> &pages() const { return pages_; }
  const std::map<fs::path, Resource> &targets() const { return targets_; }
  const std::map<std::string, std::string> &permalinks() const {
    return permalinks_;
  }
  const std::map<std::string, fs::path> &layouts() const { return layouts_; }

  std::shared_ptr<Manifest> manifest() const { return manifest_; }
  void set_manifest(std::shared_ptr<Manifest> manifest) {
    manifest_ = std::move(manifest);
  }

private:
  void link(const fs::path &source, const std::string &href);
  void unlink(const fs::path &source);
  void remove_artifact(const fs::path &destination) const;

  std::string lang_;
  fs::path path_;

  std::map<fs::path, Page> pages_;
  std::map<fs::path, Resource> targets_;

  std::map<std::string, fs::path> links_;
  std::map<fs::path, std::string> hrefs_;
  std::set<std::string> allowed_;

  std::optional<fs::path> default_layout_;
  std::map<fs::path, fs::path> page_layouts_;
  std::map<std::string, fs::path> layouts_;

  std::map<std::string, std::vector<std::string>> menus_;
  std::map<std::string, std::string> permalinks_;

  std::shared_ptr<Manifest> manifest_;
};

// Builds collations from the source tree and keeps them current while
// watching.
class CollationBuilder {
public:
  CollationBuilder(const SiteConfig &config, const RuntimeOptions &options,
                   const HrefResolver &resolver);

  // The fallback locale first, then one collation per alternate locale.
  std::vector<std::shared_ptr<Collation>> build() const;

  // Add or refresh one source file, then recompute permalinks and menus.
  // Returns false when the file does not belong to this collation.
  bool upsert(Collation &collation, const fs::path &file) const;

  std::vector<fs::path> exclusions() const;
  fs::path collation_path(const std::string &lang) const;
  bool is_layout(const fs::path &file) const;

private:
  void add_entry(Collation &collation, const fs::path &file,
                 const fs::path &output_path) const;
  void add_layouts(Collation &collation) const;
  bool upsert_entry(Collation &collation, const fs::path &file) const;
  void finish(Collation &collation) const;
  std::string link_key(const Page &page, const fs::path &output_path) const;

  const SiteConfig &config_;
  const RuntimeOptions &options_;
  const HrefResolver &resolver_;
  PageLoader loader_;
};

#endif
