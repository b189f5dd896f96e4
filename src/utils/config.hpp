#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstddef>
#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;

constexpr const char *CONFIG_FILE_NAME = "kiln.yaml";

// Extension sets drive page classification. Extensions are stored without
// the leading dot.
struct RenderTypes {
  std::set<std::string> markdown{"md", "markdown"};
  std::set<std::string> render{"md", "markdown", "html", "htm"};
  std::map<std::string, std::string> map{{"md", "html"}, {"markdown", "html"}};

  bool is_markdown(const std::string &ext) const {
    return markdown.count(ext) > 0;
  }
  bool is_page(const std::string &ext) const { return render.count(ext) > 0; }
};

struct HtmlTransformFlags {
  bool strip_comments = false;
  bool auto_id = false;
  bool syntax_highlight = false;
  bool toc = false;
  bool words = false;

  bool is_active() const {
    return strip_comments || auto_id || syntax_highlight || toc || words;
  }
};

struct LinkConfig {
  bool verify = false;
  bool relative = true;
  std::vector<std::string> allow;
};

struct SearchConfig {
  bool enabled = false;
  std::string output = "search.json";
};

struct HookConfig {
  std::string name;
  std::string path;
  std::vector<std::string> args;
  std::optional<bool> after;
  std::vector<std::string> profiles;
  // Directory the hook reads from; it is excluded from the content walk.
  std::optional<std::string> source;
};

struct ProfileSettings {
  std::string name = "debug";
  std::string target;
  bool release = false;
  bool rewrite_index = false;
  bool include_index = false;
  std::optional<std::string> base_href;
  bool incremental = false;
  bool parallel = true;
  std::size_t workers = 0;
  bool fail_fast = true;
  bool force = false;
  bool pristine = true;
  std::optional<bool> minify_html;

  bool should_minify_html() const { return minify_html.value_or(release); }

  static ProfileSettings debug();
  static ProfileSettings release_defaults();
};

struct SiteDirectories {
  std::string layouts = "layouts";
  std::string partials = "partials";
  std::string includes = "includes";
  std::string collections = "collections";
  std::string themes = "themes";
  std::string locales = "locales";
};

class SiteConfig {
public:
  fs::path project;
  fs::path file;

  std::string site_name;
  std::string url;
  std::string lang = "en";

  std::string source_dir = "site";
  std::string output_dir = "build";
  SiteDirectories dirs;

  // Default layout, relative to the layouts directory.
  std::string layout = "main.html";
  RenderTypes types;

  nlohmann::json page = nlohmann::json::object();
  std::map<std::string, nlohmann::json> pages;
  std::map<std::string, std::vector<std::string>> menus;
  std::map<std::string, std::string> redirect;

  HtmlTransformFlags transform;
  LinkConfig link;
  SearchConfig search;

  std::vector<std::string> locales;
  std::vector<HookConfig> hooks;
  std::map<std::string, ProfileSettings> profiles;
  std::vector<std::string> books;

  YAML::Node custom_yaml_data;

  static SiteConfig load(const fs::path &config_path);
  static SiteConfig parse(const YAML::Node &yaml, const fs::path &project);

  ProfileSettings profile(const std::string &name) const;

  fs::path source() const { return project / source_dir; }
  fs::path layouts() const { return source() / dirs.layouts; }
  bool is_multi_lingual() const { return !locales.empty(); }

  const YAML::Node &get_custom_data() const { return custom_yaml_data; }
};

// Everything a build pass needs that depends on the chosen profile.
struct RuntimeOptions {
  fs::path project;
  fs::path source;
  fs::path output;
  fs::path target;
  ProfileSettings settings;

  static RuntimeOptions from(const SiteConfig &config,
                             const std::string &profile);
};

nlohmann::json yaml_to_json(const YAML::Node &node);

#endif
