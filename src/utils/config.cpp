#include "config.hpp"
#include "errors.hpp"

namespace {

std::string trim_extension(std::string ext) {
  if (!ext.empty() && ext[0] == '.') {
    ext.erase(0, 1);
  }
  return ext;
}

std::set<std::string> parse_extensions(const YAML::Node &node) {
  std::set<std::string> result;
  for (const auto &item : node) {
    result.insert(trim_extension(item.as<std::string>()));
  }
  return result;
}

std::vector<std::string> parse_list(const YAML::Node &node) {
  if (node.IsScalar()) {
    return {node.as<std::string>()};
  }
  return node.as<std::vector<std::string>>();
}

void apply_profile(ProfileSettings &profile, const YAML::Node &node) {
  if (!node || node.IsNull())
    return;
  if (!node.IsMap()) {
    throw KilnError(ErrorKind::Config,
                    "Profile '" + profile.name + "' must be a map");
  }

  if (node["target"])
    profile.target = node["target"].as<std::string>();
  if (node["release"])
    profile.release = node["release"].as<bool>();
  if (node["rewrite_index"])
    profile.rewrite_index = node["rewrite_index"].as<bool>();
  if (node["include_index"])
    profile.include_index = node["include_index"].as<bool>();
  if (node["base_href"])
    profile.base_href = node["base_href"].as<std::string>();
  if (node["incremental"])
    profile.incremental = node["incremental"].as<bool>();
  if (node["parallel"])
    profile.parallel = node["parallel"].as<bool>();
  if (node["workers"])
    profile.workers = node["workers"].as<std::size_t>();
  if (node["fail_fast"])
    profile.fail_fast = node["fail_fast"].as<bool>();
  if (node["force"])
    profile.force = node["force"].as<bool>();
  if (node["pristine"])
    profile.pristine = node["pristine"].as<bool>();
  if (node["minify_html"])
    profile.minify_html = node["minify_html"].as<bool>();
}

HookConfig parse_hook(const YAML::Node &node, std::size_t index) {
  HookConfig hook;
  if (!node["path"]) {
    throw KilnError(ErrorKind::Config,
                    "Hook #" + std::to_string(index + 1) + " has no path");
  }
  hook.path = node["path"].as<std::string>();
  hook.name = node["name"] ? node["name"].as<std::string>() : hook.path;
  if (node["args"])
    hook.args = parse_list(node["args"]);
  if (node["after"])
    hook.after = node["after"].as<bool>();
  if (node["profiles"])
    hook.profiles = parse_list(node["profiles"]);
  if (node["source"])
    hook.source = node["source"].as<std::string>();
  return hook;
}

} // namespace

ProfileSettings ProfileSettings::debug() {
  ProfileSettings profile;
  profile.name = "debug";
  return profile;
}

ProfileSettings ProfileSettings::release_defaults() {
  ProfileSettings profile;
  profile.name = "release";
  profile.release = true;
  profile.rewrite_index = true;
  return profile;
}

SiteConfig SiteConfig::load(const fs::path &config_path) {
  if (!fs::exists(config_path)) {
    throw KilnError(ErrorKind::Config,
                    "Config file not found: " + config_path.string(),
                    config_path);
  }

  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception &e) {
    throw KilnError(ErrorKind::Config,
                    "Cannot parse " + config_path.string() + ": " + e.what(),
                    config_path);
  }

  fs::path project = config_path.parent_path();
  if (project.empty()) {
    project = fs::current_path();
  }

  SiteConfig config;
  try {
    config = parse(yaml, project);
  } catch (const YAML::Exception &e) {
    throw KilnError(ErrorKind::Config,
                    "Invalid value in " + config_path.string() + ": " +
                        e.what(),
                    config_path);
  }
  config.file = config_path;
  return config;
}

SiteConfig SiteConfig::parse(const YAML::Node &yaml, const fs::path &project) {
  SiteConfig config;
  config.project = project;
  config.custom_yaml_data = yaml;

  if (yaml.IsNull()) {
    return config;
  }
  if (!yaml.IsMap()) {
    throw KilnError(ErrorKind::Config, "Site configuration must be a map");
  }

  if (yaml["name"])
    config.site_name = yaml["name"].as<std::string>();
  if (yaml["url"])
    config.url = yaml["url"].as<std::string>();
  if (yaml["lang"])
    config.lang = yaml["lang"].as<std::string>();
  if (yaml["source"])
    config.source_dir = yaml["source"].as<std::string>();
  if (yaml["output"])
    config.output_dir = yaml["output"].as<std::string>();
  if (yaml["layout"])
    config.layout = yaml["layout"].as<std::string>();

  if (const auto &dirs = yaml["dirs"]) {
    if (dirs["layouts"])
      config.dirs.layouts = dirs["layouts"].as<std::string>();
    if (dirs["partials"])
      config.dirs.partials = dirs["partials"].as<std::string>();
    if (dirs["includes"])
      config.dirs.includes = dirs["includes"].as<std::string>();
    if (dirs["collections"])
      config.dirs.collections = dirs["collections"].as<std::string>();
    if (dirs["themes"])
      config.dirs.themes = dirs["themes"].as<std::string>();
    if (dirs["locales"])
      config.dirs.locales = dirs["locales"].as<std::string>();
  }

  if (const auto &types = yaml["types"]) {
    if (types["markdown"])
      config.types.markdown = parse_extensions(types["markdown"]);
    if (types["render"])
      config.types.render = parse_extensions(types["render"]);
    if (types["map"]) {
      config.types.map.clear();
      for (auto it = types["map"].begin(); it != types["map"].end(); ++it) {
        config.types.map[trim_extension(it->first.as<std::string>())] =
            trim_extension(it->second.as<std::string>());
      }
    }
  }

  if (yaml["page"]) {
    config.page = yaml_to_json(yaml["page"]);
    if (!config.page.is_object()) {
      throw KilnError(ErrorKind::Config, "'page' defaults must be a map");
    }
  }

  if (const auto &pages = yaml["pages"]) {
    for (auto it = pages.begin(); it != pages.end(); ++it) {
      config.pages[it->first.as<std::string>()] = yaml_to_json(it->second);
    }
  }

  if (const auto &menus = yaml["menus"]) {
    for (auto it = menus.begin(); it != menus.end(); ++it) {
      config.menus[it->first.as<std::string>()] = parse_list(it->second);
    }
  }

  if (const auto &redirect = yaml["redirect"]) {
    for (auto it = redirect.begin(); it != redirect.end(); ++it) {
      config.redirect[it->first.as<std::string>()] =
          it->second.as<std::string>();
    }
  }

  const auto &transform = yaml["transform"];
  if (const auto &html = transform ? transform["html"] : YAML::Node()) {
    if (html["strip_comments"])
      config.transform.strip_comments = html["strip_comments"].as<bool>();
    if (html["auto_id"])
      config.transform.auto_id = html["auto_id"].as<bool>();
    if (html["syntax_highlight"])
      config.transform.syntax_highlight = html["syntax_highlight"].as<bool>();
    if (html["toc"])
      config.transform.toc = html["toc"].as<bool>();
    if (html["words"])
      config.transform.words = html["words"].as<bool>();
  }

  if (const auto &link = yaml["link"]) {
    if (link["verify"])
      config.link.verify = link["verify"].as<bool>();
    if (link["relative"])
      config.link.relative = link["relative"].as<bool>();
    if (link["allow"])
      config.link.allow = parse_list(link["allow"]);
  }

  if (const auto &search = yaml["search"]) {
    if (search.IsScalar()) {
      config.search.enabled = search.as<bool>();
    } else {
      config.search.enabled =
          search["enabled"] ? search["enabled"].as<bool>() : true;
      if (search["output"])
        config.search.output = search["output"].as<std::string>();
    }
  }

  if (yaml["locales"])
    config.locales = parse_list(yaml["locales"]);

  if (const auto &hooks = yaml["hooks"]) {
    std::size_t index = 0;
    for (const auto &hook : hooks) {
      config.hooks.push_back(parse_hook(hook, index++));
    }
  }

  if (yaml["books"])
    config.books = parse_list(yaml["books"]);

  if (const auto &profiles = yaml["profiles"]) {
    for (auto it = profiles.begin(); it != profiles.end(); ++it) {
      std::string name = it->first.as<std::string>();
      ProfileSettings profile = name == "release"
                                    ? ProfileSettings::release_defaults()
                                    : ProfileSettings::debug();
      profile.name = name;
      apply_profile(profile, it->second);
      config.profiles[name] = profile;
    }
  }

  return config;
}

ProfileSettings SiteConfig::profile(const std::string &name) const {
  ProfileSettings result;
  auto it = profiles.find(name);
  if (it != profiles.end()) {
    result = it->second;
  } else if (name == "debug") {
    result = ProfileSettings::debug();
  } else if (name == "release") {
    result = ProfileSettings::release_defaults();
  } else {
    throw KilnError(ErrorKind::Config, "Unknown profile: " + name, file);
  }

  if (result.target.empty()) {
    result.target = result.name;
  }
  return result;
}

RuntimeOptions RuntimeOptions::from(const SiteConfig &config,
                                    const std::string &profile) {
  RuntimeOptions options;
  options.project = config.project;
  options.source = config.source();
  options.output = config.project / config.output_dir;
  options.settings = config.profile(profile);
  options.target = options.output / options.settings.target;
  return options;
}

nlohmann::json yaml_to_json(const YAML::Node &node) {
  if (!node || node.IsNull()) {
    return nullptr;
  }

  if (node.IsScalar()) {
    // Quoted scalars stay strings.
    if (node.Tag() == "!") {
      return node.Scalar();
    }
    long long integer;
    if (YAML::convert<long long>::decode(node, integer)) {
      return integer;
    }
    double number;
    if (YAML::convert<double>::decode(node, number)) {
      return number;
    }
    bool flag;
    if (YAML::convert<bool>::decode(node, flag)) {
      return flag;
    }
    return node.Scalar();
  }

  if (node.IsSequence()) {
    nlohmann::json result = nlohmann::json::array();
    for (const auto &item : node) {
      result.push_back(yaml_to_json(item));
    }
    return result;
  }

  if (node.IsMap()) {
    nlohmann::json result = nlohmann::json::object();
    for (auto it = node.begin(); it != node.end(); ++it) {
      result[it->first.as<std::string>()] = yaml_to_json(it->second);
    }
    return result;
  }

  return nullptr;
}
