#include "page.hpp"
#include "frontmatter.hpp"
#include "utils/errors.hpp"
#include <cctype>

namespace {

template <typename T>
std::optional<T> json_value(const nlohmann::json &data, const char *key) {
  auto it = data.find(key);
  if (it == data.end() || it->is_null()) {
    return std::nullopt;
  }
  return it->get<T>();
}

} // namespace

void Page::merge(const nlohmann::json &overlay) {
  if (!overlay.is_object()) {
    return;
  }
  for (auto it = overlay.begin(); it != overlay.end(); ++it) {
    data[it.key()] = it.value();
  }
}

void Page::update_fields() {
  try {
    auto title_it = data.find("title");
    if (title_it != data.end() && !title_it->is_null()) {
      title = title_it->is_string() ? title_it->get<std::string>()
                                    : title_it->dump();
    }

    auto layout_it = data.find("layout");
    if (layout_it != data.end()) {
      if (layout_it->is_string()) {
        layout = layout_it->get<std::string>();
      } else if (layout_it->is_boolean() && !layout_it->get<bool>()) {
        standalone = true;
      }
    }

    if (auto value = json_value<bool>(data, "standalone"))
      standalone = *value || standalone;
    if (auto value = json_value<bool>(data, "draft"))
      draft = *value;
    if (auto value = json_value<bool>(data, "render"))
      render = *value;
    if (auto value = json_value<bool>(data, "rewrite_index"))
      rewrite_index = *value;
    if (auto value = json_value<std::string>(data, "permalink"))
      permalink = *value;
    if (auto value = json_value<std::string>(data, "lang"))
      lang = *value;
  } catch (const nlohmann::json::exception &e) {
    throw KilnError(ErrorKind::FrontMatterParse,
                    "Invalid page field in " + source.string() + ": " +
                        e.what(),
                    source);
  }
}

nlohmann::json Page::to_json() const {
  nlohmann::json result = data;
  result["title"] = title;
  result["href"] = href;
  result["lang"] = lang;
  result["draft"] = draft;
  result["standalone"] = standalone;
  result["file"] = {{"source", source.generic_string()},
                    {"target", destination.generic_string()}};
  return result;
}

std::string file_auto_title(const fs::path &file) {
  std::string stem = file.stem().string();
  if (stem == INDEX_STEM) {
    fs::path parent = file.parent_path();
    stem = parent.has_filename() ? parent.filename().string() : "";
  }

  std::string title;
  bool word_start = true;
  for (char c : stem) {
    if (c == '-' || c == '_' || c == ' ') {
      if (!title.empty() && title.back() != ' ') {
        title += ' ';
      }
      word_start = true;
      continue;
    }
    unsigned char uc = static_cast<unsigned char>(c);
    title += static_cast<char>(word_start ? std::toupper(uc)
                                          : std::tolower(uc));
    word_start = false;
  }
  while (!title.empty() && title.back() == ' ') {
    title.pop_back();
  }
  return title;
}

FrontMatterConfig front_matter_config(const HrefResolver &resolver,
                                      const fs::path &file, bool bail) {
  return resolver.is_markdown(file) ? FrontMatterConfig::markdown(bail)
                                    : FrontMatterConfig::html(bail);
}

PageLoader::PageLoader(const SiteConfig &config, const RuntimeOptions &options,
                       const HrefResolver &resolver)
    : config_(config), options_(options), resolver_(resolver) {}

nlohmann::json PageLoader::read_front_matter(const fs::path &file) const {
  FrontMatterResult result =
      FrontMatter::load(file, front_matter_config(resolver_, file, true));
  if (!result.has_front_matter) {
    return nlohmann::json::object();
  }

  YAML::Node node;
  try {
    node = YAML::Load(result.front_matter);
  } catch (const YAML::Exception &e) {
    throw KilnError(ErrorKind::FrontMatterParse,
                    "Front matter error in " + file.string() + ": " + e.what(),
                    file);
  }

  nlohmann::json data = yaml_to_json(node);
  if (data.is_null()) {
    return nlohmann::json::object();
  }
  if (!data.is_object()) {
    throw KilnError(ErrorKind::FrontMatterParse,
                    "Front matter in " + file.string() + " must be a map",
                    file);
  }
  return data;
}

Page PageLoader::load(const fs::path &file, const fs::path &output_path) const {
  Page page;
  page.source = file;
  page.template_path = file;
  page.lang = config_.lang;

  page.merge(config_.page);

  std::string key = resolver_.strip_source(output_path).generic_string();
  auto entry = config_.pages.find(key);
  if (entry != config_.pages.end()) {
    page.merge(entry->second);
  }

  if (!page.data.contains("title")) {
    page.data["title"] = file_auto_title(resolver_.strip_source(output_path));
  }

  page.merge(read_front_matter(file));
  page.update_fields();
  locate(page, output_path);
  return page;
}

void PageLoader::locate(Page &page, const fs::path &output_path) const {
  if (!page.render) {
    LinkOptions opts;
    opts.rewrite = false;
    opts.transpose = false;
    page.destination = resolver_.compute_destination(output_path, true);
    page.href = resolver_.compute_absolute_href(output_path, opts);
    return;
  }

  bool rewrite_index =
      page.rewrite_index.value_or(options_.settings.rewrite_index);
  LinkOptions opts;
  opts.rewrite_index = rewrite_index;
  page.destination =
      resolver_.compute_destination(output_path, false, rewrite_index);
  page.href = resolver_.compute_absolute_href(output_path, opts);
}

void PageLoader::verify_pages() const {
  for (const auto &[key, value] : config_.pages) {
    fs::path file = options_.source / key;
    if (!fs::is_regular_file(file)) {
      throw KilnError(ErrorKind::NoPageFile,
                      "No page file " + file.string() + " for key '" + key +
                          "'",
                      file);
    }
  }
}
