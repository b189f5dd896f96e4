#include "href.hpp"
#include "utils/errors.hpp"

namespace {

fs::path without_trailing_separator(fs::path path) {
  path = path.lexically_normal();
  if (path.has_filename() || !path.has_parent_path()) {
    return path;
  }
  return path.parent_path();
}

std::size_t component_count(const fs::path &path) {
  std::size_t count = 0;
  for (const auto &part : path) {
    if (!part.empty()) {
      ++count;
    }
  }
  return count;
}

bool starts_with(const fs::path &path, const fs::path &prefix) {
  auto it = path.begin();
  for (const auto &part : prefix) {
    if (part.empty())
      continue;
    if (it == path.end() || *it != part) {
      return false;
    }
    ++it;
  }
  return true;
}

} // namespace

HrefOptions HrefOptions::from(const SiteConfig &config,
                              const RuntimeOptions &options) {
  HrefOptions result;
  result.source = options.source;
  result.types = config.types;
  result.rewrite_index = options.settings.rewrite_index;
  result.include_index = options.settings.include_index;
  result.base_href = options.settings.base_href;
  return result;
}

HrefResolver::HrefResolver(HrefOptions options)
    : options_(std::move(options)) {}

std::string HrefResolver::extension_of(const fs::path &file) {
  std::string ext = file.extension().string();
  if (!ext.empty() && ext[0] == '.') {
    ext.erase(0, 1);
  }
  return ext;
}

bool HrefResolver::is_page(const fs::path &file) const {
  return options_.types.is_page(extension_of(file));
}

bool HrefResolver::is_markdown(const fs::path &file) const {
  return options_.types.is_markdown(extension_of(file));
}

fs::path HrefResolver::strip_source(const fs::path &file) const {
  fs::path source = options_.source;
  fs::path path = file;
  if (path.is_absolute() && source.is_relative()) {
    source = fs::current_path() / source;
  } else if (path.is_relative() && source.is_absolute()) {
    path = fs::current_path() / path;
  }

  source = without_trailing_separator(source);
  path = path.lexically_normal();

  fs::path rel = path.lexically_relative(source);
  if (rel.empty() || rel == "." || *rel.begin() == "..") {
    throw KilnError(ErrorKind::OutsideSourceTree,
                    "File " + file.string() + " is outside the source " +
                        options_.source.string(),
                    file);
  }
  return rel;
}

fs::path HrefResolver::relative_to_source(const fs::path &file) const {
  return strip_base_href(strip_source(file));
}

fs::path HrefResolver::strip_base_href(const fs::path &rel) const {
  if (!options_.base_href) {
    return rel;
  }
  std::string base = *options_.base_href;
  while (!base.empty() && base.front() == '/') {
    base.erase(0, 1);
  }
  fs::path prefix = without_trailing_separator(fs::path(base));
  if (prefix.empty() || component_count(prefix) >= component_count(rel) ||
      !starts_with(rel, prefix)) {
    return rel;
  }
  return rel.lexically_relative(prefix);
}

fs::path HrefResolver::transpose(fs::path rel) const {
  auto it = options_.types.map.find(extension_of(rel));
  if (it != options_.types.map.end()) {
    rel.replace_extension(it->second);
  }
  return rel;
}

std::optional<fs::path>
HrefResolver::rewrite_index_file(const fs::path &file,
                                 const fs::path &result) const {
  if (file.stem() == INDEX_STEM) {
    return std::nullopt;
  }

  // A sibling directory index claims the clean URL already.
  fs::path target = file.parent_path() / file.stem() / INDEX_STEM;
  for (const auto &ext : options_.types.render) {
    fs::path candidate = target;
    candidate += "." + ext;
    if (fs::exists(candidate)) {
      return std::nullopt;
    }
  }

  return result.parent_path() / result.stem() / INDEX_FILE;
}

bool HrefResolver::is_clean(const fs::path &file) const {
  return is_clean(file, options_.rewrite_index);
}

bool HrefResolver::is_clean(const fs::path &file, bool rewrite_index) const {
  return rewrite_index && is_page(file) &&
         rewrite_index_file(file, file).has_value();
}

fs::path HrefResolver::compute_destination(const fs::path &file,
                                           bool exact) const {
  return compute_destination(file, exact, options_.rewrite_index);
}

fs::path HrefResolver::compute_destination(const fs::path &file, bool exact,
                                           bool rewrite_index) const {
  fs::path result = relative_to_source(file);
  if (exact || !is_page(file)) {
    return result;
  }

  result = transpose(result);
  if (rewrite_index) {
    if (auto rewritten = rewrite_index_file(file, result)) {
      result = *rewritten;
    }
  }
  return result;
}

std::string HrefResolver::compute_absolute_href(const fs::path &file,
                                                const LinkOptions &opts) const {
  fs::path rel = relative_to_source(file);

  if (component_count(rel) == 1 && rel.stem() == INDEX_STEM && is_page(file)) {
    return "/";
  }

  bool rewrite_index = opts.rewrite_index.value_or(options_.rewrite_index);
  bool is_index = rel.stem() == INDEX_STEM;
  bool clean = opts.rewrite && rewrite_index && is_page(file) &&
               (is_index || rewrite_index_file(file, rel).has_value());

  if (clean) {
    rel.replace_extension("");
    if (opts.include_index) {
      if (is_index) {
        rel.replace_extension(".html");
      } else {
        rel /= INDEX_FILE;
      }
    } else if (is_index) {
      rel = rel.parent_path();
    }
  }

  if (opts.transpose) {
    rel = transpose(rel);
  }

  std::string href = rel.generic_string();
  if (opts.leading) {
    href = "/" + href;
  }
  if (opts.trailing && !rel.has_extension() && !href.empty() &&
      href.back() != '/') {
    href += "/";
  }
  return href;
}

std::string HrefResolver::compute_relative_href(const std::string &href,
                                                const fs::path &current) const {
  fs::path rel = relative_to_source(current);

  std::string value;
  if (is_clean(current)) {
    value += "../";
  }
  for (const auto &part : rel.parent_path()) {
    if (!part.empty()) {
      value += "../";
    }
  }

  std::string target = href;
  while (!target.empty() && target.front() == '/') {
    target.erase(0, 1);
  }
  value += target;

  if (options_.include_index && (value.empty() || value.back() == '/')) {
    value += INDEX_FILE;
  }
  if (value.empty()) {
    value = "../";
  }
  return value;
}

bool is_external_href(const std::string &href) {
  return href.rfind("http:", 0) == 0 || href.rfind("https:", 0) == 0;
}
