#include "link.hpp"
#include "utils/errors.hpp"

LinkResolver::LinkResolver(const Collation &collation,
                           const HrefResolver &resolver,
                           const LinkConfig &config)
    : collation_(collation), resolver_(resolver), config_(config) {}

std::string LinkResolver::strip_base_href(const std::string &path) const {
  const auto &base_href = resolver_.options().base_href;
  if (!base_href) {
    return path;
  }
  std::string base = *base_href;
  while (!base.empty() && base.front() == '/') {
    base.erase(0, 1);
  }
  while (!base.empty() && base.back() == '/') {
    base.pop_back();
  }
  if (base.empty() || path.rfind(base, 0) != 0) {
    return path;
  }
  if (path.size() == base.size()) {
    return "";
  }
  if (path[base.size()] != '/') {
    return path;
  }
  return path.substr(base.size() + 1);
}

std::string LinkResolver::link(const std::string &href,
                               const fs::path &current) const {
  if (resolver_.options().include_index && (href == "." || href == "..")) {
    return href + "/" + INDEX_FILE;
  }
  if (href.empty() || href.front() != '/' || is_external_href(href)) {
    return href;
  }

  if (config_.verify && !collation_.find_link(href) &&
      !collation_.is_allowed(href)) {
    throw KilnError(ErrorKind::LinkNotFound,
                    "Missing link " + href + " in " + current.string(),
                    current);
  }

  std::string path = href.substr(1);
  path = strip_base_href(path);

  if (config_.relative) {
    return resolver_.compute_relative_href("/" + path, current);
  }
  return "/" + path;
}
