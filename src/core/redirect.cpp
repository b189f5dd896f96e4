#include "redirect.hpp"
#include "utils/errors.hpp"
#include "utils/files.hpp"
#include "utils/log.hpp"
#include <algorithm>
#include <nlohmann/json.hpp>

namespace {

std::string trim_trailing_slash(std::string value) {
  while (!value.empty() && value.back() == '/') {
    value.pop_back();
  }
  return value;
}

} // namespace

void RedirectMap::validate() const {
  for (const auto &[from, to] : map_) {
    std::vector<std::string> stack;
    validate_redirect(from, to, stack);
  }
}

void RedirectMap::validate_redirect(const std::string &from,
                                    const std::string &to,
                                    std::vector<std::string> &stack) const {
  if (stack.size() >= MAX_REDIRECTS) {
    throw KilnError(ErrorKind::TooManyRedirects,
                    "Too many redirects (limit " +
                        std::to_string(MAX_REDIRECTS) + ") starting at " +
                        stack.front());
  }

  std::string key = trim_trailing_slash(from);
  if (std::find(stack.begin(), stack.end(), key) != stack.end()) {
    std::string message = "Cyclic redirect: ";
    for (const auto &item : stack) {
      message += item + " <-> ";
    }
    message += key;
    throw KilnError(ErrorKind::CyclicRedirect, message);
  }
  stack.push_back(key);

  auto next = map_.find(to);
  if (next != map_.end()) {
    validate_redirect(to, next->second, stack);
    return;
  }
  std::string trimmed = trim_trailing_slash(to);
  next = map_.find(trimmed);
  if (next != map_.end()) {
    validate_redirect(trimmed, next->second, stack);
  }
}

fs::path RedirectMap::stub_path(const fs::path &target,
                                const std::string &key) {
  std::string rel = key;
  while (!rel.empty() && rel.front() == '/') {
    rel.erase(0, 1);
  }
  fs::path path = target / rel;
  if (key.empty() || key.back() == '/') {
    path /= "index.html";
  }
  return path;
}

std::string RedirectMap::stub(const std::string &location) {
  return "<!doctype html><html><head>"
         "<link rel=\"canonical\" href=\"" +
         location +
         "\">"
         "<noscript><meta http-equiv=\"refresh\" content=\"0; " +
         location +
         "\"></noscript>"
         "</head><body onload=\"document.location.replace('" +
         location + "');\"></body></html>";
}

void RedirectMap::clear_previous(const fs::path &target) {
  fs::path manifest = target / REDIRECTS_FILE;
  if (!fs::is_regular_file(manifest)) {
    return;
  }

  nlohmann::json doc;
  try {
    doc = nlohmann::json::parse(read_file(manifest));
  } catch (const nlohmann::json::exception &e) {
    Log::warn("Ignoring unreadable " + manifest.string() + ": " + e.what());
    return;
  }
  if (!doc.is_object()) {
    return;
  }

  auto remove = [](const fs::path &path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
      throw KilnError(ErrorKind::Io,
                      "Cannot remove " + path.string() + ": " + ec.message(),
                      path);
    }
  };

  // Only stubs that still hold what was written are removed; a page that
  // has since taken the path stays and is reported by write().
  for (const auto &[from, to] : doc.items()) {
    if (!to.is_string()) {
      continue;
    }
    fs::path path = stub_path(target, from);
    if (fs::is_regular_file(path) &&
        read_file(path) == stub(to.get<std::string>())) {
      remove(path);
    }
  }
  remove(manifest);
}

void RedirectMap::write(const fs::path &target) const {
  std::vector<std::pair<fs::path, std::string>> stubs;
  for (const auto &[from, to] : map_) {
    fs::path path = stub_path(target, from);
    if (fs::exists(path)) {
      throw KilnError(ErrorKind::RedirectFileExists,
                      "Redirect " + from + " would overwrite " + path.string(),
                      path);
    }
    stubs.emplace_back(path, stub(to));
  }

  for (const auto &[path, content] : stubs) {
    write_file(path, content);
  }

  nlohmann::json doc = nlohmann::json::object();
  for (const auto &[from, to] : map_) {
    doc[from] = to;
  }
  write_file(target / REDIRECTS_FILE, doc.dump(2));
}
