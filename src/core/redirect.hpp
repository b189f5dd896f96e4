#ifndef REDIRECT_HPP
#define REDIRECT_HPP

#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace fs = std::filesystem;

constexpr const char *REDIRECTS_FILE = "redirects.json";

class RedirectMap {
public:
  static constexpr std::size_t MAX_REDIRECTS = 4;

  RedirectMap() = default;
  explicit RedirectMap(std::map<std::string, std::string> map)
      : map_(std::move(map)) {}

  void insert(const std::string &from, const std::string &to) {
    map_[from] = to;
  }
  const std::map<std::string, std::string> &map() const { return map_; }
  bool empty() const { return map_.empty(); }

  // Every chain must end within MAX_REDIRECTS hops without revisiting a
  // key. Throws TooManyRedirects or CyclicRedirect.
  void validate() const;

  // Writes one stub page per key plus redirects.json. Nothing is written
  // when any stub would overwrite an existing file.
  void write(const fs::path &target) const;

  // Removes the stubs listed in a previous build's redirects.json.
  static void clear_previous(const fs::path &target);

  static fs::path stub_path(const fs::path &target, const std::string &key);
  static std::string stub(const std::string &location);

private:
  void validate_redirect(const std::string &from, const std::string &to,
                         std::vector<std::string> &stack) const;

  std::map<std::string, std::string> map_;
};

#endif
