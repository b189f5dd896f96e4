#ifndef TEMPLATE_ENGINE_HPP
#define TEMPLATE_ENGINE_HPP

#include "utils/config.hpp"
#include <filesystem>
#include <functional>
#include <nlohmann/json.hpp>
#include <string>

namespace fs = std::filesystem;

// Renders a page body or a layout file with the page data. Workers call
// render() concurrently, so implementations keep no per-call state.
class TemplateEngine {
public:
  using json = nlohmann::json;

  virtual ~TemplateEngine() = default;

  // Throws KilnError(ErrorKind::Template) on failure.
  virtual std::string render(const fs::path &template_path,
                             const json &data) const = 0;
};

class InjaTemplateEngine : public TemplateEngine {
public:
  using LinkFunction =
      std::function<std::string(const std::string &, const fs::path &)>;

  // `root` is the include search path; markdown bodies are converted after
  // the template pass.
  InjaTemplateEngine(fs::path root, RenderTypes types,
                     LinkFunction link = LinkFunction());

  std::string render(const fs::path &template_path,
                     const json &data) const override;

  std::string render_string(const std::string &content, const json &data,
                            const fs::path &current) const;

  static void add_missing_path(json &data, const std::string &path);

private:
  fs::path root_;
  RenderTypes types_;
  LinkFunction link_;
};

#endif
