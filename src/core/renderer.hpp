#ifndef RENDERER_HPP
#define RENDERER_HPP

#include "collaborators.hpp"
#include "collation.hpp"
#include "template_engine.hpp"
#include "utils/config.hpp"
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace fs = std::filesystem;

struct RenderOutcome {
  enum class Action { Rendered, Copied, Linked, Skipped, Noop };

  Action action = Action::Noop;
  fs::path source;
  fs::path output;
  std::string href;
  std::optional<TextExtraction> text;
};

const char *to_string(RenderOutcome::Action action);

struct RenderSettings {
  bool release = false;
  bool minify_html = false;
  HtmlTransformFlags transform;
  bool extract_text = false;
  nlohmann::json site = nlohmann::json::object();
  std::string version;
};

// Per-file output step. Holds only const references to shared state so one
// instance can serve every worker of a pass.
class Renderer {
public:
  Renderer(const Collation &collation, const TemplateEngine &engine,
           RenderSettings settings,
           const SyntaxHighlighter *highlighter = nullptr,
           const LanguageAliases *aliases = nullptr);

  RenderOutcome render(const fs::path &source) const;

  nlohmann::json page_data(const Page &page) const;
  std::string post_process(const std::string &html,
                           std::optional<TextExtraction> &text) const;

  const RenderSettings &settings() const { return settings_; }

  static bool is_html(const fs::path &file);

private:
  RenderOutcome render_page(const Page &page) const;
  RenderOutcome copy_resource(const fs::path &source,
                              const Resource &resource) const;

  const Collation &collation_;
  const TemplateEngine &engine_;
  RenderSettings settings_;
  const SyntaxHighlighter *highlighter_;
  const LanguageAliases *aliases_;
};

#endif
