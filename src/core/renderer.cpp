#include "renderer.hpp"
#include "html_minifier.hpp"
#include "html_transform.hpp"
#include "utils/errors.hpp"
#include "utils/files.hpp"
#include "utils/log.hpp"

const char *to_string(RenderOutcome::Action action) {
  switch (action) {
  case RenderOutcome::Action::Rendered:
    return "rendered";
  case RenderOutcome::Action::Copied:
    return "copied";
  case RenderOutcome::Action::Linked:
    return "linked";
  case RenderOutcome::Action::Skipped:
    return "skipped";
  case RenderOutcome::Action::Noop:
    return "noop";
  }
  return "unknown";
}

Renderer::Renderer(const Collation &collation, const TemplateEngine &engine,
                   RenderSettings settings,
                   const SyntaxHighlighter *highlighter,
                   const LanguageAliases *aliases)
    : collation_(collation), engine_(engine), settings_(std::move(settings)),
      highlighter_(highlighter), aliases_(aliases) {}

bool Renderer::is_html(const fs::path &file) {
  auto ext = file.extension();
  return ext == ".html" || ext == ".htm";
}

RenderOutcome Renderer::render(const fs::path &source) const {
  if (const Page *page = collation_.resolve(source)) {
    return render_page(*page);
  }
  if (const Resource *resource = collation_.get_resource(source)) {
    return copy_resource(source, *resource);
  }
  throw KilnError(ErrorKind::Build,
                  "No collation entry for " + source.string(), source);
}

nlohmann::json Renderer::page_data(const Page &page) const {
  nlohmann::json data;
  data["page"] = page.to_json();
  data["site"] = settings_.site;
  data["menus"] = collation_.menu_hrefs();
  data["lang"] = collation_.lang();
  data["href"] = page.href;
  data["version"] = settings_.version;
  return data;
}

std::string Renderer::post_process(const std::string &html,
                                   std::optional<TextExtraction> &text) const {
  std::string content =
      settings_.minify_html ? HtmlMinifier::minify(html) : html;

  TransformOptions options;
  options.flags = settings_.transform;
  options.highlighter = highlighter_;
  options.aliases = aliases_;
  options.extract_text = settings_.extract_text;
  if (!options.is_active()) {
    return content;
  }

  TransformResult result = HtmlTransform::apply(content, options);
  text = std::move(result.text);
  return result.html;
}

RenderOutcome Renderer::render_page(const Page &page) const {
  RenderOutcome outcome;
  outcome.source = page.source;
  outcome.output = collation_.path() / page.destination;
  outcome.href = page.href;

  if (!page.render) {
    copy_resource(page.source, Resource::file(page.destination));
    outcome.action = RenderOutcome::Action::Copied;
    return outcome;
  }

  if (page.is_draft(settings_.release)) {
    Log::debug("Skipping draft " + page.source.string());
    outcome.action = RenderOutcome::Action::Skipped;
    return outcome;
  }

  nlohmann::json data = page_data(page);
  std::string content = engine_.render(page.template_path, data);

  if (!page.standalone) {
    if (auto layout = collation_.find_layout(page.source)) {
      data["content"] = content;
      content = engine_.render(*layout, data);
    }
  }

  if (is_html(outcome.output)) {
    content = post_process(content, outcome.text);
  }

  write_file(outcome.output, content);
  outcome.action = RenderOutcome::Action::Rendered;
  Log::file(page.destination.generic_string());
  return outcome;
}

RenderOutcome Renderer::copy_resource(const fs::path &source,
                                      const Resource &resource) const {
  RenderOutcome outcome;
  outcome.source = source;
  outcome.output = collation_.path() / resource.destination;

  std::error_code ec;
  switch (resource.operation) {
  case ResourceOperation::Noop:
    outcome.action = RenderOutcome::Action::Noop;
    return outcome;

  case ResourceOperation::Link:
    outcome.action = RenderOutcome::Action::Linked;
    if (fs::exists(fs::symlink_status(outcome.output))) {
      return outcome;
    }
    fs::create_directories(outcome.output.parent_path(), ec);
    if (!ec) {
      fs::create_symlink(fs::absolute(source), outcome.output, ec);
    }
    if (ec) {
      throw KilnError(ErrorKind::Io,
                      "Cannot link " + outcome.output.string() + ": " +
                          ec.message(),
                      source);
    }
    return outcome;

  case ResourceOperation::Copy:
  case ResourceOperation::Render:
    break;
  }

  fs::create_directories(outcome.output.parent_path(), ec);
  if (!ec) {
    fs::copy_file(source, outcome.output, fs::copy_options::overwrite_existing,
                  ec);
  }
  if (ec) {
    throw KilnError(ErrorKind::Io,
                    "Cannot copy " + source.string() + " to " +
                        outcome.output.string() + ": " + ec.message(),
                    source);
  }
  outcome.action = RenderOutcome::Action::Copied;
  Log::file(resource.destination.generic_string(), "copied");
  return outcome;
}
