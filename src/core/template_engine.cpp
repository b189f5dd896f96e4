#include "template_engine.hpp"
#include "frontmatter.hpp"
#include "markdown.hpp"
#include "utils/errors.hpp"
#include "utils/log.hpp"
#include <inja/inja.hpp>
#include <sstream>

namespace {

std::string extension_of(const fs::path &file) {
  std::string ext = file.extension().string();
  if (!ext.empty() && ext[0] == '.') {
    ext.erase(0, 1);
  }
  return ext;
}

fs::path current_source(const nlohmann::json &data,
                        const fs::path &template_path) {
  auto page = data.find("page");
  if (page != data.end() && page->is_object()) {
    auto file = page->find("file");
    if (file != page->end() && file->is_object() && file->contains("source") &&
        (*file)["source"].is_string()) {
      return fs::path((*file)["source"].get<std::string>());
    }
  }
  return template_path;
}

} // namespace

InjaTemplateEngine::InjaTemplateEngine(fs::path root, RenderTypes types,
                                       LinkFunction link)
    : root_(std::move(root)), types_(std::move(types)),
      link_(std::move(link)) {}

std::string InjaTemplateEngine::render(const fs::path &template_path,
                                       const json &data) const {
  bool markdown = types_.is_markdown(extension_of(template_path));
  FrontMatterResult parsed = FrontMatter::load(
      template_path, markdown ? FrontMatterConfig::markdown()
                              : FrontMatterConfig::html());

  std::string content = render_string(parsed.body, data,
                                      current_source(data, template_path));
  if (markdown) {
    content = MarkdownProcessor::to_html(content, template_path);
  }
  return content;
}

std::string InjaTemplateEngine::render_string(const std::string &content,
                                              const json &data,
                                              const fs::path &current) const {
  std::string root = root_.string();
  if (!root.empty() && root.back() != '/') {
    root += "/";
  }
  inja::Environment env{root};
  env.set_throw_at_missing_includes(true);

  env.add_callback("exists", 1, [](inja::Arguments &args) {
    return !args.at(0)->is_null();
  });

  env.add_callback("truncate", 2, [](inja::Arguments &args) {
    std::string str = args.at(0)->get<std::string>();
    int len = args.at(1)->get<int>();
    if (str.length() > static_cast<size_t>(len)) {
      return str.substr(0, len) + "...";
    }
    return str;
  });

  env.add_callback("words", 0, [](inja::Arguments &) {
    return std::string("<words />");
  });

  env.add_callback("reading_time", 1, [current](inja::Arguments &args) {
    int avg = args.at(0)->get<int>();
    if (avg < 100) {
      throw KilnError(ErrorKind::Template,
                      "reading_time average must be at least 100 words",
                      current);
    }
    return "<words data-avg=\"" + std::to_string(avg) + "\" />";
  });

  LinkFunction link = link_;
  env.add_callback("link", 1, [link, current](inja::Arguments &args) {
    std::string href = args.at(0)->get<std::string>();
    return link ? link(href, current) : href;
  });

  // Unknown variables render as null; a missing key in one page's front
  // matter should not fail the whole site.
  int max_attempts = 3;
  json working_data = data;

  for (int attempt = 0; attempt < max_attempts; ++attempt) {
    try {
      return env.render(content, working_data);
    } catch (const KilnError &) {
      throw;
    } catch (const std::exception &e) {
      std::string error_msg = e.what();

      if (error_msg.find("variable") != std::string::npos &&
          error_msg.find("not found") != std::string::npos) {

        size_t start = error_msg.find("'");
        size_t end = error_msg.find("'", start + 1);

        if (start != std::string::npos && end != std::string::npos) {
          std::string var_path = error_msg.substr(start + 1, end - start - 1);
          Log::warn("Missing variable '" + var_path + "' in " +
                    current.string() + ", using null");
          add_missing_path(working_data, var_path);
          continue;
        }
      }

      throw KilnError(ErrorKind::Template,
                      "Template render error in " + current.string() + ": " +
                          error_msg,
                      current);
    }
  }

  throw KilnError(ErrorKind::Template,
                  "Template render failed for " + current.string() +
                      " after " + std::to_string(max_attempts) + " attempts",
                  current);
}

void InjaTemplateEngine::add_missing_path(json &data, const std::string &path) {
  std::vector<std::string> parts;
  std::istringstream iss(path);
  std::string part;

  while (std::getline(iss, part, '.')) {
    parts.push_back(part);
  }

  json *current = &data;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (!current->is_object()) {
      return;
    }
    if (!current->contains(parts[i])) {
      if (i == parts.size() - 1) {
        (*current)[parts[i]] = nullptr;
      } else {
        (*current)[parts[i]] = json::object();
      }
    }
    current = &(*current)[parts[i]];
  }
}
