#include "site_builder.hpp"
#include "hooks.hpp"
#include "link.hpp"
#include "locale.hpp"
#include "renderer.hpp"
#include "template_engine.hpp"
#include "utils/errors.hpp"
#include "utils/log.hpp"
#include <iomanip>
#include <iostream>
#include <termcolor/termcolor.hpp>

namespace {

bool is_below(const fs::path &dir, const fs::path &file) {
  fs::path rel =
      file.lexically_normal().lexically_relative(dir.lexically_normal());
  return !rel.empty() && *rel.begin() != "..";
}

void print_row(const std::string &label, const std::string &value) {
  std::cout << termcolor::bright_green << "║  " << termcolor::reset << label
            << termcolor::bright_white << std::setw(32) << std::left << value
            << termcolor::reset << termcolor::bright_green << "║"
            << termcolor::reset << "\n";
}

} // namespace

SiteBuilder::SiteBuilder(const fs::path &root, BuildFlags flags)
    : project_root_(fs::absolute(root).lexically_normal()),
      flags_(std::move(flags)) {
  load_config();
}

void SiteBuilder::load_config() {
  config_ = SiteConfig::load(project_root_ / CONFIG_FILE_NAME);
  options_ = RuntimeOptions::from(config_, flags_.profile);
  if (flags_.force) {
    options_.settings.force = true;
  }

  resolver_ =
      std::make_unique<HrefResolver>(HrefOptions::from(config_, options_));
  collation_builder_ =
      std::make_unique<CollationBuilder>(config_, options_, *resolver_);
  collations_.clear();

  Log::debug("Profile " + options_.settings.name + " -> " +
             options_.target.string());
}

bool SiteBuilder::is_config_file(const fs::path &file) const {
  return file.lexically_normal() ==
         (project_root_ / CONFIG_FILE_NAME).lexically_normal();
}

bool SiteBuilder::is_layout(const fs::path &file) const {
  return collation_builder_->is_layout(file);
}

void SiteBuilder::collate() {
  collations_ = collation_builder_->build();
  for (auto &collation : collations_) {
    auto manifest = std::make_shared<Manifest>(
        Manifest::file_for(collation->path()), options_.settings.incremental);
    manifest->load();
    collation->set_manifest(manifest);
  }
}

void SiteBuilder::stamp_version() {
  auto now = std::chrono::system_clock::now();
  version_ = std::to_string(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          now.time_since_epoch())
          .count());
}

nlohmann::json SiteBuilder::site_data() const {
  nlohmann::json site;
  site["name"] = config_.site_name;
  site["url"] = config_.url;
  site["lang"] = config_.lang;
  site["profile"] = options_.settings.name;
  site["release"] = options_.settings.release;
  site["data"] = yaml_to_json(config_.get_custom_data());
  return site;
}

BuildScope SiteBuilder::scope_for(const std::vector<std::string> &paths) const {
  BuildScope scope;
  for (const auto &value : paths) {
    fs::path path(value);
    if (path.is_relative()) {
      fs::path candidate = project_root_ / path;
      if (!fs::exists(candidate) && fs::exists(options_.source / path)) {
        candidate = options_.source / path;
      }
      path = candidate;
    }
    path = path.lexically_normal();
    if (!fs::exists(path)) {
      throw KilnError(ErrorKind::Io, "Build path does not exist: " + value,
                      path);
    }
    scope.paths.push_back(path);
  }
  return scope;
}

RedirectMap SiteBuilder::redirects(const Collation &collation) const {
  RedirectMap map(config_.redirect);
  for (const auto &[permalink, href] : collation.permalinks()) {
    map.insert(permalink, href);
  }
  return map;
}

void SiteBuilder::clean_target(const BuildScope &scope) const {
  const auto &settings = options_.settings;
  if (!settings.pristine || settings.incremental || !scope.empty()) {
    return;
  }
  if (!fs::exists(options_.target)) {
    return;
  }

  std::error_code ec;
  fs::remove_all(options_.target, ec);
  if (ec) {
    throw KilnError(ErrorKind::Io,
                    "Cannot clean " + options_.target.string() + ": " +
                        ec.message(),
                    options_.target);
  }
  Log::debug("Removed " + options_.target.string());
}

void SiteBuilder::compile_books(const Collation &collation) const {
  if (config_.books.empty()) {
    return;
  }
  if (!book_compiler_) {
    Log::warn("No book compiler configured, skipping " +
              std::to_string(config_.books.size()) + " book(s)");
    return;
  }

  for (const auto &name : config_.books) {
    fs::path book = options_.source / name;
    fs::path output =
        book_compiler_->compile(book, options_.settings.release);
    fs::path destination = collation.path() / resolver_->strip_source(book);

    std::error_code ec;
    fs::create_directories(destination, ec);
    if (!ec) {
      fs::copy(output, destination,
               fs::copy_options::recursive |
                   fs::copy_options::overwrite_existing,
               ec);
    }
    if (ec) {
      throw KilnError(ErrorKind::Io,
                      "Cannot copy book " + name + " to " +
                          destination.string() + ": " + ec.message(),
                      book);
    }
    Log::file(resolver_->strip_source(book).generic_string(), "book");
  }
}

void SiteBuilder::validate_redirects() const {
  for (const auto &collation : collations_) {
    redirects(*collation).validate();
  }
}

void SiteBuilder::write_redirects(const Collation &collation) const {
  RedirectMap::clear_previous(collation.path());
  RedirectMap map = redirects(collation);
  if (map.empty()) {
    return;
  }
  map.write(collation.path());
  Log::debug("Wrote " + std::to_string(map.map().size()) + " redirects");
}

void SiteBuilder::save_manifests() const {
  for (const auto &collation : collations_) {
    if (auto manifest = collation->manifest()) {
      manifest->save();
    }
  }
}

BuildReport SiteBuilder::build_collation(Collation &collation,
                                         const BuildScope &scope,
                                         bool force) {
  bool full = scope.empty();

  LinkResolver links(collation, *resolver_, config_.link);
  InjaTemplateEngine engine(
      config_.source(), config_.types,
      [&links](const std::string &href, const fs::path &current) {
        return links.link(href, current);
      });

  RenderSettings settings;
  settings.release = options_.settings.release;
  settings.minify_html = options_.settings.should_minify_html();
  settings.transform = config_.transform;
  settings.extract_text = config_.search.enabled;
  settings.site = site_data();
  settings.version = version_;

  Renderer renderer(collation, engine, settings, highlighter_.get(),
                    &aliases_);

  SchedulerOptions scheduler_options =
      SchedulerOptions::from(options_.settings);
  scheduler_options.force = scheduler_options.force || force;

  // Declared after everything its tasks reference, so abandoned work is
  // joined before those go away.
  Scheduler scheduler(scheduler_options);
  BuildReport report =
      scheduler.run(collation, scope, [&renderer](const fs::path &source) {
        return renderer.render(source);
      });

  if (full) {
    compile_books(collation);
    write_redirects(collation);
  }

  if (config_.search.enabled) {
    if (full && report.unchanged == 0) {
      JsonSearchIndexer indexer(config_.search.output);
      for (const auto &outcome : report.outcomes) {
        if (outcome.text) {
          indexer.add(outcome.href, *outcome.text);
        }
      }
      indexer.finish(collation.path());
      Log::file(config_.search.output, "search index");
    } else {
      Log::debug("Search index left unchanged for partial pass");
    }
  }

  return report;
}

BuildReport SiteBuilder::build(const BuildScope &scope, bool force) {
  auto start = std::chrono::high_resolution_clock::now();

  std::cout << "\n"
            << termcolor::bright_cyan
            << "╔═══════════════════════════════════════════╗\n"
            << "║        🚀 Building Static Site            ║\n"
            << "╚═══════════════════════════════════════════╝"
            << termcolor::reset << "\n";

  stamp_version();
  HookRunner hooks(config_, options_);
  hooks.run(HookPhase::Before);

  clean_target(scope);
  if (collations_.empty()) {
    collate();
  }
  // Every locale's redirects are checked before any output is written.
  validate_redirects();

  BuildReport total;
  for (auto &collation : collations_) {
    if (collations_.size() > 1) {
      Log::heading("🌐 " + collation->lang());
    }
    total.merge(build_collation(*collation, scope, force));
  }

  hooks.run(HookPhase::After);
  save_manifests();
  print_build_summary(total, start);
  return total;
}

void SiteBuilder::check() {
  collate();
  validate_redirects();
  std::size_t pages = 0;
  for (const auto &collation : collations_) {
    pages += collation->pages().size();
  }
  Log::success("Checked " + std::to_string(pages) + " pages in " +
               std::to_string(collations_.size()) + " collation(s)");
}

BuildReport SiteBuilder::update(const fs::path &file) {
  fs::path path = fs::absolute(file).lexically_normal();

  if (is_config_file(path)) {
    Log::info("Configuration changed, reloading");
    load_config();
    return build();
  }

  if (collations_.empty()) {
    collate();
  }
  stamp_version();

  BuildReport report;
  const fs::path &source = options_.source;
  bool shared_template = is_layout(path) ||
                         is_below(source / config_.dirs.partials, path) ||
                         is_below(source / config_.dirs.includes, path);

  std::vector<Collation *> changed;
  for (auto &collation : collations_) {
    if (collation_builder_->upsert(*collation, path) || shared_template) {
      changed.push_back(collation.get());
    }
  }
  validate_redirects();

  BuildScope scope = shared_template ? BuildScope() : BuildScope{{path}};
  for (Collation *collation : changed) {
    report.merge(build_collation(*collation, scope, true));
  }

  save_manifests();
  return report;
}

BuildReport SiteBuilder::remove(const fs::path &file) {
  fs::path path = fs::absolute(file).lexically_normal();
  if (is_config_file(path) || is_layout(path)) {
    return update(path);
  }
  if (collations_.empty()) {
    collate();
  }

  auto lang = locale_of(path, config_.locales);
  std::vector<std::pair<Collation *, fs::path>> fallbacks;
  for (auto &collation : collations_) {
    if (collation->remove(path)) {
      Log::file(path.lexically_relative(options_.source).generic_string(),
                "removed");
    }
    if (auto manifest = collation->manifest()) {
      manifest->touch(path);
    }

    // Without its translation the locale falls back to the default page.
    if (lang && *lang == collation->lang()) {
      fs::path fallback = strip_locale(path, *lang);
      if (collation_builder_->upsert(*collation, fallback)) {
        fallbacks.emplace_back(collation.get(), fallback);
      }
    }
  }
  validate_redirects();

  BuildReport report;
  for (const auto &[collation, fallback] : fallbacks) {
    report.merge(build_collation(*collation, BuildScope{{fallback}}, true));
  }

  save_manifests();
  return report;
}

void SiteBuilder::print_build_summary(
    const BuildReport &report,
    const std::chrono::high_resolution_clock::time_point &start) const {
  auto end = std::chrono::high_resolution_clock::now();
  auto duration =
      std::chrono::duration_cast<std::chrono::milliseconds>(end - start);

  std::cout << "\n"
            << termcolor::bright_green
            << "╔═══════════════════════════════════════════╗\n"
            << "║           ✨ Build Complete!              ║\n"
            << "╠═══════════════════════════════════════════╣"
            << termcolor::reset << "\n";
  print_row("Output: ", options_.target.string());
  print_row("Time:   ", std::to_string(duration.count()) + "ms");
  print_row("Pages:  ", std::to_string(report.rendered));
  print_row("Files:  ", std::to_string(report.copied));
  if (report.skipped > 0) {
    print_row("Drafts: ", std::to_string(report.skipped));
  }
  if (report.unchanged > 0) {
    print_row("Fresh:  ", std::to_string(report.unchanged));
  }
  std::cout << termcolor::bright_green
            << "╚═══════════════════════════════════════════╝"
            << termcolor::reset << "\n\n";
}
