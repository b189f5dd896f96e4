#include "collation.hpp"
#include "locale.hpp"
#include "utils/errors.hpp"
#include "utils/log.hpp"
#include "walker.hpp"

Collation::Collation(std::string lang, fs::path path)
    : lang_(std::move(lang)), path_(std::move(path)) {}

const Page *Collation::resolve(const fs::path &source) const {
  auto it = pages_.find(source);
  return it == pages_.end() ? nullptr : &it->second;
}

const Resource *Collation::get_resource(const fs::path &source) const {
  auto it = targets_.find(source);
  return it == targets_.end() ? nullptr : &it->second;
}

std::optional<fs::path> Collation::destination(const fs::path &source) const {
  if (const Page *page = resolve(source)) {
    return page->destination;
  }
  if (const Resource *resource = get_resource(source)) {
    return resource->destination;
  }
  return std::nullopt;
}

bool Collation::contains(const fs::path &source) const {
  return pages_.count(source) > 0 || targets_.count(source) > 0;
}

std::vector<fs::path> Collation::sources() const {
  std::vector<fs::path> result;
  result.reserve(pages_.size() + targets_.size());
  for (const auto &[source, page] : pages_) {
    result.push_back(source);
  }
  for (const auto &[source, resource] : targets_) {
    result.push_back(source);
  }
  return result;
}

std::optional<fs::path> Collation::get_link(const std::string &href) const {
  auto it = links_.find(href);
  if (it == links_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<fs::path> Collation::find_link(const std::string &href) const {
  std::string key = href;
  if (key.empty() || key.front() != '/') {
    key = "/" + key;
  }
  if (key != "/" && key.back() == '/') {
    key += INDEX_FILE;
  }

  if (auto found = get_link(key)) {
    return found;
  }
  std::string index = key;
  if (index.back() != '/') {
    index += "/";
  }
  index += INDEX_FILE;
  return get_link(index);
}

std::optional<std::string> Collation::get_href(const fs::path &source) const {
  auto it = hrefs_.find(source);
  if (it == hrefs_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool Collation::is_allowed(const std::string &href) const {
  return allowed_.count(href) > 0;
}

std::optional<fs::path> Collation::find_layout(const fs::path &source) const {
  auto it = page_layouts_.find(source);
  if (it != page_layouts_.end()) {
    return it->second;
  }
  return default_layout_;
}

std::optional<fs::path>
Collation::find_named_layout(const std::string &name) const {
  auto it = layouts_.find(name);
  if (it == layouts_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void Collation::link(const fs::path &source, const std::string &href) {
  auto existing = links_.find(href);
  if (existing != links_.end() && existing->second != source) {
    throw KilnError(ErrorKind::LinkCollision,
                    "Link collision on " + href + ": " +
                        existing->second.string() + " and " + source.string(),
                    source);
  }
  unlink(source);
  links_[href] = source;
  hrefs_[source] = href;
}

void Collation::unlink(const fs::path &source) {
  auto it = hrefs_.find(source);
  if (it == hrefs_.end()) {
    return;
  }
  links_.erase(it->second);
  hrefs_.erase(it);
}

void Collation::add_page(Page page, const std::string &link_href) {
  fs::path source = page.source;
  link(source, link_href);
  targets_.erase(source);
  pages_.insert_or_assign(source, std::move(page));
}

void Collation::add_file(const fs::path &source, Resource resource,
                         const std::string &link_href) {
  link(source, link_href);
  pages_.erase(source);
  page_layouts_.erase(source);
  targets_.insert_or_assign(source, std::move(resource));
}

bool Collation::remove(const fs::path &source) {
  std::optional<fs::path> dest = destination(source);
  if (!dest) {
    return false;
  }

  if (const Page *page = resolve(source)) {
    for (auto it = permalinks_.begin(); it != permalinks_.end();) {
      if (it->second == page->href) {
        it = permalinks_.erase(it);
      } else {
        ++it;
      }
    }
  }

  unlink(source);
  pages_.erase(source);
  targets_.erase(source);
  page_layouts_.erase(source);
  remove_artifact(*dest);
  return true;
}

void Collation::remove_artifact(const fs::path &destination) const {
  fs::path file = path_ / destination;
  std::error_code ec;
  if (!fs::remove(file, ec) && ec) {
    Log::warn("Cannot remove " + file.string() + ": " + ec.message());
    return;
  }
  Log::debug("Removed " + file.string());

  // Only an emptied clean URL directory goes; fs::remove refuses others.
  if (file.filename() == INDEX_FILE) {
    fs::path dir = file.parent_path();
    if (dir != path_ && fs::is_directory(dir) && fs::is_empty(dir)) {
      fs::remove(dir, ec);
      if (ec) {
        Log::warn("Cannot remove " + dir.string() + ": " + ec.message());
      }
    }
  }
}

void Collation::set_layout(const fs::path &source, const fs::path &layout) {
  page_layouts_[source] = layout;
}

void Collation::add_layout(const std::string &name, const fs::path &layout) {
  layouts_[name] = layout;
}

void Collation::remove_layout(const fs::path &layout) {
  for (auto it = layouts_.begin(); it != layouts_.end();) {
    if (it->second == layout) {
      it = layouts_.erase(it);
    } else {
      ++it;
    }
  }
  if (default_layout_ == layout) {
    default_layout_.reset();
  }
}

void Collation::clear_derived() {
  menus_.clear();
  permalinks_.clear();
}

void Collation::add_menu(const std::string &name,
                         std::vector<std::string> hrefs) {
  menus_[name] = std::move(hrefs);
}

void Collation::add_permalink(const std::string &permalink,
                              const std::string &href,
                              const fs::path &source) {
  auto existing = permalinks_.find(permalink);
  if (existing != permalinks_.end() && existing->second != href) {
    throw KilnError(ErrorKind::DuplicatePermalink,
                    "Duplicate permalink " + permalink + " in " +
                        source.string() + " (already used by " +
                        existing->second + ")",
                    source);
  }
  permalinks_[permalink] = href;
}

void Collation::allow(const std::string &href) { allowed_.insert(href); }

nlohmann::json Collation::menu_hrefs() const {
  nlohmann::json menus = nlohmann::json::object();
  for (const auto &[name, hrefs] : menus_) {
    menus[name] = hrefs;
  }
  return menus;
}

CollationBuilder::CollationBuilder(const SiteConfig &config,
                                   const RuntimeOptions &options,
                                   const HrefResolver &resolver)
    : config_(config), options_(options), resolver_(resolver),
      loader_(config, options, resolver) {}

fs::path CollationBuilder::collation_path(const std::string &lang) const {
  if (config_.is_multi_lingual()) {
    return options_.target / lang;
  }
  return options_.target;
}

std::vector<fs::path> CollationBuilder::exclusions() const {
  const fs::path &source = options_.source;
  std::vector<fs::path> result = {
      config_.layouts(),
      source / config_.dirs.partials,
      source / config_.dirs.includes,
      source / config_.dirs.collections,
      source / config_.dirs.themes,
      source / config_.dirs.locales,
      config_.project / CONFIG_FILE_NAME,
      options_.output,
  };
  for (const auto &hook : config_.hooks) {
    if (hook.source) {
      result.push_back(config_.project / *hook.source);
    }
  }
  for (const auto &book : config_.books) {
    result.push_back(source / book);
  }
  return result;
}

bool CollationBuilder::is_layout(const fs::path &file) const {
  fs::path rel = file.lexically_normal().lexically_relative(
      config_.layouts().lexically_normal());
  return !rel.empty() && *rel.begin() != "..";
}

std::string CollationBuilder::link_key(const Page &page,
                                       const fs::path &output_path) const {
  LinkOptions opts;
  opts.trailing = false;
  if (!page.render) {
    opts.rewrite = false;
    opts.transpose = false;
  } else {
    opts.include_index = true;
    opts.rewrite_index =
        page.rewrite_index.value_or(options_.settings.rewrite_index);
  }
  return resolver_.compute_absolute_href(output_path, opts);
}

void CollationBuilder::add_entry(Collation &collation, const fs::path &file,
                                 const fs::path &output_path) const {
  if (!resolver_.is_page(file)) {
    LinkOptions opts;
    opts.rewrite = false;
    opts.transpose = false;
    opts.trailing = false;
    collation.add_file(
        file, Resource::file(resolver_.compute_destination(output_path, true)),
        resolver_.compute_absolute_href(output_path, opts));
    return;
  }

  Page page = loader_.load(file, output_path);
  page.lang = collation.lang();

  if (file != output_path && fs::exists(output_path)) {
    Page fallback = loader_.load(output_path);
    inherit(page, fallback, loader_.read_front_matter(file));
    page.lang = collation.lang();
    loader_.locate(page, output_path);
  }

  if (page.standalone) {
    page.layout.reset();
  } else if (page.layout) {
    auto layout = collation.find_named_layout(*page.layout);
    if (!layout) {
      throw KilnError(ErrorKind::NoLayout,
                      "Layout '" + *page.layout + "' not found for " +
                          file.string(),
                      file);
    }
    collation.set_layout(file, *layout);
  }

  std::string key = link_key(page, output_path);
  collation.add_page(std::move(page), key);
}

void CollationBuilder::add_layouts(Collation &collation) const {
  fs::path dir = config_.layouts();
  if (!fs::is_directory(dir)) {
    return;
  }
  DirectoryWalker walker(dir);
  for (const auto &entry : walker.walk()) {
    if (!entry.is_file)
      continue;
    collation.add_layout(entry.path.lexically_relative(dir).generic_string(),
                         entry.path);
  }

  if (auto layout = collation.find_named_layout(config_.layout)) {
    collation.set_default_layout(*layout);
  }
}

void CollationBuilder::finish(Collation &collation) const {
  for (const auto &[source, page] : collation.pages()) {
    if (page.permalink) {
      collation.add_permalink(*page.permalink, page.href, source);
    }
  }

  for (const auto &[name, entries] : config_.menus) {
    std::vector<std::string> hrefs;
    for (const auto &entry : entries) {
      fs::path file = options_.source / entry;
      const Page *page = collation.resolve(file);
      if (page == nullptr && collation.lang() != config_.lang) {
        page = collation.resolve(locale_path(file, collation.lang()));
      }
      if (page == nullptr) {
        throw KilnError(ErrorKind::NoMenuPage,
                        "Menu '" + name + "' references missing page " +
                            entry,
                        file);
      }
      hrefs.push_back(page->href);
    }
    collation.add_menu(name, std::move(hrefs));
  }

  for (const auto &href : config_.link.allow) {
    collation.allow(href.empty() || href.front() == '/' ? href : "/" + href);
  }
}

std::vector<std::shared_ptr<Collation>> CollationBuilder::build() const {
  loader_.verify_pages();

  auto fallback = std::make_shared<Collation>(config_.lang,
                                              collation_path(config_.lang));
  std::vector<std::shared_ptr<Collation>> result = {fallback};
  std::map<std::string, std::shared_ptr<Collation>> locales;
  for (const auto &lang : config_.locales) {
    if (lang == config_.lang)
      continue;
    auto collation = std::make_shared<Collation>(lang, collation_path(lang));
    locales[lang] = collation;
    result.push_back(collation);
  }

  for (auto &collation : result) {
    add_layouts(*collation);
  }

  DirectoryWalker walker(options_.source, exclusions());
  std::vector<WalkEntry> entries = walker.walk();

  for (const auto &entry : entries) {
    if (!entry.is_file)
      continue;
    auto lang = locale_of(entry.path, config_.locales);
    if (lang && *lang != config_.lang) {
      continue;
    }
    add_entry(*fallback, entry.path, entry.path);
  }

  for (const auto &entry : entries) {
    if (!entry.is_file)
      continue;
    auto lang = locale_of(entry.path, config_.locales);
    if (!lang || *lang == config_.lang)
      continue;
    add_entry(*locales[*lang], entry.path, strip_locale(entry.path, *lang));
  }

  // Alternate locales carry every fallback entry they do not translate.
  for (auto &[lang, collation] : locales) {
    for (const auto &[source, page] : fallback->pages()) {
      if (collation->contains(locale_path(source, lang)))
        continue;
      add_entry(*collation, source, source);
    }
    for (const auto &[source, resource] : fallback->targets()) {
      if (collation->contains(locale_path(source, lang)))
        continue;
      add_entry(*collation, source, source);
    }
  }

  for (auto &collation : result) {
    finish(*collation);
    Log::debug("Collated " + std::to_string(collation->pages().size()) +
               " pages and " + std::to_string(collation->targets().size()) +
               " files for " + collation->lang());
  }
  return result;
}

bool CollationBuilder::upsert(Collation &collation, const fs::path &file) const {
  if (!upsert_entry(collation, file)) {
    return false;
  }
  if (!is_layout(file)) {
    collation.clear_derived();
    finish(collation);
  }
  return true;
}

bool CollationBuilder::upsert_entry(Collation &collation,
                                    const fs::path &file) const {
  if (is_layout(file)) {
    fs::path dir = config_.layouts();
    if (fs::is_regular_file(file)) {
      std::string name = file.lexically_relative(dir).generic_string();
      collation.add_layout(name, file);
      if (name == config_.layout) {
        collation.set_default_layout(file);
      }
    } else {
      collation.remove_layout(file);
    }
    return true;
  }

  DirectoryWalker walker(options_.source, exclusions());
  if (!fs::is_regular_file(file) || walker.is_excluded(file)) {
    return false;
  }

  auto lang = locale_of(file, config_.locales);
  bool is_fallback = collation.lang() == config_.lang;
  if (lang && *lang != config_.lang) {
    if (*lang != collation.lang()) {
      return false;
    }
    // The translation replaces the inherited fallback entry.
    collation.remove(strip_locale(file, *lang));
    add_entry(collation, file, strip_locale(file, *lang));
    return true;
  }

  if (!is_fallback && fs::exists(locale_path(file, collation.lang()))) {
    return false;
  }
  add_entry(collation, file, file);
  return true;
}
