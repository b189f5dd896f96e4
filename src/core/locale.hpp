#ifndef LOCALE_HPP
#define LOCALE_HPP

#include "page.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

// `about.fr.md` -> "fr" when fr is one of the alternate locales.
std::optional<std::string>
locale_of(const fs::path &file, const std::vector<std::string> &alternates);

// `about.fr.md` -> `about.md`. Paths without the tag are returned unchanged.
fs::path strip_locale(const fs::path &file, const std::string &lang);

// `about.md` -> `about.fr.md`.
fs::path locale_path(const fs::path &file, const std::string &lang);

// Locale pages start from the fallback page data and apply their own front
// matter on top. A permalink is never inherited.
void inherit(Page &page, const Page &fallback,
             const nlohmann::json &front_matter);

#endif
