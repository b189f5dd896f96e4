#include "locale.hpp"
#include <algorithm>

std::optional<std::string>
locale_of(const fs::path &file, const std::vector<std::string> &alternates) {
  fs::path stem = file.stem();
  if (!stem.has_extension()) {
    return std::nullopt;
  }
  std::string lang = stem.extension().string().substr(1);
  if (std::find(alternates.begin(), alternates.end(), lang) ==
      alternates.end()) {
    return std::nullopt;
  }
  return lang;
}

fs::path strip_locale(const fs::path &file, const std::string &lang) {
  fs::path stem = file.stem();
  if (stem.extension() != "." + lang) {
    return file;
  }
  fs::path result = file.parent_path() / stem.stem();
  result += file.extension();
  return result;
}

fs::path locale_path(const fs::path &file, const std::string &lang) {
  fs::path result = file.parent_path() / file.stem();
  result += "." + lang;
  result += file.extension();
  return result;
}

void inherit(Page &page, const Page &fallback,
             const nlohmann::json &front_matter) {
  page.data = fallback.data;
  page.data.erase("permalink");
  page.permalink.reset();
  page.merge(front_matter);
  page.update_fields();
}
