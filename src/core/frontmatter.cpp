#include "frontmatter.hpp"
#include "utils/errors.hpp"
#include "utils/files.hpp"
#include <sstream>

namespace {

std::string trim(const std::string &line) {
  const char *space = " \t\r\n";
  auto first = line.find_first_not_of(space);
  if (first == std::string::npos) {
    return "";
  }
  auto last = line.find_last_not_of(space);
  return line.substr(first, last - first + 1);
}

} // namespace

FrontMatterResult FrontMatter::parse(const std::string &content,
                                     const FrontMatterConfig &conf,
                                     const fs::path &file) {
  FrontMatterResult result;
  std::istringstream input(content);
  std::string line;
  bool in_front_matter = false;

  while (std::getline(input, line)) {
    std::string trimmed = trim(line);

    if (!in_front_matter && trimmed == conf.start && result.body.empty() &&
        !result.has_front_matter) {
      in_front_matter = true;
      result.has_front_matter = true;
      result.body += "\n";
      continue;
    }

    if (in_front_matter) {
      result.body += "\n";
      if (trimmed == conf.end) {
        in_front_matter = false;
        if (conf.bail) {
          return result;
        }
        continue;
      }
      result.front_matter += line;
      result.front_matter += "\n";
      continue;
    }

    if (conf.bail) {
      return result;
    }
    result.body += line;
    result.body += "\n";
  }

  if (in_front_matter) {
    throw KilnError(ErrorKind::FrontMatterNotTerminated,
                    "Front matter was not terminated in " + file.string(),
                    file);
  }

  return result;
}

FrontMatterResult FrontMatter::load(const fs::path &file,
                                    const FrontMatterConfig &conf) {
  return parse(read_file(file), conf, file);
}
