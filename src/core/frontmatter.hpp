#ifndef FRONTMATTER_H
#define FRONTMATTER_H

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

struct FrontMatterConfig {
  std::string start;
  std::string end;
  // Stop reading once the front matter block is complete.
  bool bail = false;

  static FrontMatterConfig markdown(bool bail = false) {
    return {"+++", "+++", bail};
  }
  static FrontMatterConfig html(bool bail = false) {
    return {"<!--", "-->", bail};
  }
};

struct FrontMatterResult {
  std::string body;
  bool has_front_matter = false;
  std::string front_matter;
};

class FrontMatter {
public:
  // Front matter lines are replaced by blank lines in the body so line
  // numbers reported by the template engine match the source file.
  static FrontMatterResult parse(const std::string &content,
                                 const FrontMatterConfig &conf,
                                 const fs::path &file = fs::path());

  static FrontMatterResult load(const fs::path &file,
                                const FrontMatterConfig &conf);
};

#endif
