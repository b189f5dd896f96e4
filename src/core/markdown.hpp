#ifndef MARKDOWN_HPP
#define MARKDOWN_HPP

#include <filesystem>
#include <string>

class MarkdownProcessor {
public:
  // GitHub flavoured markdown to HTML. Throws KilnError on parser failure;
  // `source` is only used for the message.
  static std::string to_html(const std::string &markdown,
                             const std::filesystem::path &source = {});
};

#endif
