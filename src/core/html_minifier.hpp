#ifndef HTML_MINIFIER_HPP
#define HTML_MINIFIER_HPP

#include <string>

// Drops whitespace-only runs between tags. Text with any non-space
// character between two tags is kept verbatim, and nothing inside a tag is
// touched. Script and style bodies are not treated specially.
class HtmlMinifier {
public:
  static std::string minify(const std::string &html);

private:
  enum class State { None, Inside, Between };

  static bool is_whitespace(char c);
};

#endif // HTML_MINIFIER_HPP
