#ifndef HTML_TRANSFORM_HPP
#define HTML_TRANSFORM_HPP

#include "collaborators.hpp"
#include "utils/config.hpp"
#include <optional>
#include <string>

struct TransformOptions {
  HtmlTransformFlags flags;
  const SyntaxHighlighter *highlighter = nullptr;
  const LanguageAliases *aliases = nullptr;
  bool extract_text = false;

  bool is_active() const { return flags.is_active() || extract_text; }
};

struct TransformResult {
  std::string html;
  std::optional<TextExtraction> text;
};

// Rewrites rendered HTML in two passes. The first buffers heading, code and
// index text; the second assigns heading ids, swaps in highlighted code and
// fills the <toc /> and <words /> placeholders.
class HtmlTransform {
public:
  static TransformResult apply(const std::string &html,
                               const TransformOptions &options);

  static std::string slugify(const std::string &text);
  static std::string strip_tags(const std::string &html);
  static std::string decode_entities(const std::string &text);
  static std::string strip_comments(const std::string &html);

  // Replaces `<words />` with the word count and `<words data-avg="N" />`
  // with the reading time in minutes.
  static std::string replace_words(const std::string &html, std::size_t words);
};

#endif
