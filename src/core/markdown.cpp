#include "markdown.hpp"
#include "utils/errors.hpp"
#include <md4c-html.h>
#include <md4c.h>

// Callback for md4c to write HTML output
static void process_output(const MD_CHAR *text, MD_SIZE size, void *userdata) {
  std::string *output = static_cast<std::string *>(userdata);
  output->append(text, size);
}

std::string MarkdownProcessor::to_html(const std::string &markdown,
                                       const std::filesystem::path &source) {
  std::string html;
  html.reserve(markdown.size() + markdown.size() / 4);

  unsigned parser_flags = MD_FLAG_TABLES | MD_FLAG_STRIKETHROUGH |
                          MD_FLAG_TASKLISTS | MD_FLAG_PERMISSIVEURLAUTOLINKS;

  unsigned renderer_flags = MD_HTML_FLAG_SKIP_UTF8_BOM;

  int result = md_html(markdown.c_str(), static_cast<MD_SIZE>(markdown.size()),
                       process_output, &html, parser_flags, renderer_flags);

  if (result != 0) {
    throw KilnError(ErrorKind::Template,
                    "Cannot parse markdown in " + source.string(), source);
  }

  return html;
}
