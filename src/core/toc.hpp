#ifndef TOC_HPP
#define TOC_HPP

#include <cstddef>
#include <string>
#include <vector>

struct Heading {
  std::size_t depth = 0;
  std::string id;
  std::string text;

  // "h1".."h6"; throws KilnError for any other tag name.
  static Heading parse(const std::string &tag_name, const std::string &id,
                       const std::string &text);

  std::string open() const;
  static const char *close() { return "</li>"; }
};

class TableOfContents {
public:
  void add(const std::string &tag_name, const std::string &id,
           const std::string &text);

  bool empty() const { return entries_.empty(); }
  const std::vector<Heading> &entries() const { return entries_; }

  // Nested list of the headings between `from` and `to` inclusive. Empty
  // string when no heading was recorded.
  std::string to_html(const std::string &tag_name,
                      const std::string &class_name, const std::string &from,
                      const std::string &to) const;

private:
  std::vector<Heading> entries_;
};

#endif
