#include "toc.hpp"
#include "utils/errors.hpp"

Heading Heading::parse(const std::string &tag_name, const std::string &id,
                       const std::string &text) {
  if (tag_name.size() != 2 || tag_name[0] != 'h' || tag_name[1] < '1' ||
      tag_name[1] > '6') {
    throw KilnError(ErrorKind::Template,
                    "Invalid heading tag name " + tag_name);
  }
  return {static_cast<std::size_t>(tag_name[1] - '1'), id, text};
}

std::string Heading::open() const {
  return "<li><a href=\"#" + id + "\">" + text + "</a>";
}

void TableOfContents::add(const std::string &tag_name, const std::string &id,
                          const std::string &text) {
  entries_.push_back(Heading::parse(tag_name, id, text));
}

std::string TableOfContents::to_html(const std::string &tag_name,
                                     const std::string &class_name,
                                     const std::string &from,
                                     const std::string &to) const {
  std::size_t min_depth = Heading::parse(from, "", "").depth;
  std::size_t max_depth = Heading::parse(to, "", "").depth;
  if (max_depth < min_depth) {
    max_depth = min_depth;
  }

  if (entries_.empty()) {
    return "";
  }

  std::string open_list = "<" + tag_name + ">";
  std::string close_list = "</" + tag_name + ">";

  std::string markup = class_name.empty()
                           ? open_list
                           : "<" + tag_name + " class=\"" + class_name + "\">";

  const Heading *current = nullptr;
  std::size_t nested = 0;

  for (const auto &heading : entries_) {
    if (heading.depth < min_depth || heading.depth > max_depth) {
      continue;
    }

    if (current != nullptr) {
      if (heading.depth > current->depth) {
        ++nested;
        markup += open_list;
      } else if (heading.depth < current->depth && nested > 0) {
        --nested;
        markup += Heading::close();
        markup += close_list;
        markup += Heading::close();
      } else {
        markup += Heading::close();
      }
    }

    markup += heading.open();
    current = &heading;
  }

  if (nested > 0) {
    for (; nested > 0; --nested) {
      markup += Heading::close();
      markup += close_list;
      markup += Heading::close();
    }
  } else if (current != nullptr) {
    markup += Heading::close();
  }

  markup += close_list;
  return markup;
}
