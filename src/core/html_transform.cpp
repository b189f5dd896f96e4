#include "html_transform.hpp"
#include "toc.hpp"
#include <algorithm>
#include <cctype>
#include <deque>
#include <set>
#include <regex>
#include <sstream>

namespace {

struct Element {
  std::string tag;
  std::size_t open_start = 0;
  std::size_t open_end = 0;
  std::size_t close_start = 0;
  std::size_t close_end = 0;

  std::string open_tag(const std::string &doc) const {
    return doc.substr(open_start, open_end - open_start);
  }
  std::string inner(const std::string &doc) const {
    return doc.substr(open_end, close_start - open_end);
  }
};

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return value;
}

bool is_heading(const std::string &tag) {
  return tag.size() == 2 && tag[0] == 'h' && tag[1] >= '1' && tag[1] <= '6';
}

// Finds elements whose lower-cased tag name satisfies `match`. Nested
// elements of the same name are not supported.
template <typename Match>
std::vector<Element> find_elements(const std::string &lower, Match match) {
  std::vector<Element> result;
  std::size_t pos = 0;
  while ((pos = lower.find('<', pos)) != std::string::npos) {
    std::size_t name_end = pos + 1;
    while (name_end < lower.size() &&
           std::isalnum(static_cast<unsigned char>(lower[name_end]))) {
      ++name_end;
    }
    std::string tag = lower.substr(pos + 1, name_end - pos - 1);
    if (tag.empty() || !match(tag)) {
      pos = name_end;
      continue;
    }

    std::size_t gt = lower.find('>', name_end);
    if (gt == std::string::npos) {
      break;
    }
    std::string closing = "</" + tag;
    std::size_t close = lower.find(closing, gt + 1);
    while (close != std::string::npos &&
           close + closing.size() < lower.size() &&
           std::isalnum(
               static_cast<unsigned char>(lower[close + closing.size()]))) {
      close = lower.find(closing, close + closing.size());
    }
    if (close == std::string::npos) {
      pos = gt + 1;
      continue;
    }
    std::size_t close_gt = lower.find('>', close);
    if (close_gt == std::string::npos) {
      break;
    }

    Element element;
    element.tag = tag;
    element.open_start = pos;
    element.open_end = gt + 1;
    element.close_start = close;
    element.close_end = close_gt + 1;
    result.push_back(element);
    pos = element.close_end;
  }
  return result;
}

// Position of the `</tag` that closes an element opened before `from`,
// counting nested elements of the same name.
std::size_t find_closing(const std::string &lower, const std::string &tag,
                         std::size_t from) {
  std::string opening = "<" + tag;
  std::string closing = "</" + tag;
  auto is_boundary = [&](std::size_t at) {
    return at >= lower.size() ||
           !std::isalnum(static_cast<unsigned char>(lower[at]));
  };
  std::size_t depth = 1;
  std::size_t pos = from;
  while ((pos = lower.find('<', pos)) != std::string::npos) {
    if (lower.compare(pos, closing.size(), closing) == 0 &&
        is_boundary(pos + closing.size())) {
      if (--depth == 0) {
        return pos;
      }
    } else if (lower.compare(pos, opening.size(), opening) == 0 &&
               is_boundary(pos + opening.size())) {
      std::size_t gt = lower.find('>', pos);
      if (gt != std::string::npos && lower[gt - 1] != '/') {
        ++depth;
      }
    }
    ++pos;
  }
  return std::string::npos;
}

// Elements carrying a `data-index` attribute. Regions inside an earlier
// region are folded into it.
std::vector<Element> find_indexed(const std::string &lower) {
  static const std::regex marker(
      R"re(<([a-z][a-z0-9]*)\b[^>]*\sdata-index\b[^>]*>)re");
  std::vector<Element> result;
  auto begin = std::sregex_iterator(lower.begin(), lower.end(), marker);
  for (auto it = begin; it != std::sregex_iterator(); ++it) {
    std::size_t start = static_cast<std::size_t>(it->position(0));
    if (!result.empty() && start < result.back().close_end) {
      continue;
    }
    Element element;
    element.tag = (*it)[1].str();
    element.open_start = start;
    element.open_end = start + static_cast<std::size_t>(it->length(0));
    std::size_t close = find_closing(lower, element.tag, element.open_end);
    if (close == std::string::npos) {
      continue;
    }
    std::size_t close_gt = lower.find('>', close);
    if (close_gt == std::string::npos) {
      break;
    }
    element.close_start = close;
    element.close_end = close_gt + 1;
    result.push_back(element);
  }
  return result;
}

std::set<std::string> collect_ids(const std::string &doc) {
  static const std::regex id_pattern(
      R"re(<[^>]*\sid\s*=\s*("([^"]*)"|'([^']*)'))re", std::regex::icase);
  std::set<std::string> ids;
  auto begin = std::sregex_iterator(doc.begin(), doc.end(), id_pattern);
  for (auto it = begin; it != std::sregex_iterator(); ++it) {
    ids.insert((*it)[2].matched ? (*it)[2].str() : (*it)[3].str());
  }
  return ids;
}

std::optional<std::string> get_attribute(const std::string &open_tag,
                                         const std::string &name) {
  std::regex pattern("\\s" + name + "\\s*=\\s*(\"([^\"]*)\"|'([^']*)')",
                     std::regex::icase);
  std::smatch match;
  if (!std::regex_search(open_tag, match, pattern)) {
    return std::nullopt;
  }
  return match[2].matched ? match[2].str() : match[3].str();
}

std::string set_attribute(const std::string &open_tag, const std::string &name,
                          const std::string &value) {
  std::regex pattern("(\\s" + name + "\\s*=\\s*)(\"[^\"]*\"|'[^']*')",
                     std::regex::icase);
  if (std::regex_search(open_tag, pattern)) {
    return std::regex_replace(open_tag, pattern, "$1\"" + value + "\"",
                              std::regex_constants::format_first_only);
  }
  std::size_t name_end = 1;
  while (name_end < open_tag.size() &&
         std::isalnum(static_cast<unsigned char>(open_tag[name_end]))) {
    ++name_end;
  }
  return open_tag.substr(0, name_end) + " " + name + "=\"" + value + "\"" +
         open_tag.substr(name_end);
}

std::string remove_all(std::string doc, const std::string &needle) {
  std::size_t pos;
  while ((pos = doc.find(needle)) != std::string::npos) {
    doc.erase(pos, needle.size());
  }
  return doc;
}

std::string strip_empty_elements(std::string doc) {
  doc = remove_all(std::move(doc), "<code></code>");
  for (char level = '1'; level <= '6'; ++level) {
    std::string tag = std::string("h") + level;
    doc = remove_all(std::move(doc), "<" + tag + "></" + tag + ">");
  }
  return doc;
}

std::string trim(const std::string &text) {
  const char *space = " \t\r\n";
  auto first = text.find_first_not_of(space);
  if (first == std::string::npos) {
    return "";
  }
  auto last = text.find_last_not_of(space);
  return text.substr(first, last - first + 1);
}

std::size_t count_words(const std::string &text) {
  std::istringstream stream(text);
  std::string word;
  std::size_t count = 0;
  while (stream >> word) {
    ++count;
  }
  return count;
}

struct CodeBlock {
  Element code;
  std::string text;
  std::string class_name;
};

struct Replacement {
  std::size_t start;
  std::size_t end;
  std::string text;
};

std::vector<CodeBlock> find_code_blocks(const std::string &doc,
                                        const std::string &lower) {
  std::vector<CodeBlock> blocks;
  auto pres = find_elements(lower, [](const std::string &tag) {
    return tag == "pre";
  });
  for (const auto &pre : pres) {
    std::size_t start = pre.open_end;
    while (start < pre.close_start &&
           std::isspace(static_cast<unsigned char>(lower[start]))) {
      ++start;
    }
    if (lower.compare(start, 5, "<code") != 0) {
      continue;
    }
    std::size_t gt = lower.find('>', start);
    std::size_t close = lower.rfind("</code", pre.close_start);
    if (gt == std::string::npos || close == std::string::npos || close < gt) {
      continue;
    }

    CodeBlock block;
    block.code.tag = "code";
    block.code.open_start = start;
    block.code.open_end = gt + 1;
    block.code.close_start = close;
    block.code.close_end = lower.find('>', close) + 1;

    auto class_name = get_attribute(block.code.open_tag(doc), "class");
    if (!class_name) {
      continue;
    }
    block.class_name = *class_name;
    block.text = HtmlTransform::decode_entities(block.code.inner(doc));
    blocks.push_back(block);
  }
  return blocks;
}

} // namespace

std::string HtmlTransform::strip_comments(const std::string &html) {
  std::string result;
  result.reserve(html.size());
  std::size_t pos = 0;
  while (true) {
    std::size_t start = html.find("<!--", pos);
    if (start == std::string::npos) {
      result.append(html, pos, std::string::npos);
      break;
    }
    result.append(html, pos, start - pos);
    std::size_t end = html.find("-->", start + 4);
    if (end == std::string::npos) {
      break;
    }
    pos = end + 3;
  }
  return result;
}

std::string HtmlTransform::strip_tags(const std::string &html) {
  std::string result;
  bool in_tag = false;
  for (char c : html) {
    if (c == '<') {
      in_tag = true;
    } else if (c == '>' && in_tag) {
      in_tag = false;
    } else if (!in_tag) {
      result += c;
    }
  }
  return result;
}

std::string HtmlTransform::decode_entities(const std::string &text) {
  static const std::pair<const char *, const char *> entities[] = {
      {"&lt;", "<"},    {"&gt;", ">"},    {"&quot;", "\""},
      {"&#39;", "'"},   {"&#x27;", "'"},  {"&nbsp;", " "},
      {"&amp;", "&"}};

  std::string result;
  result.reserve(text.size());
  for (std::size_t i = 0; i < text.size();) {
    bool replaced = false;
    if (text[i] == '&') {
      for (const auto &[entity, value] : entities) {
        std::size_t length = std::char_traits<char>::length(entity);
        if (text.compare(i, length, entity) == 0) {
          result += value;
          i += length;
          replaced = true;
          break;
        }
      }
    }
    if (!replaced) {
      result += text[i++];
    }
  }
  return result;
}

std::string HtmlTransform::slugify(const std::string &text) {
  std::string slug;
  bool dash = false;
  for (unsigned char c : text) {
    if (std::isalnum(c) || c >= 0x80) {
      if (dash && !slug.empty()) {
        slug += '-';
      }
      slug += static_cast<char>(std::tolower(c));
      dash = false;
    } else {
      dash = true;
    }
  }
  return slug;
}

TransformResult HtmlTransform::apply(const std::string &html,
                                     const TransformOptions &options) {
  TransformResult result;
  const HtmlTransformFlags &flags = options.flags;

  std::string doc = strip_empty_elements(
      flags.strip_comments ? strip_comments(html) : html);
  std::string lower = to_lower(doc);

  // First pass: buffer heading and code text in document order.
  auto headings = find_elements(lower, is_heading);
  std::deque<std::string> heading_text;
  for (const auto &heading : headings) {
    heading_text.push_back(trim(strip_tags(heading.inner(doc))));
  }

  bool highlight = flags.syntax_highlight && options.highlighter != nullptr;
  std::vector<CodeBlock> code_blocks;
  if (highlight) {
    code_blocks = find_code_blocks(doc, lower);
  }

  if (options.extract_text || flags.words) {
    TextExtraction text;
    auto titles = find_elements(lower, [](const std::string &tag) {
      return tag == "title";
    });
    if (!titles.empty()) {
      text.title = decode_entities(trim(strip_tags(titles[0].inner(doc))));
    }

    // Paragraphs outside an indexed region, then each region whole, in
    // document order.
    auto regions = find_indexed(lower);
    std::vector<Element> sources = regions;
    for (const auto &paragraph : find_elements(lower, [](const std::string &tag) {
           return tag == "p";
         })) {
      bool inside = std::any_of(
          regions.begin(), regions.end(), [&](const Element &region) {
            return paragraph.open_start >= region.open_end &&
                   paragraph.close_end <= region.close_start;
          });
      if (!inside) {
        sources.push_back(paragraph);
      }
    }
    std::sort(sources.begin(), sources.end(),
              [](const Element &a, const Element &b) {
                return a.open_start < b.open_start;
              });

    for (const auto &source : sources) {
      std::string chunk = decode_entities(trim(strip_tags(source.inner(doc))));
      if (!chunk.empty()) {
        text.words += count_words(chunk);
        text.chunks.push_back(std::move(chunk));
      }
    }
    result.text = std::move(text);
  }

  // Second pass: rewrite.
  std::vector<Replacement> replacements;
  TableOfContents toc;
  bool assign_ids = flags.auto_id || flags.toc;
  // Generated ids must not collide with any id the author wrote.
  std::set<std::string> seen;
  if (assign_ids) {
    seen = collect_ids(doc);
  }

  for (const auto &heading : headings) {
    std::string text = heading_text.front();
    heading_text.pop_front();
    if (!assign_ids) {
      continue;
    }

    std::string open_tag = heading.open_tag(doc);
    auto id = get_attribute(open_tag, "id");
    if (!id) {
      std::string base = slugify(decode_entities(text));
      if (base.empty()) {
        base = heading.tag;
      }
      std::string candidate = base;
      std::size_t suffix = 0;
      while (seen.count(candidate) > 0) {
        candidate = base + "-" + std::to_string(++suffix);
      }
      id = candidate;
      seen.insert(*id);
      replacements.push_back({heading.open_start, heading.open_end,
                              set_attribute(open_tag, "id", *id)});
    }

    if (flags.toc) {
      toc.add(heading.tag, *id, text);
    }
  }

  LanguageAliases default_aliases;
  const LanguageAliases &aliases =
      options.aliases != nullptr ? *options.aliases : default_aliases;
  static const std::regex language_pattern(R"(language-([^\s]+))");
  for (const auto &block : code_blocks) {
    std::smatch match;
    if (!std::regex_search(block.class_name, match, language_pattern)) {
      continue;
    }
    std::string language = aliases.resolve(match[1].str());
    auto highlighted = options.highlighter->highlight(block.text, language);
    if (!highlighted) {
      continue;
    }
    std::string open_tag = set_attribute(block.code.open_tag(doc), "class",
                                         block.class_name + " code");
    replacements.push_back(
        {block.code.open_start, block.code.close_start, open_tag + *highlighted});
  }

  std::sort(replacements.begin(), replacements.end(),
            [](const Replacement &a, const Replacement &b) {
              return a.start < b.start;
            });

  std::string output;
  output.reserve(doc.size());
  std::size_t pos = 0;
  for (const auto &replacement : replacements) {
    output.append(doc, pos, replacement.start - pos);
    output += replacement.text;
    pos = replacement.end;
  }
  output.append(doc, pos, std::string::npos);

  if (flags.toc) {
    static const std::regex placeholder(
        R"re(<toc data-tag="(ol|ul)" data-class="([^"]*)" data-from="(h[1-6])" data-to="(h[1-6])" />)re");
    std::smatch match;
    if (std::regex_search(output, match, placeholder)) {
      std::string markup = toc.to_html(match[1].str(), match[2].str(),
                                       match[3].str(), match[4].str());
      output = match.prefix().str() + markup + match.suffix().str();
    }
  }

  if (flags.words && result.text) {
    output = replace_words(output, result.text->words);
  }
  if (!options.extract_text) {
    result.text.reset();
  }

  result.html = std::move(output);
  return result;
}

std::string HtmlTransform::replace_words(const std::string &html,
                                         std::size_t words) {
  static const std::regex marker(R"re(<words( data-avg="([0-9]+)")? />)re");
  std::string output;
  std::size_t pos = 0;
  auto begin = std::sregex_iterator(html.begin(), html.end(), marker);
  for (auto it = begin; it != std::sregex_iterator(); ++it) {
    const std::smatch &match = *it;
    std::size_t value = words;
    if (match[2].matched) {
      std::size_t avg = std::stoul(match[2].str());
      // Reading time in minutes, never below two.
      value = std::max<std::size_t>(avg > 0 ? words / avg : 0, 2);
    }
    output.append(html, pos, static_cast<std::size_t>(match.position(0)) - pos);
    output += std::to_string(value);
    pos = static_cast<std::size_t>(match.position(0) + match.length(0));
  }
  output.append(html, pos, std::string::npos);
  return output;
}
