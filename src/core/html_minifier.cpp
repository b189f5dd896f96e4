#include "html_minifier.hpp"
#include <cctype>

bool HtmlMinifier::is_whitespace(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string HtmlMinifier::minify(const std::string &html) {
  std::string result;
  result.reserve(html.size());

  std::string pending;
  bool empty = true;
  State state = State::None;

  for (char c : html) {
    if (c == '<') {
      if (!empty) {
        result += pending;
      }
      pending.clear();
      state = State::Inside;
    } else if (c == '>' && state == State::Inside) {
      state = State::Between;
      empty = true;
      result += c;
      continue;
    }

    switch (state) {
    case State::None:
    case State::Inside:
      result += c;
      break;
    case State::Between:
      empty = empty && is_whitespace(c);
      pending += c;
      break;
    }
  }

  if (!empty) {
    result += pending;
  }
  return result;
}
