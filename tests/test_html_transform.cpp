#include "core/html_transform.hpp"
#include <gtest/gtest.h>

namespace {

class SpanHighlighter : public SyntaxHighlighter {
public:
  std::optional<std::string>
  highlight(const std::string &code,
            const std::string &language) const override {
    if (language != "javascript") {
      return std::nullopt;
    }
    return "<span class=\"js\">" + code + "</span>";
  }
};

TransformOptions with_flags(bool auto_id, bool toc = false) {
  TransformOptions options;
  options.flags.auto_id = auto_id;
  options.flags.toc = toc;
  return options;
}

} // namespace

TEST(HtmlTransform, Slugify) {
  EXPECT_EQ(HtmlTransform::slugify("Hello, World!"), "hello-world");
  EXPECT_EQ(HtmlTransform::slugify("  Getting   Started "), "getting-started");
  EXPECT_EQ(HtmlTransform::slugify("v2.0 Notes"), "v2-0-notes");
}

TEST(HtmlTransform, AssignsHeadingIds) {
  auto result = HtmlTransform::apply("<h2>Getting Started</h2>",
                                     with_flags(true));
  EXPECT_EQ(result.html, "<h2 id=\"getting-started\">Getting Started</h2>");
}

TEST(HtmlTransform, DuplicateHeadingsGetSuffixes) {
  auto result = HtmlTransform::apply(
      "<h2>Intro</h2><h3>Intro</h3><h2>Intro</h2>", with_flags(true));
  EXPECT_EQ(result.html, "<h2 id=\"intro\">Intro</h2>"
                         "<h3 id=\"intro-1\">Intro</h3>"
                         "<h2 id=\"intro-2\">Intro</h2>");
}

TEST(HtmlTransform, AuthorIdIsKept) {
  auto result = HtmlTransform::apply(
      "<h2 id=\"custom\">Intro</h2><h2>Intro</h2>", with_flags(true));
  EXPECT_EQ(result.html,
            "<h2 id=\"custom\">Intro</h2><h2 id=\"intro\">Intro</h2>");
}

TEST(HtmlTransform, TocPlaceholderIsReplaced) {
  std::string html =
      "<toc data-tag=\"ol\" data-class=\"\" data-from=\"h2\" data-to=\"h3\" />"
      "<h2>One</h2><h3>Sub</h3>";
  auto result = HtmlTransform::apply(html, with_flags(true, true));
  EXPECT_EQ(result.html,
            "<ol><li><a href=\"#one\">One</a>"
            "<ol><li><a href=\"#sub\">Sub</a></li></ol></li></ol>"
            "<h2 id=\"one\">One</h2><h3 id=\"sub\">Sub</h3>");
}

TEST(HtmlTransform, TocAnchorsResolveWithoutAutoId) {
  std::string html =
      "<toc data-tag=\"ul\" data-class=\"nav\" data-from=\"h2\" "
      "data-to=\"h2\" />"
      "<h2>One</h2>";
  auto result = HtmlTransform::apply(html, with_flags(false, true));
  EXPECT_EQ(result.html,
            "<ul class=\"nav\"><li><a href=\"#one\">One</a></li></ul>"
            "<h2 id=\"one\">One</h2>");
}

TEST(HtmlTransform, GeneratedIdsAvoidLaterAuthorIds) {
  auto result = HtmlTransform::apply(
      "<h2>Intro</h2><h2 id=\"intro\">Other</h2>", with_flags(true));
  EXPECT_EQ(result.html,
            "<h2 id=\"intro-1\">Intro</h2><h2 id=\"intro\">Other</h2>");
}

TEST(HtmlTransform, GeneratedIdsAvoidNonHeadingIds) {
  auto result = HtmlTransform::apply(
      "<h2>Usage</h2><section id=\"usage\"></section>", with_flags(true));
  EXPECT_EQ(result.html, "<h2 id=\"usage-1\">Usage</h2>"
                         "<section id=\"usage\"></section>");
}

TEST(HtmlTransform, StripsComments) {
  TransformOptions options;
  options.flags.strip_comments = true;
  auto result =
      HtmlTransform::apply("<p>a</p><!-- note --><p>b</p>", options);
  EXPECT_EQ(result.html, "<p>a</p><p>b</p>");
}

TEST(HtmlTransform, RemovesEmptyHeadingsAndCode) {
  auto result =
      HtmlTransform::apply("<h1></h1><p>x</p><code></code>", with_flags(true));
  EXPECT_EQ(result.html, "<p>x</p>");
}

TEST(HtmlTransform, HighlightsCodeThroughAliases) {
  SpanHighlighter highlighter;
  LanguageAliases aliases;
  TransformOptions options;
  options.flags.syntax_highlight = true;
  options.highlighter = &highlighter;
  options.aliases = &aliases;

  auto result = HtmlTransform::apply(
      "<pre><code class=\"language-js\">a &lt; b</code></pre>", options);
  EXPECT_EQ(result.html, "<pre><code class=\"language-js code\">"
                         "<span class=\"js\">a < b</span></code></pre>");
}

TEST(HtmlTransform, UnknownLanguageIsLeftAlone) {
  SpanHighlighter highlighter;
  TransformOptions options;
  options.flags.syntax_highlight = true;
  options.highlighter = &highlighter;

  std::string html = "<pre><code class=\"language-rust\">fn x()</code></pre>";
  EXPECT_EQ(HtmlTransform::apply(html, options).html, html);
}

TEST(HtmlTransform, ExtractsSearchText) {
  TransformOptions options;
  options.extract_text = true;
  auto result = HtmlTransform::apply(
      "<html><head><title>My &amp; Page</title></head>"
      "<body><p>First <em>para</em>.</p><p>  </p><p>Second one</p></body>"
      "</html>",
      options);

  ASSERT_TRUE(result.text.has_value());
  ASSERT_TRUE(result.text->title.has_value());
  EXPECT_EQ(*result.text->title, "My & Page");
  ASSERT_EQ(result.text->chunks.size(), 2u);
  EXPECT_EQ(result.text->chunks[0], "First para.");
  EXPECT_EQ(result.text->chunks[1], "Second one");
  EXPECT_EQ(result.text->words, 4u);
}

TEST(HtmlTransform, ExtractsIndexedRegions) {
  TransformOptions options;
  options.extract_text = true;
  auto result = HtmlTransform::apply(
      "<p>Lead</p>"
      "<div data-index><span>Alpha beta</span><p>gamma</p></div>"
      "<ul><li>Skipped</li></ul>",
      options);

  ASSERT_TRUE(result.text.has_value());
  ASSERT_EQ(result.text->chunks.size(), 2u);
  EXPECT_EQ(result.text->chunks[0], "Lead");
  EXPECT_EQ(result.text->chunks[1], "Alpha betagamma");
  EXPECT_EQ(result.text->words, 3u);
}

TEST(HtmlTransform, NestedIndexedRegionsCountOnce) {
  TransformOptions options;
  options.extract_text = true;
  auto result = HtmlTransform::apply(
      "<div data-index=\"main\"><div><p>one two</p></div> "
      "<div data-index>three</div></div>",
      options);

  ASSERT_TRUE(result.text.has_value());
  ASSERT_EQ(result.text->chunks.size(), 1u);
  EXPECT_EQ(result.text->words, 3u);
}

TEST(HtmlTransform, WordsPlaceholderShowsCount) {
  TransformOptions options;
  options.flags.words = true;
  auto result = HtmlTransform::apply(
      "<p>one two three</p><span><words /> words</span>", options);
  EXPECT_EQ(result.html, "<p>one two three</p><span>3 words</span>");
  EXPECT_FALSE(result.text.has_value());
}

TEST(HtmlTransform, ReadingTimeHasAFloor) {
  EXPECT_EQ(HtmlTransform::replace_words("<words data-avg=\"250\" /> min", 100),
            "2 min");
  EXPECT_EQ(HtmlTransform::replace_words("<words data-avg=\"100\" />", 1000),
            "10");
  EXPECT_EQ(HtmlTransform::replace_words("<words /> <words />", 7), "7 7");
}
