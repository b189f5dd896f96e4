#include "core/frontmatter.hpp"
#include "utils/errors.hpp"
#include <gtest/gtest.h>

TEST(FrontMatter, MarkdownBlockIsSeparated) {
  std::string content = "+++\ntitle: Hello\n+++\n# Body\n";
  auto result = FrontMatter::parse(content, FrontMatterConfig::markdown());

  EXPECT_TRUE(result.has_front_matter);
  EXPECT_EQ(result.front_matter, "title: Hello\n");
  // Front matter lines become blank lines.
  EXPECT_EQ(result.body, "\n\n\n# Body\n");
}

TEST(FrontMatter, HtmlCommentDelimiters) {
  std::string content = "<!--\nlayout: false\n-->\n<p>x</p>\n";
  auto result = FrontMatter::parse(content, FrontMatterConfig::html());

  EXPECT_TRUE(result.has_front_matter);
  EXPECT_EQ(result.front_matter, "layout: false\n");
  EXPECT_EQ(result.body, "\n\n\n<p>x</p>\n");
}

TEST(FrontMatter, NoFrontMatter) {
  auto result =
      FrontMatter::parse("# Just text\n", FrontMatterConfig::markdown());
  EXPECT_FALSE(result.has_front_matter);
  EXPECT_TRUE(result.front_matter.empty());
  EXPECT_EQ(result.body, "# Just text\n");
}

TEST(FrontMatter, DelimiterAfterContentIsBody) {
  std::string content = "intro\n+++\nnot: meta\n+++\n";
  auto result = FrontMatter::parse(content, FrontMatterConfig::markdown());
  EXPECT_FALSE(result.has_front_matter);
  EXPECT_EQ(result.body, content);
}

TEST(FrontMatter, UnterminatedBlockThrows) {
  try {
    FrontMatter::parse("+++\ntitle: x\n", FrontMatterConfig::markdown(),
                       "page.md");
    FAIL() << "expected FrontMatterNotTerminated";
  } catch (const KilnError &e) {
    EXPECT_EQ(e.kind(), ErrorKind::FrontMatterNotTerminated);
    EXPECT_EQ(e.path(), fs::path("page.md"));
  }
}

TEST(FrontMatter, BailStopsAfterBlock) {
  std::string content = "+++\ntitle: x\n+++\nlong body\n";
  auto result =
      FrontMatter::parse(content, FrontMatterConfig::markdown(true));
  EXPECT_TRUE(result.has_front_matter);
  EXPECT_EQ(result.front_matter, "title: x\n");
  EXPECT_EQ(result.body.find("long body"), std::string::npos);
}
