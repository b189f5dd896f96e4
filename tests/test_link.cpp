#include "core/link.hpp"
#include "test_support.hpp"
#include "utils/errors.hpp"
#include <gtest/gtest.h>

TEST(LinkResolver, AbsoluteBecomesRelative) {
  SiteFixture site;
  site.page("style.css", "body {}");
  fs::path post = site.page("posts/a.md", "# A\n");

  CollationBuilder builder(site.config, site.options, *site.resolver);
  auto collation = builder.build().front();
  LinkResolver links(*collation, *site.resolver, site.config.link);

  EXPECT_EQ(links.link("/style.css", post), "../style.css");
  EXPECT_EQ(links.link("/style.css", site.source() / "index.md"),
            "style.css");
}

TEST(LinkResolver, PassThroughInputs) {
  SiteFixture site("name: Test\nlink:\n  verify: true\n");
  fs::path post = site.page("posts/a.md", "# A\n");

  CollationBuilder builder(site.config, site.options, *site.resolver);
  auto collation = builder.build().front();
  LinkResolver links(*collation, *site.resolver, site.config.link);

  EXPECT_EQ(links.link("https://example.com/x", post),
            "https://example.com/x");
  EXPECT_EQ(links.link("b.html", post), "b.html");
  EXPECT_EQ(links.link("", post), "");
}

TEST(LinkResolver, AbsoluteModeKeepsLeadingSlash) {
  SiteFixture site("name: Test\nlink:\n  relative: false\n");
  site.page("about.md", "# About\n");
  fs::path post = site.page("posts/a.md", "# A\n");

  CollationBuilder builder(site.config, site.options, *site.resolver);
  auto collation = builder.build().front();
  LinkResolver links(*collation, *site.resolver, site.config.link);

  EXPECT_EQ(links.link("/about.html", post), "/about.html");
}

TEST(LinkResolver, VerifyRejectsMissingTargets) {
  SiteFixture site("name: Test\nlink:\n  verify: true\n  allow: [/feed.xml]\n");
  site.page("about.md", "# About\n");
  fs::path post = site.page("posts/a.md", "# A\n");

  CollationBuilder builder(site.config, site.options, *site.resolver);
  auto collation = builder.build().front();
  LinkResolver links(*collation, *site.resolver, site.config.link);

  EXPECT_EQ(links.link("/about.html", post), "../about.html");
  EXPECT_EQ(links.link("/feed.xml", post), "../feed.xml");

  try {
    links.link("/nowhere.html", post);
    FAIL() << "expected LinkNotFound";
  } catch (const KilnError &e) {
    EXPECT_EQ(e.kind(), ErrorKind::LinkNotFound);
    EXPECT_EQ(e.path(), post);
  }
}

TEST(LinkResolver, VerifyFindsDirectoryIndex) {
  SiteFixture site("name: Test\nlink:\n  verify: true\n");
  site.page("docs/index.md", "# Docs\n");
  fs::path post = site.page("posts/a.md", "# A\n");

  CollationBuilder builder(site.config, site.options, *site.resolver);
  auto collation = builder.build().front();
  LinkResolver links(*collation, *site.resolver, site.config.link);

  EXPECT_NO_THROW(links.link("/docs/", post));
  EXPECT_NO_THROW(links.link("/docs", post));
}
