#include "core/collation.hpp"
#include "core/walker.hpp"
#include "test_support.hpp"
#include "utils/errors.hpp"
#include <gtest/gtest.h>

namespace {

const char *LAYOUT = "<html><body>{{ content }}</body></html>";

ErrorKind build_error(const SiteFixture &site) {
  CollationBuilder builder(site.config, site.options, *site.resolver);
  try {
    builder.build();
  } catch (const KilnError &e) {
    return e.kind();
  }
  return ErrorKind::Build;
}

} // namespace

TEST(Collation, PagesAndFilesAreSeparated) {
  SiteFixture site;
  site.page("index.md", "# Home\n");
  fs::path about = site.page("about.md", "+++\ntitle: About Us\n+++\n# About\n");
  fs::path guide = site.page("getting-started.md", "# Guide\n");
  fs::path css = site.page("style.css", "body {}");
  fs::path layout = site.page("layouts/main.html", LAYOUT);
  site.page("partials/nav.html", "<nav></nav>");

  CollationBuilder builder(site.config, site.options, *site.resolver);
  auto collations = builder.build();
  ASSERT_EQ(collations.size(), 1u);
  const Collation &collation = *collations[0];

  EXPECT_EQ(collation.lang(), "en");
  EXPECT_EQ(collation.path(), site.options.target);
  EXPECT_EQ(collation.pages().size(), 3u);
  EXPECT_EQ(collation.targets().size(), 1u);

  for (const auto &source : collation.sources()) {
    bool is_page = collation.resolve(source) != nullptr;
    bool is_file = collation.get_resource(source) != nullptr;
    EXPECT_NE(is_page, is_file) << source;
  }

  ASSERT_NE(collation.resolve(about), nullptr);
  EXPECT_EQ(collation.resolve(about)->title, "About Us");
  EXPECT_EQ(collation.resolve(about)->href, "/about.html");
  EXPECT_EQ(collation.resolve(guide)->title, "Getting Started");
  EXPECT_EQ(collation.destination(css), fs::path("style.css"));
  EXPECT_EQ(collation.find_layout(about), layout);
  EXPECT_FALSE(collation.contains(site.source() / "layouts/main.html"));
  EXPECT_FALSE(collation.contains(site.source() / "partials/nav.html"));
}

TEST(Collation, LinksResolveBothWays) {
  SiteFixture site;
  fs::path index = site.page("index.md", "# Home\n");
  fs::path about = site.page("about.md", "# About\n");

  CollationBuilder builder(site.config, site.options, *site.resolver);
  auto collation = builder.build().front();

  EXPECT_EQ(collation->find_link("/"), index);
  EXPECT_EQ(collation->find_link("/about.html"), about);
  EXPECT_EQ(collation->get_href(about).value_or(""), "/about.html");
  EXPECT_FALSE(collation->find_link("/missing.html").has_value());
}

TEST(Collation, CleanUrlsUseDirectoryIndex) {
  SiteFixture site;
  site.load("release");
  fs::path about = site.page("about.md", "# About\n");

  CollationBuilder builder(site.config, site.options, *site.resolver);
  auto collation = builder.build().front();

  EXPECT_EQ(collation->resolve(about)->href, "/about/");
  EXPECT_EQ(collation->destination(about), fs::path("about/index.html"));
  EXPECT_EQ(collation->find_link("/about/"), about);
}

TEST(Collation, CollidingOutputsAreRejected) {
  SiteFixture site;
  site.page("page.md", "# Markdown\n");
  site.page("page.html", "<p>html</p>");
  EXPECT_EQ(build_error(site), ErrorKind::LinkCollision);
}

TEST(Collation, MissingNamedLayout) {
  SiteFixture site;
  site.page("layouts/main.html", LAYOUT);
  site.page("about.md", "+++\nlayout: missing.html\n+++\n# About\n");
  EXPECT_EQ(build_error(site), ErrorKind::NoLayout);
}

TEST(Collation, PagesTableMustNameFiles) {
  SiteFixture site("name: Test\npages:\n  ghost.md:\n    title: Ghost\n");
  EXPECT_EQ(build_error(site), ErrorKind::NoPageFile);
}

TEST(Collation, PagesTableOverridesDefaults) {
  SiteFixture site("name: Test\npage:\n  author: Site\n"
                   "pages:\n  about.md:\n    author: Page\n");
  fs::path about = site.page("about.md", "# About\n");
  fs::path other = site.page("other.md", "# Other\n");

  CollationBuilder builder(site.config, site.options, *site.resolver);
  auto collation = builder.build().front();

  EXPECT_EQ(collation->resolve(about)->data["author"], "Page");
  EXPECT_EQ(collation->resolve(other)->data["author"], "Site");
}

TEST(Collation, MenusResolveToHrefs) {
  SiteFixture site("name: Test\nmenus:\n  main: [index.md, about.md]\n");
  site.page("index.md", "# Home\n");
  site.page("about.md", "# About\n");

  CollationBuilder builder(site.config, site.options, *site.resolver);
  auto collation = builder.build().front();

  nlohmann::json menus = collation->menu_hrefs();
  ASSERT_EQ(menus["main"].size(), 2u);
  EXPECT_EQ(menus["main"][0], "/");
  EXPECT_EQ(menus["main"][1], "/about.html");
}

TEST(Collation, MenuWithMissingPage) {
  SiteFixture site("name: Test\nmenus:\n  main: [nowhere.md]\n");
  site.page("index.md", "# Home\n");
  EXPECT_EQ(build_error(site), ErrorKind::NoMenuPage);
}

TEST(Collation, PermalinksAreCollected) {
  SiteFixture site;
  site.page("about.md", "+++\npermalink: /company/\n+++\n# About\n");

  CollationBuilder builder(site.config, site.options, *site.resolver);
  auto collation = builder.build().front();

  ASSERT_EQ(collation->permalinks().count("/company/"), 1u);
  EXPECT_EQ(collation->permalinks().at("/company/"), "/about.html");
}

TEST(Collation, DuplicatePermalink) {
  SiteFixture site;
  site.page("a.md", "+++\npermalink: /same/\n+++\n# A\n");
  site.page("b.md", "+++\npermalink: /same/\n+++\n# B\n");
  EXPECT_EQ(build_error(site), ErrorKind::DuplicatePermalink);
}

TEST(Collation, AllowListRegistersSyntheticHrefs) {
  SiteFixture site("name: Test\nlink:\n  allow: [feed.xml]\n");
  site.page("index.md", "# Home\n");

  CollationBuilder builder(site.config, site.options, *site.resolver);
  auto collation = builder.build().front();
  EXPECT_TRUE(collation->is_allowed("/feed.xml"));
}

TEST(Collation, LocaleVariants) {
  SiteFixture site("name: Test\nlocales: [en, fr]\n");
  fs::path index = site.page("index.md", "+++\nsummary: Welcome\n+++\n# Home\n");
  fs::path about = site.page("about.md", "+++\ntitle: About\n+++\n# About\n");
  fs::path about_fr =
      site.page("about.fr.md", "+++\ntitle: A propos\n+++\n# A propos\n");

  CollationBuilder builder(site.config, site.options, *site.resolver);
  auto collations = builder.build();
  ASSERT_EQ(collations.size(), 2u);

  const Collation &en = *collations[0];
  const Collation &fr = *collations[1];
  EXPECT_EQ(en.lang(), "en");
  EXPECT_EQ(fr.lang(), "fr");
  EXPECT_EQ(en.path(), site.options.target / "en");
  EXPECT_EQ(fr.path(), site.options.target / "fr");

  EXPECT_TRUE(en.contains(about));
  EXPECT_FALSE(en.contains(about_fr));

  EXPECT_TRUE(fr.contains(about_fr));
  EXPECT_FALSE(fr.contains(about));
  EXPECT_EQ(fr.resolve(about_fr)->title, "A propos");
  EXPECT_EQ(fr.resolve(about_fr)->lang, "fr");
  EXPECT_EQ(fr.destination(about_fr), fs::path("about.html"));

  // Untranslated pages fall back to the default locale.
  ASSERT_TRUE(fr.contains(index));
  EXPECT_EQ(fr.resolve(index)->data["summary"], "Welcome");
}

TEST(Collation, UpsertAndRemove) {
  SiteFixture site;
  site.page("index.md", "# Home\n");

  CollationBuilder builder(site.config, site.options, *site.resolver);
  auto collation = builder.build().front();

  fs::path added = site.page("news.md", "# News\n");
  EXPECT_TRUE(builder.upsert(*collation, added));
  EXPECT_TRUE(collation->contains(added));
  EXPECT_EQ(collation->find_link("/news.html"), added);

  EXPECT_TRUE(collation->remove(added));
  EXPECT_FALSE(collation->contains(added));
  EXPECT_FALSE(collation->find_link("/news.html").has_value());

  fs::path partial = site.page("partials/footer.html", "<footer/>");
  EXPECT_FALSE(builder.upsert(*collation, partial));
}

TEST(Collation, UpsertRefreshesPermalinksAndMenus) {
  SiteFixture site("name: Test\nmenus:\n  main: [about.md]\n");
  fs::path about =
      site.page("about.md", "+++\npermalink: /company/\n+++\n# About\n");

  CollationBuilder builder(site.config, site.options, *site.resolver);
  auto collation = builder.build().front();
  ASSERT_EQ(collation->permalinks().count("/company/"), 1u);

  site.page("about.md", "+++\npermalink: /team/\n+++\n# About\n");
  EXPECT_TRUE(builder.upsert(*collation, about));
  EXPECT_EQ(collation->permalinks().count("/company/"), 0u);
  EXPECT_EQ(collation->permalinks().at("/team/"), "/about.html");
  EXPECT_EQ(collation->menu_hrefs()["main"][0], "/about.html");

  fs::path other =
      site.page("other.md", "+++\npermalink: /team/\n+++\n# Other\n");
  try {
    builder.upsert(*collation, other);
    FAIL() << "expected DuplicatePermalink";
  } catch (const KilnError &e) {
    EXPECT_EQ(e.kind(), ErrorKind::DuplicatePermalink);
  }
}

TEST(Collation, IgnoreFileExcludesEntries) {
  SiteFixture site;
  site.page(DirectoryWalker::IGNORE_FILE, "drafts\n");
  site.page("index.md", "# Home\n");
  fs::path draft = site.page("drafts/wip.md", "# WIP\n");

  CollationBuilder builder(site.config, site.options, *site.resolver);
  auto collation = builder.build().front();
  EXPECT_FALSE(collation->contains(draft));
}
