#include "core/renderer.hpp"
#include "test_support.hpp"
#include "utils/errors.hpp"
#include "utils/files.hpp"
#include <gtest/gtest.h>

namespace {

// Substitutes {{ title }} and {{ content }} only.
class StubEngine : public TemplateEngine {
public:
  std::string render(const fs::path &template_path,
                     const json &data) const override {
    std::string text = read_file(template_path);
    replace(text, "{{ title }}", data["page"]["title"].get<std::string>());
    if (data.contains("content")) {
      replace(text, "{{ content }}", data["content"].get<std::string>());
    }
    return text;
  }

private:
  static void replace(std::string &text, const std::string &from,
                      const std::string &to) {
    for (auto pos = text.find(from); pos != std::string::npos;
         pos = text.find(from, pos + to.size())) {
      text.replace(pos, from.size(), to);
    }
  }
};

struct RenderFixture {
  SiteFixture site;
  StubEngine engine;

  explicit RenderFixture(const std::string &yaml = "name: Test\n")
      : site(yaml) {
    site.page("layouts/main.html", "<main>{{ content }}</main>");
  }

  std::shared_ptr<Collation> collate() const {
    CollationBuilder builder(site.config, site.options, *site.resolver);
    return builder.build().front();
  }
};

} // namespace

TEST(Renderer, PageIsWrappedInLayout) {
  RenderFixture fx;
  fs::path about = fx.site.page("about.html", "<p>{{ title }}</p>");
  auto collation = fx.collate();

  Renderer renderer(*collation, fx.engine, RenderSettings{});
  RenderOutcome outcome = renderer.render(about);

  EXPECT_EQ(outcome.action, RenderOutcome::Action::Rendered);
  EXPECT_EQ(outcome.href, "/about.html");
  EXPECT_EQ(outcome.output, collation->path() / "about.html");
  EXPECT_EQ(read_file(outcome.output), "<main><p>About</p></main>");
}

TEST(Renderer, StandalonePageSkipsLayout) {
  RenderFixture fx;
  fs::path page = fx.site.page(
      "bare.html", "<!--\nlayout: false\n-->\n<p>{{ title }}</p>");
  auto collation = fx.collate();

  Renderer renderer(*collation, fx.engine, RenderSettings{});
  RenderOutcome outcome = renderer.render(page);

  std::string html = read_file(outcome.output);
  EXPECT_EQ(html.find("<main>"), std::string::npos);
  EXPECT_NE(html.find("<p>Bare</p>"), std::string::npos);
}

TEST(Renderer, DraftsAreSkippedInRelease) {
  RenderFixture fx;
  fx.site.load("release");
  fs::path draft =
      fx.site.page("wip.html", "<!--\ndraft: true\n-->\n<p>{{ title }}</p>");
  auto collation = fx.collate();

  RenderSettings settings;
  settings.release = true;
  Renderer renderer(*collation, fx.engine, settings);
  RenderOutcome outcome = renderer.render(draft);

  EXPECT_EQ(outcome.action, RenderOutcome::Action::Skipped);
  EXPECT_FALSE(fs::exists(outcome.output));
}

TEST(Renderer, DraftsRenderOutsideRelease) {
  RenderFixture fx;
  fs::path draft =
      fx.site.page("wip.html", "<!--\ndraft: true\n-->\n<p>{{ title }}</p>");
  auto collation = fx.collate();

  Renderer renderer(*collation, fx.engine, RenderSettings{});
  RenderOutcome outcome = renderer.render(draft);

  EXPECT_EQ(outcome.action, RenderOutcome::Action::Rendered);
  EXPECT_TRUE(fs::exists(outcome.output));
}

TEST(Renderer, RenderFalseCopiesVerbatim) {
  RenderFixture fx;
  std::string source = "+++\nrender: false\n+++\n# {{ title }}\n";
  fs::path raw = fx.site.page("raw.md", source);
  auto collation = fx.collate();

  Renderer renderer(*collation, fx.engine, RenderSettings{});
  RenderOutcome outcome = renderer.render(raw);

  EXPECT_EQ(outcome.action, RenderOutcome::Action::Copied);
  EXPECT_EQ(outcome.output, collation->path() / "raw.md");
  EXPECT_EQ(read_file(outcome.output), source);
}

TEST(Renderer, StaticFilesAreCopied) {
  RenderFixture fx;
  fs::path css = fx.site.page("css/site.css", "body { color: red; }");
  auto collation = fx.collate();

  Renderer renderer(*collation, fx.engine, RenderSettings{});
  RenderOutcome outcome = renderer.render(css);

  EXPECT_EQ(outcome.action, RenderOutcome::Action::Copied);
  EXPECT_EQ(read_file(collation->path() / "css/site.css"),
            "body { color: red; }");
}

TEST(Renderer, TransformsAndExtractsText) {
  RenderFixture fx;
  fs::path page = fx.site.page(
      "guide.html", "<h2>Getting Started</h2><p>Install the tool first.</p>");
  auto collation = fx.collate();

  RenderSettings settings;
  settings.transform.auto_id = true;
  settings.extract_text = true;
  Renderer renderer(*collation, fx.engine, settings);
  RenderOutcome outcome = renderer.render(page);

  EXPECT_NE(read_file(outcome.output).find("id=\"getting-started\""),
            std::string::npos);
  ASSERT_TRUE(outcome.text.has_value());
  EXPECT_GT(outcome.text->words, 0u);
}

TEST(Renderer, UnknownSourceThrows) {
  RenderFixture fx;
  auto collation = fx.collate();
  Renderer renderer(*collation, fx.engine, RenderSettings{});
  try {
    renderer.render(fx.site.source() / "ghost.md");
    FAIL() << "expected Build error";
  } catch (const KilnError &e) {
    EXPECT_EQ(e.kind(), ErrorKind::Build);
  }
}

TEST(Renderer, PageDataCarriesSiteAndMenus) {
  RenderFixture fx("name: Test\nmenus:\n  main: [about.html]\n");
  fs::path about = fx.site.page("about.html", "<p></p>");
  auto collation = fx.collate();

  RenderSettings settings;
  settings.site = {{"name", "Test"}};
  settings.version = "1.2.3";
  Renderer renderer(*collation, fx.engine, settings);

  nlohmann::json data = renderer.page_data(*collation->resolve(about));
  EXPECT_EQ(data["site"]["name"], "Test");
  EXPECT_EQ(data["menus"]["main"][0], "/about.html");
  EXPECT_EQ(data["page"]["href"], "/about.html");
  EXPECT_EQ(data["lang"], "en");
  EXPECT_EQ(data["version"], "1.2.3");
}

TEST(InjaTemplateEngine, MarkdownRunsAfterTemplate) {
  SiteFixture site;
  fs::path page =
      site.page("hello.md", "+++\ntitle: Hello\n+++\n# {{ page.title }}\n");

  InjaTemplateEngine engine(site.source(), site.config.types);
  nlohmann::json data = {{"page", {{"title", "Hello"}}}};
  std::string html = engine.render(page, data);
  EXPECT_NE(html.find("<h1>Hello</h1>"), std::string::npos);
}

TEST(InjaTemplateEngine, LinkHelperUsesCallback) {
  SiteFixture site;
  fs::path page = site.page("a.html", "<a href=\"{{ link(\"/b.html\") }}\">b</a>");

  InjaTemplateEngine engine(
      site.source(), site.config.types,
      [](const std::string &href, const fs::path &) { return "." + href; });
  std::string html = engine.render(page, nlohmann::json::object());
  EXPECT_EQ(html, "<a href=\"./b.html\">b</a>\n");
}

TEST(InjaTemplateEngine, MissingVariableDoesNotThrow) {
  SiteFixture site;
  fs::path page = site.page("a.html", "<p>{{ page.subtitle }}</p>");

  InjaTemplateEngine engine(site.source(), site.config.types);
  nlohmann::json data = {{"page", {{"title", "A"}}}};
  EXPECT_NO_THROW(engine.render(page, data));
}

TEST(InjaTemplateEngine, WordHelpersEmitPlaceholders) {
  SiteFixture site;
  fs::path page =
      site.page("a.html", "{{ words() }}|{{ reading_time(200) }}");

  InjaTemplateEngine engine(site.source(), site.config.types);
  std::string html = engine.render(page, nlohmann::json::object());
  EXPECT_EQ(html, "<words />|<words data-avg=\"200\" />\n");
}

TEST(InjaTemplateEngine, ReadingTimeRejectsLowAverage) {
  SiteFixture site;
  fs::path page = site.page("a.html", "{{ reading_time(10) }}");

  InjaTemplateEngine engine(site.source(), site.config.types);
  try {
    engine.render(page, nlohmann::json::object());
    FAIL() << "expected Template error";
  } catch (const KilnError &e) {
    EXPECT_EQ(e.kind(), ErrorKind::Template);
  }
}
