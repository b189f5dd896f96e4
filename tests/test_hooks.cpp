#include "core/hooks.hpp"
#include "test_support.hpp"
#include "utils/errors.hpp"
#include "utils/files.hpp"
#include <gtest/gtest.h>

namespace {

const char *HOOKS = R"(name: Test
hooks:
  - name: styles
    path: ./scripts/styles.sh
    profiles: [release]
  - name: prepare
    path: /bin/true
  - name: notify
    path: /bin/true
    after: true
)";

std::vector<std::string> names(const std::vector<const HookConfig *> &hooks) {
  std::vector<std::string> result;
  for (const HookConfig *hook : hooks) {
    result.push_back(hook->name);
  }
  return result;
}

HookConfig command(const std::string &path) {
  HookConfig hook;
  hook.name = "test";
  hook.path = path;
  return hook;
}

} // namespace

TEST(HookRunner, CollectsByPhaseAndProfile) {
  SiteFixture site(HOOKS);

  HookRunner debug(site.config, site.options);
  EXPECT_EQ(names(debug.collect(HookPhase::Before)),
            std::vector<std::string>({"prepare"}));
  EXPECT_EQ(names(debug.collect(HookPhase::After)),
            std::vector<std::string>({"notify"}));

  site.load("release");
  HookRunner release(site.config, site.options);
  EXPECT_EQ(names(release.collect(HookPhase::Before)),
            std::vector<std::string>({"styles", "prepare"}));
}

TEST(HookRunner, CommandPath) {
  SiteFixture site;
  HookRunner runner(site.config, site.options);
  EXPECT_EQ(runner.command_path(command("./scripts/run.sh")),
            (site.root() / "scripts/run.sh").lexically_normal());
  EXPECT_EQ(runner.command_path(command("npx")), fs::path("npx"));
}

TEST(HookRunner, Environment) {
  SiteFixture site;
  HookRunner debug(site.config, site.options);
  auto env = debug.environment();
  EXPECT_EQ(env["NODE_ENV"], "development");
  EXPECT_EQ(env["BUILD_SOURCE"], "site");
  EXPECT_EQ(env["BUILD_TARGET"], "build/debug");
  EXPECT_FALSE(env["PROJECT_ROOT"].empty());

  site.load("release");
  HookRunner release(site.config, site.options);
  EXPECT_EQ(release.environment()["NODE_ENV"], "production");
}

TEST(HookRunner, ScriptRunsInProjectRoot) {
  SiteFixture site;
  fs::path script = site.dir.write(
      "scripts/env.sh", "#!/bin/sh\necho \"$NODE_ENV $BUILD_TARGET\" > hook.out\n");
  fs::permissions(script, fs::perms::owner_all, fs::perm_options::add);

  HookRunner runner(site.config, site.options);
  runner.exec(command("./scripts/env.sh"));
  EXPECT_EQ(read_file(site.root() / "hook.out"), "development build/debug\n");
}

TEST(HookRunner, NonZeroExitFails) {
  SiteFixture site;
  HookRunner runner(site.config, site.options);
  try {
    runner.exec(command("/bin/false"));
    FAIL() << "expected Hook error";
  } catch (const KilnError &e) {
    EXPECT_EQ(e.kind(), ErrorKind::Hook);
  }
}

TEST(HookRunner, MissingCommandFails) {
  SiteFixture site;
  HookRunner runner(site.config, site.options);
  try {
    runner.exec(command("./scripts/absent.sh"));
    FAIL() << "expected Hook error";
  } catch (const KilnError &e) {
    EXPECT_EQ(e.kind(), ErrorKind::Hook);
  }
}

TEST(HookRunner, RunStopsAtFirstFailure) {
  SiteFixture site(R"(name: Test
hooks:
  - name: broken
    path: /bin/false
  - name: marker
    path: /bin/touch
    args: [marker.txt]
)");
  HookRunner runner(site.config, site.options);
  EXPECT_THROW(runner.run(HookPhase::Before), KilnError);
  EXPECT_FALSE(fs::exists(site.root() / "marker.txt"));
}
