#include "config/Config.hpp"
#include "config/ConfigRegistry.hpp"
#include "TestEnv.hpp"

#include <gtest/gtest.h>

using namespace lnk::config;
using lnk::error::Kind;
using lnk::test::writeFile;

class ConfigTest : public lnk::test::LnkTest {
protected:
    Config saved;

    void SetUp() override {
        LnkTest::SetUp();
        saved = ConfigRegistry::get();
    }

    void TearDown() override {
        ConfigRegistry::init(saved);
        LnkTest::TearDown();
    }
};

TEST_F(ConfigTest, MissingFileYieldsDefaults) {
    const auto cfg = loadConfig(root / "nope.yaml");
    EXPECT_EQ(cfg.git.binary, "git");
    EXPECT_EQ(cfg.git.remote, "origin");
    EXPECT_EQ(cfg.git.default_branch, "main");
    EXPECT_EQ(cfg.git.long_timeout, std::chrono::seconds(300));
    EXPECT_EQ(cfg.add.progress_threshold, DEFAULT_PROGRESS_THRESHOLD);
    EXPECT_EQ(cfg.output.colors, ColorMode::Auto);
    EXPECT_TRUE(cfg.output.emoji);
    EXPECT_TRUE(cfg.logging.log_dir.empty());
    EXPECT_EQ(cfg.logging.levels.console_log_level, spdlog::level::warn);
}

TEST_F(ConfigTest, YamlOverridesDefaults) {
    const auto path = root / "config.yaml";
    writeFile(path, R"(
logging:
  console_level: debug
  levels:
    vcs: trace
git:
  remote: upstream
  short_timeout_seconds: 5
  sync_message: "lnk: nightly"
add:
  progress_threshold: 3
output:
  colors: never
  emoji: false
)");

    const auto cfg = loadConfig(path);
    EXPECT_EQ(cfg.logging.levels.console_log_level, spdlog::level::debug);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.vcs, spdlog::level::trace);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.fs, spdlog::level::info);
    EXPECT_EQ(cfg.git.remote, "upstream");
    EXPECT_EQ(cfg.git.binary, "git");
    EXPECT_EQ(cfg.git.short_timeout, std::chrono::seconds(5));
    EXPECT_EQ(cfg.git.sync_message, "lnk: nightly");
    EXPECT_EQ(cfg.add.progress_threshold, 3u);
    EXPECT_EQ(cfg.output.colors, ColorMode::Never);
    EXPECT_FALSE(cfg.output.emoji);
}

TEST_F(ConfigTest, EmptyFileYieldsDefaults) {
    writeFile(root / "empty.yaml", "");
    EXPECT_EQ(loadConfig(root / "empty.yaml").git.remote, "origin");
}

TEST_F(ConfigTest, MalformedYamlIsConfigError) {
    writeFile(root / "bad.yaml", "git: [unterminated\n");
    EXPECT_LNK_ERROR(loadConfig(root / "bad.yaml"), Kind::Config);

    writeFile(root / "list.yaml", "- a\n- b\n");
    EXPECT_LNK_ERROR(loadConfig(root / "list.yaml"), Kind::Config);

    writeFile(root / "colors.yaml", "output:\n  colors: sometimes\n");
    EXPECT_LNK_ERROR(loadConfig(root / "colors.yaml"), Kind::Config);
}

TEST_F(ConfigTest, ColorModeRoundTrip) {
    for (const auto mode : {ColorMode::Auto, ColorMode::Always, ColorMode::Never})
        EXPECT_EQ(parseColorMode(to_string(mode)), mode);
    EXPECT_LNK_ERROR(parseColorMode("rainbow"), Kind::Config);
}

TEST_F(ConfigTest, ProgressThresholdComesFromRegistry) {
    ConfigRegistry::mut().add.progress_threshold = 2;
    const auto lnk = initLnk();
    homeFile("few/a", "a");
    homeFile("few/b", "b");
    homeFile("few/c", "c");

    int calls = 0;
    lnk.addRecursive({home / "few"}, [&](std::size_t, std::size_t, const std::string&) { ++calls; });
    EXPECT_EQ(calls, 3);
}
