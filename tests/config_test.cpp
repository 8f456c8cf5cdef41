#include "dagrun/config/config.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

using namespace dagrun;
using dagrun::test::ScopedEnv;

namespace {

// Clears every override so the host environment cannot leak into a test.
struct CleanEnv {
  ScopedEnv level{"DAGRUN_LOG_LEVEL", std::nullopt};
  ScopedEnv file{"DAGRUN_LOG_FILE", std::nullopt};
  ScopedEnv root{"DAGRUN_WORKSPACE_ROOT", std::nullopt};
  ScopedEnv poll{"DAGRUN_FOLLOW_POLL_MS", std::nullopt};
  ScopedEnv gates{"DAGRUN_GATE_THREADS", std::nullopt};
};

} // namespace

TEST(ConfigTest, EngineDefaults) {
  EngineConfig cfg;
  EXPECT_EQ(cfg.log_level, "warn");
  EXPECT_TRUE(cfg.log_file.empty());
  EXPECT_TRUE(cfg.workspace_root.empty());
  EXPECT_EQ(cfg.workspace_prefix, "dagrun");
  EXPECT_EQ(cfg.follow_poll_interval_ms, 20);
  EXPECT_EQ(cfg.gate_threads, 2);
  EXPECT_EQ(cfg.follow_poll_interval(), std::chrono::milliseconds(20));
}

TEST(ConfigTest, LoadFromTomlString) {
  CleanEnv env;
  std::string toml = R"(
[engine]
log_level = "debug"
workspace_root = "/var/tmp"
workspace_prefix = "ci"
follow_poll_interval_ms = 5
gate_threads = 4
)";

  auto result = ConfigLoader::load_from_string(toml);
  ASSERT_TRUE(result.has_value()) << result.error().message();
  EXPECT_EQ(result->log_level, "debug");
  EXPECT_EQ(result->workspace_root, "/var/tmp");
  EXPECT_EQ(result->workspace_prefix, "ci");
  EXPECT_EQ(result->follow_poll_interval_ms, 5);
  EXPECT_EQ(result->gate_threads, 4);
}

TEST(ConfigTest, MissingTableKeepsDefaults) {
  CleanEnv env;
  auto result = ConfigLoader::load_from_string("");
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(*result, EngineConfig{});
}

TEST(ConfigTest, UnknownKeysAreIgnored) {
  CleanEnv env;
  auto result = ConfigLoader::load_from_string(R"(
[engine]
gate_threads = 3
future_option = true
)");
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->gate_threads, 3);
}

TEST(ConfigTest, EnvironmentOverridesFile) {
  CleanEnv env;
  ScopedEnv level("DAGRUN_LOG_LEVEL", "trace");
  ScopedEnv poll("DAGRUN_FOLLOW_POLL_MS", "50");
  ScopedEnv gates("DAGRUN_GATE_THREADS", "8");

  auto result = ConfigLoader::load_from_string(R"(
[engine]
log_level = "error"
follow_poll_interval_ms = 10
)");
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->log_level, "trace");
  EXPECT_EQ(result->follow_poll_interval_ms, 50);
  EXPECT_EQ(result->gate_threads, 8);
}

TEST(ConfigTest, FromEnvironmentWithoutFile) {
  CleanEnv env;
  ScopedEnv root("DAGRUN_WORKSPACE_ROOT", "/scratch");
  auto result = ConfigLoader::from_environment();
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->workspace_root, "/scratch");
  EXPECT_EQ(result->gate_threads, 2);
}

TEST(ConfigTest, NonNumericOverrideIsAParseError) {
  CleanEnv env;
  ScopedEnv gates("DAGRUN_GATE_THREADS", "many");
  std::string diagnostic;
  auto result = ConfigLoader::from_environment(&diagnostic);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::ParseError));
  EXPECT_FALSE(diagnostic.empty());
}

TEST(ConfigTest, RejectsOutOfRangeValues) {
  CleanEnv env;
  EXPECT_FALSE(ConfigLoader::load_from_string(
                   "[engine]\nfollow_poll_interval_ms = 0\n")
                   .has_value());
  EXPECT_FALSE(
      ConfigLoader::load_from_string("[engine]\ngate_threads = -1\n")
          .has_value());
  EXPECT_FALSE(
      ConfigLoader::load_from_string("[engine]\nlog_level = \"loud\"\n")
          .has_value());
  EXPECT_FALSE(ConfigLoader::load_from_string(
                   "[engine]\nworkspace_prefix = \"a/b\"\n")
                   .has_value());
}

TEST(ConfigTest, MalformedTomlIsAParseError) {
  CleanEnv env;
  std::string diagnostic;
  auto result =
      ConfigLoader::load_from_string("[engine\ngate_threads = ", &diagnostic);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::ParseError));
}

TEST(ConfigTest, MissingFile) {
  auto result = ConfigLoader::load_from_file("/nonexistent/dagrun.toml");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::FileNotFound));
}
