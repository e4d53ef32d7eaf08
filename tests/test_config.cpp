// File: tests/test_config.cpp
// Purpose: Perform-mode parsing, environment overrides and config validation.

#include <gtest/gtest.h>

#include <cstdlib>
#include <string>

#include "config.h"
#include "errors.h"
#include "log.h"

using namespace monoattach;

namespace {

void SetEnv(const char* name, const char* value) {
#if defined(_WIN32)
  _putenv_s(name, value);
#else
  setenv(name, value, 1);
#endif
}

void UnsetEnv(const char* name) {
#if defined(_WIN32)
  _putenv_s(name, "");
#else
  unsetenv(name);
#endif
}

const char* const kAllVars[] = {
    "MONOATTACH_MODULE",       "MONOATTACH_TIMEOUT_MS",   "MONOATTACH_WARN_AFTER_MS",
    "MONOATTACH_POLL_MS",      "MONOATTACH_PERFORM_MODE", "MONOATTACH_LOG_LEVEL",
    "MONOATTACH_LOG",
};

class ConfigEnvTest : public ::testing::Test {
 protected:
  void SetUp() override {
    SetLogFileEnabled(false);
    for (const char* name : kAllVars) UnsetEnv(name);
  }
  void TearDown() override {
    for (const char* name : kAllVars) UnsetEnv(name);
  }
};

}  // namespace

TEST(PerformModeTest, ParsesKnownNames) {
  EXPECT_EQ(ParsePerformMode("bind"), PerformMode::kBind);
  EXPECT_EQ(ParsePerformMode("free"), PerformMode::kFree);
  EXPECT_EQ(ParsePerformMode(" leak "), PerformMode::kLeak);
  EXPECT_STREQ(PerformModeName(PerformMode::kFree), "free");
}

TEST(PerformModeTest, RejectsUnknownName) {
  EXPECT_THROW(ParsePerformMode("detach"), ConfigError);
  EXPECT_THROW(ParsePerformMode(""), ConfigError);
}

TEST(ConfigTest, DefaultsMatchConstants) {
  BridgeConfig cfg;
  EXPECT_TRUE(cfg.module_names.empty());
  EXPECT_EQ(cfg.initialize_timeout_ms, config::kInitializeTimeoutMs);
  EXPECT_EQ(cfg.warn_after_ms, config::kWarnAfterMs);
  EXPECT_EQ(cfg.poll_interval_ms, config::kPollIntervalMs);
  EXPECT_EQ(cfg.perform_mode, PerformMode::kBind);
  EXPECT_NO_THROW(ValidateConfig(cfg));
}

TEST(ConfigTest, SplitModuleNamesTrimsAndDropsEmpty) {
  auto names = SplitModuleNames(" mono-2.0-bdwgc.dll, ,libmonosgen-2.0.so ,");
  ASSERT_EQ(names.size(), 2u);
  EXPECT_EQ(names[0], "mono-2.0-bdwgc.dll");
  EXPECT_EQ(names[1], "libmonosgen-2.0.so");
}

TEST(ConfigTest, ValidateRejectsBadTimings) {
  BridgeConfig cfg;
  cfg.initialize_timeout_ms = 0;
  EXPECT_THROW(ValidateConfig(cfg), ConfigError);

  cfg = BridgeConfig();
  cfg.poll_interval_ms = -1;
  EXPECT_THROW(ValidateConfig(cfg), ConfigError);

  cfg = BridgeConfig();
  cfg.warn_after_ms = cfg.initialize_timeout_ms + 1;
  EXPECT_THROW(ValidateConfig(cfg), ConfigError);

  cfg = BridgeConfig();
  cfg.module_names = {"mono.dll", ""};
  EXPECT_THROW(ValidateConfig(cfg), ConfigError);
}

TEST_F(ConfigEnvTest, EmptyEnvironmentKeepsBase) {
  BridgeConfig base;
  base.module_names = {"mono.dll"};
  BridgeConfig cfg = LoadConfigFromEnvironment(base);
  ASSERT_EQ(cfg.module_names.size(), 1u);
  EXPECT_EQ(cfg.module_names[0], "mono.dll");
  EXPECT_EQ(cfg.initialize_timeout_ms, config::kInitializeTimeoutMs);
}

TEST_F(ConfigEnvTest, AppliesOverrides) {
  SetEnv("MONOATTACH_MODULE", "libmono-2.0.so,libmonosgen-2.0.so");
  SetEnv("MONOATTACH_TIMEOUT_MS", "2000");
  SetEnv("MONOATTACH_WARN_AFTER_MS", "500");
  SetEnv("MONOATTACH_POLL_MS", "10");
  SetEnv("MONOATTACH_PERFORM_MODE", "free");
  SetEnv("MONOATTACH_LOG_LEVEL", "debug");
  SetEnv("MONOATTACH_LOG", "/tmp/monoattach-test.log");

  BridgeConfig cfg = LoadConfigFromEnvironment();
  ASSERT_EQ(cfg.module_names.size(), 2u);
  EXPECT_EQ(cfg.module_names[1], "libmonosgen-2.0.so");
  EXPECT_EQ(cfg.initialize_timeout_ms, 2000);
  EXPECT_EQ(cfg.warn_after_ms, 500);
  EXPECT_EQ(cfg.poll_interval_ms, 10);
  EXPECT_EQ(cfg.perform_mode, PerformMode::kFree);
  EXPECT_EQ(cfg.log_level, LogLevel::kDebug);
  EXPECT_EQ(cfg.log_path, "/tmp/monoattach-test.log");
}

TEST_F(ConfigEnvTest, RejectsMalformedNumbers) {
  SetEnv("MONOATTACH_TIMEOUT_MS", "soon");
  EXPECT_THROW(LoadConfigFromEnvironment(), ConfigError);

  SetEnv("MONOATTACH_TIMEOUT_MS", "-5");
  EXPECT_THROW(LoadConfigFromEnvironment(), ConfigError);
}

TEST_F(ConfigEnvTest, RejectsUnknownLogLevel) {
  SetEnv("MONOATTACH_LOG_LEVEL", "verbose");
  EXPECT_THROW(LoadConfigFromEnvironment(), ConfigError);
}

TEST_F(ConfigEnvTest, RejectsWarnBeyondTimeout) {
  SetEnv("MONOATTACH_TIMEOUT_MS", "100");
  SetEnv("MONOATTACH_WARN_AFTER_MS", "200");
  EXPECT_THROW(LoadConfigFromEnvironment(), ConfigError);
}
