#pragma once

#include <string>
#include <vector>

#include "log.h"

namespace monoattach {

// Thread detachment behavior applied by Perform() after the callback settles.
//   kBind: keep the thread attached until the unload hook runs (default)
//   kFree: detach if this Perform() call attached the thread
//   kLeak: never detach; the caller owns the thread's attachment
enum class PerformMode : int { kBind = 0, kFree = 1, kLeak = 2 };

PerformMode ParsePerformMode(const std::string& text);
const char* PerformModeName(PerformMode mode);

namespace config {
  constexpr int kInitializeTimeoutMs = 30000;
  constexpr int kWarnAfterMs = 10000;
  constexpr int kPollIntervalMs = 50;
  constexpr PerformMode kPerformMode = PerformMode::kBind;
  constexpr LogLevel kLogLevel = LogLevel::kInfo;

  // Exports that identify a Mono runtime module when no name matches.
  constexpr const char* kMarkerExports[] = {
      "mono_runtime_invoke",
      "mono_thread_attach",
      "mono_get_root_domain",
  };
}  // namespace config

struct BridgeConfig {
  // Candidate module names, first match wins. Empty means auto-detect.
  std::vector<std::string> module_names;
  int initialize_timeout_ms = config::kInitializeTimeoutMs;
  int warn_after_ms = config::kWarnAfterMs;
  int poll_interval_ms = config::kPollIntervalMs;
  PerformMode perform_mode = config::kPerformMode;
  LogLevel log_level = config::kLogLevel;
  std::string log_path;
};

// Applies MONOATTACH_* environment overrides on top of |base|.
// Throws ConfigError on malformed values.
BridgeConfig LoadConfigFromEnvironment(const BridgeConfig& base = BridgeConfig());

void ValidateConfig(const BridgeConfig& cfg);

std::vector<std::string> SplitModuleNames(const std::string& text);

}  // namespace monoattach
