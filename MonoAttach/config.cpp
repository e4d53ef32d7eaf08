#include "pch.h"

#include "config.h"

#include <cstdlib>
#include <sstream>

#include "errors.h"

namespace monoattach {

namespace {
  std::string Trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return {};
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
  }

  bool ReadEnv(const char* name, std::string& out) {
#if defined(_WIN32)
    char* buf = nullptr;
    size_t sz = 0;
    if (_dupenv_s(&buf, &sz, name) != 0 || !buf) return false;
    out.assign(buf);
    free(buf);
#else
    const char* value = std::getenv(name);
    if (!value) return false;
    out.assign(value);
#endif
    out = Trim(out);
    return !out.empty();
  }

  int ParsePositiveInt(const char* name, const std::string& text) {
    char* end = nullptr;
    long v = std::strtol(text.c_str(), &end, 10);
    if (end == text.c_str() || *end != '\0' || v <= 0 || v > 24L * 60 * 60 * 1000) {
      throw ConfigError(std::string(name) + ": expected a positive millisecond count, got '" +
                        text + "'");
    }
    return static_cast<int>(v);
  }
}  // namespace

PerformMode ParsePerformMode(const std::string& text) {
  std::string t = Trim(text);
  if (t == "bind") return PerformMode::kBind;
  if (t == "free") return PerformMode::kFree;
  if (t == "leak") return PerformMode::kLeak;
  throw ConfigError("Unknown perform mode '" + text + "' (expected bind, free or leak)");
}

const char* PerformModeName(PerformMode mode) {
  switch (mode) {
    case PerformMode::kBind: return "bind";
    case PerformMode::kFree: return "free";
    case PerformMode::kLeak: return "leak";
  }
  return "unknown";
}

std::vector<std::string> SplitModuleNames(const std::string& text) {
  std::vector<std::string> names;
  std::istringstream iss(text);
  std::string item;
  while (std::getline(iss, item, ',')) {
    item = Trim(item);
    if (!item.empty()) names.push_back(item);
  }
  return names;
}

BridgeConfig LoadConfigFromEnvironment(const BridgeConfig& base) {
  BridgeConfig cfg = base;
  std::string value;
  if (ReadEnv("MONOATTACH_MODULE", value)) cfg.module_names = SplitModuleNames(value);
  if (ReadEnv("MONOATTACH_TIMEOUT_MS", value))
    cfg.initialize_timeout_ms = ParsePositiveInt("MONOATTACH_TIMEOUT_MS", value);
  if (ReadEnv("MONOATTACH_WARN_AFTER_MS", value))
    cfg.warn_after_ms = ParsePositiveInt("MONOATTACH_WARN_AFTER_MS", value);
  if (ReadEnv("MONOATTACH_POLL_MS", value))
    cfg.poll_interval_ms = ParsePositiveInt("MONOATTACH_POLL_MS", value);
  if (ReadEnv("MONOATTACH_PERFORM_MODE", value)) cfg.perform_mode = ParsePerformMode(value);
  if (ReadEnv("MONOATTACH_LOG_LEVEL", value)) {
    if (!ParseLogLevel(value, cfg.log_level)) {
      throw ConfigError("MONOATTACH_LOG_LEVEL: unknown level '" + value + "'");
    }
  }
  if (ReadEnv("MONOATTACH_LOG", value)) cfg.log_path = value;
  ValidateConfig(cfg);
  return cfg;
}

void ValidateConfig(const BridgeConfig& cfg) {
  if (cfg.initialize_timeout_ms <= 0) throw ConfigError("initialize_timeout_ms must be positive");
  if (cfg.poll_interval_ms <= 0) throw ConfigError("poll_interval_ms must be positive");
  if (cfg.warn_after_ms < 0) throw ConfigError("warn_after_ms must not be negative");
  if (cfg.warn_after_ms > cfg.initialize_timeout_ms) {
    throw ConfigError("warn_after_ms must not exceed initialize_timeout_ms");
  }
  for (const auto& name : cfg.module_names) {
    if (name.empty()) throw ConfigError("module_names must not contain empty names");
  }
}

}  // namespace monoattach
