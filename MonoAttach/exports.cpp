#include "pch.h"

#include <mutex>
#include <string>

#include "config.h"
#include "errors.h"
#include "log.h"
#include "mono_bridge.h"

#if defined(_WIN32)
#define MONOATTACH_EXPORT extern "C" __declspec(dllexport)
#else
#define MONOATTACH_EXPORT extern "C" __attribute__((visibility("default")))
#endif

// C entry points for the controlling process. Every call returns 0 on
// success and -1 on failure; monoattach_last_error() explains the failure.

namespace {
  std::mutex g_last_error_mutex;
  std::string g_last_error;

  void RecordLastError(const std::string& message) {
    std::lock_guard<std::mutex> lock(g_last_error_mutex);
    g_last_error = message;
  }

  int Fail(const char* where, const std::exception& e) {
    std::string message = std::string(where) + ": " + e.what();
    RecordLastError(message);
    monoattach::AppendLogInternal(monoattach::LogLevel::kError, "export", message);
    return -1;
  }
}  // namespace

// Creates the process context from MONOATTACH_* environment settings.
MONOATTACH_EXPORT int monoattach_start() {
  try {
    if (monoattach::MonoHasContext()) return 0;
    monoattach::MonoCreateContext(monoattach::LoadConfigFromEnvironment());
    return 0;
  }
  catch (const std::exception& e) {
    return Fail("monoattach_start", e);
  }
}

// 1 if this call initialized the runtime, 0 if it was ready already.
MONOATTACH_EXPORT int monoattach_initialize() {
  try {
    monoattach::MonoPumpTicks();
    return monoattach::MonoInitialize().get() ? 1 : 0;
  }
  catch (const std::exception& e) {
    return Fail("monoattach_initialize", e);
  }
}

MONOATTACH_EXPORT int monoattach_detach_if_exiting() {
  try {
    return monoattach::MonoDetachIfExiting() ? 1 : 0;
  }
  catch (const std::exception& e) {
    return Fail("monoattach_detach_if_exiting", e);
  }
}

MONOATTACH_EXPORT int monoattach_pump_ticks() {
  try {
    return static_cast<int>(monoattach::MonoPumpTicks());
  }
  catch (const std::exception& e) {
    return Fail("monoattach_pump_ticks", e);
  }
}

MONOATTACH_EXPORT int monoattach_dispose() {
  try {
    monoattach::MonoDestroyContext();
    return 0;
  }
  catch (const std::exception& e) {
    return Fail("monoattach_dispose", e);
  }
}

// Copy of the last failure message; valid until the next failing call.
MONOATTACH_EXPORT const char* monoattach_last_error() {
  static thread_local std::string copy;
  std::lock_guard<std::mutex> lock(g_last_error_mutex);
  copy = g_last_error;
  return copy.c_str();
}
