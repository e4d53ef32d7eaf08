#include "pch.h"

#include "mono_bridge.h"

#include <memory>
#include <mutex>

#include "errors.h"
#include "host.h"
#include "log.h"
#include "native_api.h"

namespace monoattach {

namespace {
  std::mutex g_context_mutex;
  std::shared_ptr<RuntimeContext> g_context;

  // Null when no context exists; never throws.
  std::shared_ptr<RuntimeContext> TryContext() {
    std::lock_guard<std::mutex> lock(g_context_mutex);
    return g_context;
  }
}  // namespace

std::shared_ptr<RuntimeContext> MonoCreateContext(const BridgeConfig& cfg) {
  std::lock_guard<std::mutex> lock(g_context_mutex);
  if (g_context) throw BridgeError("Mono bridge context already exists");
  SetLogLevel(cfg.log_level);
  if (!cfg.log_path.empty()) SetLogPath(cfg.log_path);
  g_context = std::make_shared<RuntimeContext>(cfg, CreateMonoNativeApi(), DefaultProcessHost());
  AppendLogInternal(LogLevel::kInfo, "config", "Mono bridge context created");
  return g_context;
}

std::shared_ptr<RuntimeContext> MonoContext() {
  std::shared_ptr<RuntimeContext> context = TryContext();
  if (!context) {
    throw RuntimeNotReadyError(
      "Mono bridge context not created. Call MonoCreateContext() before using the bridge");
  }
  return context;
}

bool MonoHasContext() {
  std::lock_guard<std::mutex> lock(g_context_mutex);
  return g_context != nullptr;
}

void MonoDestroyContext() {
  std::shared_ptr<RuntimeContext> context;
  {
    std::lock_guard<std::mutex> lock(g_context_mutex);
    context.swap(g_context);
  }
  if (!context) return;
  // Callers still holding the context keep it alive; it is destroyed when
  // the last one lets go.
  context->Dispose();
  AppendLogInternal(LogLevel::kInfo, "config", "Mono bridge context destroyed");
}

std::shared_future<bool> MonoInitialize() {
  return MonoContext()->Initialize();
}

MonoThread* MonoEnsureThreadAttached() {
  return MonoContext()->EnsureThreadAttached();
}

bool MonoDetachIfExiting() {
  std::shared_ptr<RuntimeContext> context = TryContext();
  return context && context->DetachIfExiting();
}

void MonoDetachAllThreads() {
  if (std::shared_ptr<RuntimeContext> context = TryContext()) context->DetachAllThreads();
}

void MonoDispose() {
  if (std::shared_ptr<RuntimeContext> context = TryContext()) context->Dispose();
}

size_t MonoPumpTicks() {
  return DefaultProcessHost().PumpTicks();
}

void MonoShutdown() {
  DefaultProcessHost().Shutdown();
}

}  // namespace monoattach
