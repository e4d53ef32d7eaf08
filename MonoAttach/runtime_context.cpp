#include "pch.h"

#include "runtime_context.h"

#include <sstream>
#include <utility>

#include "errors.h"
#include "log.h"

namespace monoattach {

namespace {
  BridgeConfig Validated(BridgeConfig cfg) {
    ValidateConfig(cfg);
    return cfg;
  }
}  // namespace

RuntimeContext::RuntimeContext(BridgeConfig cfg, std::unique_ptr<NativeRuntimeApi> api,
                               HostEnvironment& host)
  : config_(Validated(std::move(cfg))),
    api_(std::move(api)),
    host_(host),
    locator_(*api_, config_.poll_interval_ms),
    gate_(*api_, locator_, config_),
    threads_(*api_, gate_),
    unload_hook_(host_, [this]() { Dispose(); }),
    scheduler_(gate_, threads_, unload_hook_, host_, config_.perform_mode) {
  std::ostringstream oss;
  oss << "Context created: timeout=" << config_.initialize_timeout_ms
      << "ms warn_after=" << config_.warn_after_ms
      << "ms poll=" << config_.poll_interval_ms
      << "ms mode=" << PerformModeName(config_.perform_mode)
      << " modules=" << config_.module_names.size();
  AppendLogInternal(LogLevel::kDebug, "config", oss.str());
}

RuntimeContext::~RuntimeContext() = default;

std::shared_future<bool> RuntimeContext::Initialize() {
  return gate_.Initialize();
}

MonoThread* RuntimeContext::EnsureThreadAttached() {
  if (!gate_.IsReady()) {
    // Handle() carries the descriptive not-ready message.
    gate_.Handle();
  }
  return threads_.EnsureAttached().handle;
}

bool RuntimeContext::DetachIfExiting() {
  if (!gate_.IsReady()) return false;
  return threads_.DetachIfExiting();
}

void RuntimeContext::DetachAllThreads() {
  threads_.DetachAll();
}

void RuntimeContext::Dispose() {
  AppendLogInternal(LogLevel::kInfo, "gate", "Disposing runtime context");
  threads_.DetachAll();
  gate_.Reset();
}

}  // namespace monoattach
