#include "pch.h"

#include "runtime_gate.h"

#include <chrono>
#include <sstream>
#include <thread>

#include "errors.h"
#include "log.h"

namespace monoattach {

namespace {
  const char kNotReadyMessage[] =
    "Mono runtime is not initialized. Use Perform(...) or wait on Initialize() before "
    "accessing the runtime synchronously";
}  // namespace

RuntimeGate::RuntimeGate(NativeRuntimeApi& api, ModuleLocator& locator, const BridgeConfig& cfg)
  : api_(api), locator_(locator), config_(cfg) {}

std::shared_future<bool> RuntimeGate::Initialize() {
  std::promise<bool> promise;
  std::shared_future<bool> result;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == State::kReady) {
      std::promise<bool> done;
      done.set_value(false);
      return done.get_future().share();
    }
    if (state_ == State::kInitializing) return in_flight_;
    state_ = State::kInitializing;
    in_flight_ = promise.get_future().share();
    result = in_flight_;
  }

  AppendLogInternal(LogLevel::kInfo, "gate", "Initializing Mono runtime");
  try {
    ModuleDescriptor module;
    RuntimeHandle handle = RunDiscovery(module);
    {
      std::lock_guard<std::mutex> lock(mutex_);
      module_ = module;
      handle_ = handle;
      state_ = State::kReady;
      in_flight_ = std::shared_future<bool>();
    }
    AppendLogInternal(LogLevel::kInfo, "gate", "Mono runtime ready (module " + module.name + ")");
    promise.set_value(true);
  }
  catch (...) {
    std::exception_ptr cause = std::current_exception();
    std::string message = "Failed to initialize Mono runtime: " + DescribeException(cause);
    api_.Unbind();
    {
      std::lock_guard<std::mutex> lock(mutex_);
      module_ = ModuleDescriptor();
      handle_ = RuntimeHandle();
      state_ = State::kUninitialized;
      in_flight_ = std::shared_future<bool>();
    }
    AppendLogInternal(LogLevel::kError, "gate", message);
    promise.set_exception(std::make_exception_ptr(InitializationError(message, cause)));
  }
  return result;
}

RuntimeHandle RuntimeGate::RunDiscovery(ModuleDescriptor& out_module) {
  discovery_runs_.fetch_add(1);
  out_module = locator_.WaitForModule(config_.module_names, config_.initialize_timeout_ms,
                                      config_.warn_after_ms);
  api_.Bind(out_module.ToModuleInfo());

  // No thread attachment here; Perform() owns that.
  RuntimeHandle handle;
  handle.root_domain = WaitForRootDomain();
  handle.ready = true;
  return handle;
}

MonoDomain* RuntimeGate::WaitForRootDomain() {
  using Clock = std::chrono::steady_clock;
  const auto start = Clock::now();
  const auto deadline = start + std::chrono::milliseconds(config_.initialize_timeout_ms);
  const auto warn_at = start + std::chrono::milliseconds(config_.warn_after_ms);
  bool warned = false;

  for (;;) {
    if (MonoDomain* domain = api_.GetRootDomain()) return domain;
    auto now = Clock::now();
    if (now >= deadline) break;
    if (!warned && now >= warn_at) {
      warned = true;
      AppendLogInternal(LogLevel::kWarn, "gate", "Waiting for Mono root domain to be created");
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(config_.poll_interval_ms));
  }
  std::ostringstream oss;
  oss << "Timed out after " << config_.initialize_timeout_ms
      << "ms waiting for mono_get_root_domain";
  throw BridgeError(oss.str());
}

bool RuntimeGate::IsReady() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_ == State::kReady;
}

RuntimeGate::State RuntimeGate::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

RuntimeHandle RuntimeGate::Handle() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_ != State::kReady) throw RuntimeNotReadyError(kNotReadyMessage);
  return handle_;
}

ModuleDescriptor RuntimeGate::Module() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_ != State::kReady) throw RuntimeNotReadyError(kNotReadyMessage);
  return module_;
}

void RuntimeGate::Reset() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == State::kInitializing) {
      AppendLogInternal(LogLevel::kWarn, "gate", "Reset ignored: initialization in progress");
      return;
    }
    if (state_ == State::kUninitialized) return;
    module_ = ModuleDescriptor();
    handle_ = RuntimeHandle();
    state_ = State::kUninitialized;
  }
  api_.Unbind();
  AppendLogInternal(LogLevel::kInfo, "gate", "Mono runtime binding released");
}

}  // namespace monoattach
