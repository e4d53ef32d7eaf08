#pragma once

#include <future>
#include <memory>
#include <utility>

#include "config.h"
#include "host.h"
#include "module_locator.h"
#include "native_api.h"
#include "perform_scheduler.h"
#include "runtime_gate.h"
#include "thread_manager.h"
#include "unload_hook.h"

namespace monoattach {

// Owns every piece of bridge state. Create one per process (the facade in
// mono_bridge.h does) or one per test around a fake NativeRuntimeApi.
class RuntimeContext {
 public:
  RuntimeContext(BridgeConfig cfg, std::unique_ptr<NativeRuntimeApi> api, HostEnvironment& host);
  ~RuntimeContext();

  RuntimeContext(const RuntimeContext&) = delete;
  RuntimeContext& operator=(const RuntimeContext&) = delete;

  // The recommended way in: initialize, attach, run, clean up per |mode|.
  template <typename Fn>
  auto Perform(Fn&& callback) -> std::future<typename detail::SettleOf<Fn>::type> {
    return scheduler_.Perform(std::forward<Fn>(callback));
  }

  template <typename Fn>
  auto Perform(Fn&& callback, PerformMode mode)
    -> std::future<typename detail::SettleOf<Fn>::type> {
    return scheduler_.Perform(std::forward<Fn>(callback), mode);
  }

  std::shared_future<bool> Initialize();

  // Escape hatch; prefer Perform(). Throws RuntimeNotReadyError before the
  // runtime is ready.
  MonoThread* EnsureThreadAttached();

  bool DetachIfExiting();

  // Disposal only; quiesce all Perform() activity first.
  void DetachAllThreads();

  // Detaches every tracked thread and releases the runtime binding. A later
  // Initialize() starts from scratch.
  void Dispose();

  RuntimeHandle Handle() const { return gate_.Handle(); }
  ModuleDescriptor Module() const { return gate_.Module(); }
  bool IsReady() const { return gate_.IsReady(); }

  const BridgeConfig& config() const { return config_; }
  NativeRuntimeApi& api() { return *api_; }
  RuntimeGate& gate() { return gate_; }
  ThreadManager& threads() { return threads_; }
  UnloadHook& unload_hook() { return unload_hook_; }

 private:
  BridgeConfig config_;
  std::unique_ptr<NativeRuntimeApi> api_;
  HostEnvironment& host_;
  ModuleLocator locator_;
  RuntimeGate gate_;
  ThreadManager threads_;
  UnloadHook unload_hook_;
  PerformScheduler scheduler_;
};

}  // namespace monoattach
