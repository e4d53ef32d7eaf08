#pragma once

#include <atomic>
#include <future>
#include <mutex>

#include "config.h"
#include "module_locator.h"
#include "native_api.h"

namespace monoattach {

struct RuntimeHandle {
  MonoDomain* root_domain = nullptr;
  bool ready = false;
};

// Process-wide, exactly-once initialization of the Mono runtime binding.
//
// Uninitialized -> Initializing -> Ready. A failed attempt goes back to
// Uninitialized so a later call starts over. Discovery runs on the thread of
// the first caller; everyone arriving while it runs shares its future and
// observes the same value or the same exception object.
class RuntimeGate {
 public:
  enum class State : int { kUninitialized = 0, kInitializing = 1, kReady = 2 };

  RuntimeGate(NativeRuntimeApi& api, ModuleLocator& locator, const BridgeConfig& cfg);

  // true: this attempt performed initialization. false: already ready.
  // Failures surface as InitializationError from get().
  std::shared_future<bool> Initialize();

  bool IsReady() const;
  State state() const;

  // Throws RuntimeNotReadyError before the gate is ready.
  RuntimeHandle Handle() const;
  ModuleDescriptor Module() const;

  // Disposal: forget the module and handle. Ignored while initializing.
  void Reset();

  int discovery_runs() const { return discovery_runs_.load(); }

 private:
  RuntimeHandle RunDiscovery(ModuleDescriptor& out_module);
  MonoDomain* WaitForRootDomain();

  NativeRuntimeApi& api_;
  ModuleLocator& locator_;
  const BridgeConfig& config_;

  mutable std::mutex mutex_;
  State state_ = State::kUninitialized;
  std::shared_future<bool> in_flight_;
  ModuleDescriptor module_;
  RuntimeHandle handle_;
  std::atomic<int> discovery_runs_{0};
};

}  // namespace monoattach
