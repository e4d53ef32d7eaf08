#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>

#include "host.h"

namespace monoattach {

// Ties disposal to the host's teardown. Registered at most once, fires at
// most once, and never lets an error escape.
class UnloadHook {
 public:
  UnloadHook(HostEnvironment& host, std::function<void()> disposer);
  ~UnloadHook();

  UnloadHook(const UnloadHook&) = delete;
  UnloadHook& operator=(const UnloadHook&) = delete;

  // Returns true only for the call that did the registration.
  bool Install();

  bool installed() const { return installed_.load(); }
  bool fired() const;

 private:
  struct State {
    // Held while the disposer runs; the destructor takes it to wait one out.
    std::mutex run_mutex;
    std::mutex mutex;
    std::function<void()> disposer;
    bool fired = false;
  };

  static void Fire(const std::shared_ptr<State>& state);

  HostEnvironment& host_;
  std::shared_ptr<State> state_;
  std::atomic<bool> installed_{false};
};

}  // namespace monoattach
