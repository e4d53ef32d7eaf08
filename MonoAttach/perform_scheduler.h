#pragma once

#include <exception>
#include <future>
#include <utility>

#include "config.h"
#include "host.h"
#include "runtime_gate.h"
#include "thread_manager.h"
#include "unload_hook.h"

namespace monoattach {

// The Perform() entry point: gate readiness, then thread attachment, then the
// callback, then mode-specific cleanup once the callback has settled.
class PerformScheduler {
 public:
  PerformScheduler(RuntimeGate& gate, ThreadManager& threads, UnloadHook& unload_hook,
                   HostEnvironment& host, PerformMode default_mode)
    : gate_(gate), threads_(threads), unload_hook_(unload_hook), host_(host),
      default_mode_(default_mode) {}

  template <typename Fn>
  auto Perform(Fn&& callback) -> std::future<typename detail::SettleOf<Fn>::type> {
    return Perform(std::forward<Fn>(callback), default_mode_);
  }

  // |callback| may return a value, void, or a future that is waited on here.
  // A failure rejects the returned future and is also rethrown on the host's
  // next tick.
  template <typename Fn>
  auto Perform(Fn&& callback, PerformMode mode)
    -> std::future<typename detail::SettleOf<Fn>::type> {
    using Result = typename detail::SettleOf<Fn>::type;
    std::promise<Result> promise;
    std::future<Result> future = promise.get_future();

    bool attached_by_this_call = false;
    try {
      attached_by_this_call = Prepare(mode);
    }
    catch (...) {
      promise.set_exception(std::current_exception());
      return future;
    }

    std::future<Result> outcome = threads_.RunAsync(std::forward<Fn>(callback));
    try {
      auto settled = [&outcome]() { return std::move(outcome); };
      detail::Settle<std::future<Result>>::Run(promise, settled);
    }
    catch (...) {
      std::exception_ptr error = std::current_exception();
      ReportFailure(error);
      promise.set_exception(error);
    }
    Cleanup(mode, attached_by_this_call);
    return future;
  }

  PerformMode default_mode() const { return default_mode_; }

 private:
  // Steps before the callback. Returns whether this call attached the thread.
  bool Prepare(PerformMode mode);
  void ReportFailure(std::exception_ptr error);
  void Cleanup(PerformMode mode, bool attached_by_this_call);

  RuntimeGate& gate_;
  ThreadManager& threads_;
  UnloadHook& unload_hook_;
  HostEnvironment& host_;
  PerformMode default_mode_;
};

}  // namespace monoattach
