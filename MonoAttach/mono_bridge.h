#pragma once

#include <future>
#include <memory>
#include <utility>

#include "config.h"
#include "errors.h"
#include "runtime_context.h"

// Process-wide bridge over a single RuntimeContext bound to the real Mono
// exports and DefaultProcessHost().

namespace monoattach {

// Creates the process context. Throws BridgeError if one already exists.
std::shared_ptr<RuntimeContext> MonoCreateContext(const BridgeConfig& cfg);
// Throws RuntimeNotReadyError before MonoCreateContext(). The returned
// reference stays valid across a concurrent MonoDestroyContext().
std::shared_ptr<RuntimeContext> MonoContext();
bool MonoHasContext();
// Disposes and destroys the process context.
void MonoDestroyContext();

std::shared_future<bool> MonoInitialize();
MonoThread* MonoEnsureThreadAttached();
bool MonoDetachIfExiting();
void MonoDetachAllThreads();
void MonoDispose();

// Delivers errors queued for the next tick by earlier Perform() calls.
size_t MonoPumpTicks();
// Host teardown: runs the unload cleanup registered by bind-mode Perform().
void MonoShutdown();

namespace detail {
  // A missing context rejects the future the same way a failed
  // initialization does.
  template <typename Fn, typename Call>
  auto PerformOnContext(Call&& call) -> std::future<typename SettleOf<Fn>::type> {
    std::shared_ptr<RuntimeContext> context;
    try {
      context = MonoContext();
    }
    catch (const BridgeError&) {
      std::promise<typename SettleOf<Fn>::type> rejected;
      rejected.set_exception(std::current_exception());
      return rejected.get_future();
    }
    return call(*context);
  }
}  // namespace detail

template <typename Fn>
auto MonoPerform(Fn&& callback) -> std::future<typename detail::SettleOf<Fn>::type> {
  MonoPumpTicks();
  return detail::PerformOnContext<Fn>([&](RuntimeContext& context) {
    return context.Perform(std::forward<Fn>(callback));
  });
}

template <typename Fn>
auto MonoPerform(Fn&& callback, PerformMode mode)
  -> std::future<typename detail::SettleOf<Fn>::type> {
  MonoPumpTicks();
  return detail::PerformOnContext<Fn>([&](RuntimeContext& context) {
    return context.Perform(std::forward<Fn>(callback), mode);
  });
}

}  // namespace monoattach
