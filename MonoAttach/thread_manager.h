#pragma once

#include <cstddef>
#include <exception>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <unordered_map>
#include <utility>

#include "native_api.h"

namespace monoattach {

class RuntimeGate;

namespace detail {
  // Runs |fn| and stores its outcome in |promise|. A returned future is
  // waited on here, on the calling thread.
  template <typename T>
  struct Settle {
    using type = T;
    template <typename Fn>
    static void Run(std::promise<T>& promise, Fn& fn) { promise.set_value(fn()); }
  };

  template <>
  struct Settle<void> {
    using type = void;
    template <typename Fn>
    static void Run(std::promise<void>& promise, Fn& fn) {
      fn();
      promise.set_value();
    }
  };

  template <typename T>
  struct Settle<std::future<T>> {
    using type = T;
    template <typename Fn>
    static void Run(std::promise<T>& promise, Fn& fn) {
      std::future<T> pending = fn();
      auto wait = [&pending]() -> T { return pending.get(); };
      Settle<T>::Run(promise, wait);
    }
  };

  template <typename T>
  struct Settle<std::shared_future<T>> {
    using type = T;
    template <typename Fn>
    static void Run(std::promise<T>& promise, Fn& fn) {
      std::shared_future<T> pending = fn();
      auto wait = [&pending]() -> T { return pending.get(); };
      Settle<T>::Run(promise, wait);
    }
  };

  template <typename Fn>
  using SettleOf = Settle<std::decay_t<std::invoke_result_t<Fn&>>>;
}  // namespace detail

// Per-OS-thread attachment registry.
//
// One record per thread. |bridge_owned| is only ever set for a thread whose
// native attach was performed here, and a detach requested by cleanup code
// checks it together with the call depth. Threads found attached by someone
// else are adopted and never detached by this class.
//
// Thread exit is the exception to the detach modes: a thread whose native
// attach was done here is detached when it exits, whatever mode attached it
// (leak mode and EnsureThreadAttached() included). A dead thread must not stay
// registered with the runtime.
class ThreadManager {
 public:
  struct AttachResult {
    MonoThread* handle = nullptr;
    bool performed_attach = false;
  };

  ThreadManager(NativeRuntimeApi& api, RuntimeGate& gate);
  ~ThreadManager();

  ThreadManager(const ThreadManager&) = delete;
  ThreadManager& operator=(const ThreadManager&) = delete;

  // True if the calling thread has a record or the runtime reports it as
  // attached already.
  bool IsAttached();

  // Returns the existing handle when there is one, otherwise attaches the
  // calling thread to the root domain. Throws AttachmentError if the native
  // attach fails and RuntimeNotReadyError before the gate is ready.
  AttachResult EnsureAttached();

  // Only honoured for a record whose native attach was done by this manager.
  void MarkBridgeOwned();

  // Detaches the calling thread if it is bridge-owned and no frame is active.
  // Native failures are logged and swallowed. Returns true if detached.
  bool DetachBridgeOwned();

  // Detaches the calling thread if the runtime reports it as exiting. No
  // native call for adopted threads, unknown threads, or inside a frame. The
  // thread-exit watch does the same automatically during TLS teardown.
  bool DetachIfExiting();

  // Disposal only: every other thread must be quiescent.
  void DetachAll();

  // Runs |fn| on the calling thread inside an attachment frame. Nested calls
  // on the same thread just deepen the frame.
  template <typename Fn>
  auto RunAsync(Fn&& fn) -> std::future<typename detail::SettleOf<Fn>::type> {
    using Result = typename detail::SettleOf<Fn>::type;
    std::promise<Result> promise;
    std::future<Result> future = promise.get_future();
    try {
      Frame frame(*this);
      detail::SettleOf<Fn>::Run(promise, fn);
    }
    catch (...) {
      promise.set_exception(std::current_exception());
    }
    return future;
  }

  size_t AttachedThreadCount() const;
  // Frame depth of the calling thread; 0 when it has no record.
  int Depth() const;
  bool IsBridgeOwned() const;

  struct Registry;

 private:
  class Frame {
   public:
    explicit Frame(ThreadManager& owner) : owner_(owner) { owner_.EnterFrame(); }
    ~Frame() { owner_.LeaveFrame(); }
    Frame(const Frame&) = delete;
    Frame& operator=(const Frame&) = delete;

   private:
    ThreadManager& owner_;
  };

  void EnterFrame();
  void LeaveFrame();
  void WatchThreadExit();

  NativeRuntimeApi& api_;
  RuntimeGate& gate_;
  std::shared_ptr<Registry> registry_;
};

}  // namespace monoattach
