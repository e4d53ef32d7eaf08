#pragma once

#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <mutex>
#include <vector>

namespace monoattach {

// Lifecycle services of whatever hosts the bridge: a "next tick" queue and
// teardown notification.
class HostEnvironment {
 public:
  virtual ~HostEnvironment() = default;

  // Runs |task| later, decoupled from the caller. Exceptions thrown by the
  // task are the host's to report.
  virtual void ScheduleTick(std::function<void()> task) = 0;

  // Runs |hook| once when the host tears down.
  virtual void RegisterUnload(std::function<void()> hook) = 0;
};

// Host for an injected library: ticks are queued and drained by PumpTicks(),
// unload hooks run from Shutdown().
class ProcessHost : public HostEnvironment {
 public:
  using ErrorHandler = std::function<void(std::exception_ptr)>;

  void ScheduleTick(std::function<void()> task) override;
  void RegisterUnload(std::function<void()> hook) override;

  // Runs every queued tick. Errors go to the unhandled-error handler (logged
  // at error level when none is set). Returns the number of ticks run.
  size_t PumpTicks();

  // Runs registered unload hooks once; later calls do nothing.
  void Shutdown();

  void SetUnhandledErrorHandler(ErrorHandler handler);

  size_t pending_ticks() const;
  size_t unload_hook_count() const;
  bool shut_down() const;

 private:
  void ReportUnhandled(std::exception_ptr error);

  mutable std::mutex mutex_;
  std::deque<std::function<void()>> ticks_;
  std::vector<std::function<void()>> unload_hooks_;
  ErrorHandler error_handler_;
  bool shut_down_ = false;
};

// The host used by the process-wide bridge facade.
ProcessHost& DefaultProcessHost();

}  // namespace monoattach
