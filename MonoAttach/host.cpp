#include "pch.h"

#include "host.h"

#include <utility>

#include "errors.h"
#include "log.h"

namespace monoattach {

void ProcessHost::ScheduleTick(std::function<void()> task) {
  if (!task) return;
  std::lock_guard<std::mutex> lock(mutex_);
  ticks_.push_back(std::move(task));
}

void ProcessHost::RegisterUnload(std::function<void()> hook) {
  if (!hook) return;
  std::lock_guard<std::mutex> lock(mutex_);
  if (shut_down_) {
    AppendLogInternal(LogLevel::kWarn, "host", "Unload hook registered after shutdown; ignored");
    return;
  }
  unload_hooks_.push_back(std::move(hook));
}

size_t ProcessHost::PumpTicks() {
  std::deque<std::function<void()>> batch;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    batch.swap(ticks_);
  }
  for (auto& task : batch) {
    try {
      task();
    }
    catch (...) {
      ReportUnhandled(std::current_exception());
    }
  }
  return batch.size();
}

void ProcessHost::Shutdown() {
  std::vector<std::function<void()>> hooks;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shut_down_) return;
    shut_down_ = true;
    hooks.swap(unload_hooks_);
  }
  AppendLogInternal(LogLevel::kInfo, "host", "Host shutdown: running unload hooks");
  // Teardown must not throw out of here.
  for (auto& hook : hooks) {
    try {
      hook();
    }
    catch (const std::exception& e) {
      AppendLogInternal(LogLevel::kWarn, "host", std::string("Unload hook failed: ") + e.what());
    }
    catch (...) {
      AppendLogInternal(LogLevel::kWarn, "host", "Unload hook failed with a non-standard exception");
    }
  }
}

void ProcessHost::SetUnhandledErrorHandler(ErrorHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  error_handler_ = std::move(handler);
}

size_t ProcessHost::pending_ticks() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return ticks_.size();
}

size_t ProcessHost::unload_hook_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return unload_hooks_.size();
}

bool ProcessHost::shut_down() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return shut_down_;
}

void ProcessHost::ReportUnhandled(std::exception_ptr error) {
  ErrorHandler handler;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    handler = error_handler_;
  }
  AppendLogInternal(LogLevel::kError, "host", "Unhandled error: " + DescribeException(error));
  if (!handler) return;
  try {
    handler(error);
  }
  catch (const std::exception& e) {
    AppendLogInternal(LogLevel::kError, "host", std::string("Unhandled-error handler threw: ") + e.what());
  }
}

ProcessHost& DefaultProcessHost() {
  static ProcessHost host;
  return host;
}

}  // namespace monoattach
