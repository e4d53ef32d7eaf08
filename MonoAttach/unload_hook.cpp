#include "pch.h"

#include "unload_hook.h"

#include <utility>

#include "log.h"

namespace monoattach {

UnloadHook::UnloadHook(HostEnvironment& host, std::function<void()> disposer)
  : host_(host), state_(std::make_shared<State>()) {
  state_->disposer = std::move(disposer);
}

UnloadHook::~UnloadHook() {
  // The host may outlive us; a late teardown must find nothing to run, and
  // one already running on another thread must finish first.
  std::lock_guard<std::mutex> run_lock(state_->run_mutex);
  std::lock_guard<std::mutex> lock(state_->mutex);
  state_->disposer = nullptr;
}

bool UnloadHook::Install() {
  bool expected = false;
  if (!installed_.compare_exchange_strong(expected, true)) return false;

  std::weak_ptr<State> weak = state_;
  try {
    host_.RegisterUnload([weak]() {
      if (std::shared_ptr<State> state = weak.lock()) Fire(state);
    });
  }
  catch (const std::exception& e) {
    AppendLogInternal(LogLevel::kWarn, "unload", std::string("Unload hook registration failed: ") + e.what());
    installed_.store(false);
    return false;
  }
  AppendLogInternal(LogLevel::kDebug, "unload", "Unload cleanup hook installed");
  return true;
}

bool UnloadHook::fired() const {
  std::lock_guard<std::mutex> lock(state_->mutex);
  return state_->fired;
}

void UnloadHook::Fire(const std::shared_ptr<State>& state) {
  std::lock_guard<std::mutex> run_lock(state->run_mutex);
  std::function<void()> disposer;
  {
    std::lock_guard<std::mutex> lock(state->mutex);
    if (state->fired) return;
    state->fired = true;
    disposer = state->disposer;
  }
  if (!disposer) return;
  AppendLogInternal(LogLevel::kInfo, "unload", "Running unload cleanup");
  try {
    disposer();
  }
  catch (const std::exception& e) {
    AppendLogInternal(LogLevel::kWarn, "unload", std::string("Unload cleanup failed: ") + e.what());
  }
  catch (...) {
    AppendLogInternal(LogLevel::kWarn, "unload", "Unload cleanup failed with a non-standard exception");
  }
}

}  // namespace monoattach
