#include "pch.h"

#include "thread_manager.h"

#include <sstream>
#include <vector>

#include "errors.h"
#include "log.h"
#include "runtime_gate.h"

namespace monoattach {

namespace {
  struct ThreadRecord {
    MonoThread* handle = nullptr;
    bool bridge_owned = false;
    // This manager issued the mono_thread_attach (as opposed to adopting).
    bool attached_natively = false;
    int depth = 0;
  };

  std::string HandleText(const void* p) {
    std::ostringstream oss;
    oss << "0x" << std::hex << reinterpret_cast<uintptr_t>(p);
    return oss.str();
  }

  // Set once the thread is tearing down its thread_local storage.
  thread_local bool t_thread_exiting = false;
}  // namespace

struct ThreadManager::Registry {
  explicit Registry(NativeRuntimeApi& native) : api(native) {}

  NativeRuntimeApi& api;
  mutable std::mutex mutex;
  std::unordered_map<std::thread::id, ThreadRecord> records;

  // Caller guarantees the current thread is exiting.
  bool DetachExitingThread() {
    ThreadRecord record;
    {
      std::lock_guard<std::mutex> lock(mutex);
      auto it = records.find(std::this_thread::get_id());
      if (it == records.end()) return false;
      record = it->second;
      records.erase(it);
    }
    if (!record.attached_natively) {
      AppendLogInternal(LogLevel::kDebug, "thread", "Exiting thread was adopted; record dropped");
      return false;
    }
    try {
      if (api.ThreadDetachIfExiting()) {
        AppendLogInternal(LogLevel::kDebug, "thread", "Detached exiting thread");
        return true;
      }
      // The runtime did not see the thread as exiting yet; it is ours and it
      // is going away, so detach it directly.
      api.ThreadDetach(record.handle);
      AppendLogInternal(LogLevel::kDebug, "thread", "Detached exiting thread " + HandleText(record.handle));
      return true;
    }
    catch (const std::exception& e) {
      AppendLogInternal(LogLevel::kWarn, "thread",
        DetachError(std::string("Detach on thread exit failed: ") + e.what()).what());
      return false;
    }
  }
};

namespace {
  // Lives in each attached thread's TLS. Its destructor runs during thread
  // exit and releases the attachments owned by live managers.
  struct ThreadExitWatch {
    std::vector<std::weak_ptr<ThreadManager::Registry>> registries;

    void Add(const std::shared_ptr<ThreadManager::Registry>& registry) {
      for (auto it = registries.begin(); it != registries.end();) {
        std::shared_ptr<ThreadManager::Registry> live = it->lock();
        if (!live) {
          it = registries.erase(it);
          continue;
        }
        if (live == registry) return;
        ++it;
      }
      registries.push_back(registry);
    }

    ~ThreadExitWatch() {
      t_thread_exiting = true;
      for (auto& weak : registries) {
        if (std::shared_ptr<ThreadManager::Registry> registry = weak.lock()) {
          registry->DetachExitingThread();
        }
      }
    }
  };

  thread_local ThreadExitWatch t_exit_watch;
}  // namespace

ThreadManager::ThreadManager(NativeRuntimeApi& api, RuntimeGate& gate)
  : api_(api), gate_(gate), registry_(std::make_shared<Registry>(api)) {}

ThreadManager::~ThreadManager() {
  std::lock_guard<std::mutex> lock(registry_->mutex);
  if (!registry_->records.empty()) {
    AppendLogInternal(LogLevel::kDebug, "thread", "ThreadManager destroyed with attached threads");
  }
}

bool ThreadManager::IsAttached() {
  {
    std::lock_guard<std::mutex> lock(registry_->mutex);
    if (registry_->records.count(std::this_thread::get_id())) return true;
  }
  return api_.CurrentAttachedThread() != nullptr;
}

ThreadManager::AttachResult ThreadManager::EnsureAttached() {
  const std::thread::id id = std::this_thread::get_id();
  {
    std::lock_guard<std::mutex> lock(registry_->mutex);
    auto it = registry_->records.find(id);
    if (it != registry_->records.end()) return AttachResult{it->second.handle, false};
  }

  // Only this thread inserts its own key, so nothing can race us between the
  // lookup above and the insert below.
  if (MonoThread* existing = api_.CurrentAttachedThread()) {
    ThreadRecord record;
    record.handle = existing;
    {
      std::lock_guard<std::mutex> lock(registry_->mutex);
      registry_->records[id] = record;
    }
    WatchThreadExit();
    AppendLogInternal(LogLevel::kDebug, "thread", "Adopted externally attached thread " + HandleText(existing));
    return AttachResult{existing, false};
  }

  MonoDomain* domain = gate_.Handle().root_domain;
  MonoThread* thread = api_.ThreadAttach(domain);
  if (!thread) {
    AppendLogInternal(LogLevel::kError, "thread", "mono_thread_attach failed");
    throw AttachmentError("mono_thread_attach returned null; ensure the Mono runtime is initialized");
  }

  ThreadRecord record;
  record.handle = thread;
  record.attached_natively = true;
  {
    std::lock_guard<std::mutex> lock(registry_->mutex);
    registry_->records[id] = record;
  }
  WatchThreadExit();
  AppendLogInternal(LogLevel::kInfo, "thread", "Attached thread to Mono domain " + HandleText(thread));
  return AttachResult{thread, true};
}

void ThreadManager::MarkBridgeOwned() {
  std::lock_guard<std::mutex> lock(registry_->mutex);
  auto it = registry_->records.find(std::this_thread::get_id());
  if (it == registry_->records.end()) {
    AppendLogInternal(LogLevel::kWarn, "thread", "MarkBridgeOwned: calling thread is not attached");
    return;
  }
  if (!it->second.attached_natively) {
    AppendLogInternal(LogLevel::kWarn, "thread",
      "MarkBridgeOwned: thread was attached externally; ownership not taken");
    return;
  }
  it->second.bridge_owned = true;
}

bool ThreadManager::DetachBridgeOwned() {
  ThreadRecord record;
  {
    std::lock_guard<std::mutex> lock(registry_->mutex);
    auto it = registry_->records.find(std::this_thread::get_id());
    if (it == registry_->records.end() || !it->second.bridge_owned) return false;
    if (it->second.depth > 0) {
      AppendLogInternal(LogLevel::kDebug, "thread", "DetachBridgeOwned: frame still active, skipped");
      return false;
    }
    record = it->second;
    registry_->records.erase(it);
  }

  try {
    api_.ThreadDetach(record.handle);
  }
  catch (const std::exception& e) {
    AppendLogInternal(LogLevel::kWarn, "thread",
      DetachError(std::string("mono_thread_detach failed: ") + e.what()).what());
    return false;
  }
  AppendLogInternal(LogLevel::kInfo, "thread", "Detached bridge-owned thread " + HandleText(record.handle));
  return true;
}

bool ThreadManager::DetachIfExiting() {
  if (t_thread_exiting) return registry_->DetachExitingThread();

  const std::thread::id id = std::this_thread::get_id();
  {
    std::lock_guard<std::mutex> lock(registry_->mutex);
    auto it = registry_->records.find(id);
    if (it == registry_->records.end()) return false;
    if (!it->second.attached_natively || it->second.depth > 0) return false;
  }

  // mono_thread_detach_if_exiting leaves a thread alone unless the runtime
  // has seen its teardown begin.
  try {
    if (!api_.ThreadDetachIfExiting()) return false;
  }
  catch (const std::exception& e) {
    AppendLogInternal(LogLevel::kWarn, "thread",
      DetachError(std::string("mono_thread_detach_if_exiting failed: ") + e.what()).what());
    return false;
  }
  {
    std::lock_guard<std::mutex> lock(registry_->mutex);
    registry_->records.erase(id);
  }
  AppendLogInternal(LogLevel::kDebug, "thread", "Detached exiting thread on request");
  return true;
}

void ThreadManager::DetachAll() {
  std::unordered_map<std::thread::id, ThreadRecord> records;
  {
    std::lock_guard<std::mutex> lock(registry_->mutex);
    records.swap(registry_->records);
  }
  int detached = 0;
  for (const auto& entry : records) {
    const ThreadRecord& record = entry.second;
    if (!record.attached_natively) continue;
    try {
      api_.ThreadDetach(record.handle);
      ++detached;
    }
    catch (const std::exception& e) {
      AppendLogInternal(LogLevel::kWarn, "thread",
        DetachError(std::string("DetachAll: mono_thread_detach failed: ") + e.what()).what());
    }
  }
  std::ostringstream oss;
  oss << "DetachAll: detached " << detached << " of " << records.size() << " tracked threads";
  AppendLogInternal(LogLevel::kInfo, "thread", oss.str());
}

size_t ThreadManager::AttachedThreadCount() const {
  std::lock_guard<std::mutex> lock(registry_->mutex);
  return registry_->records.size();
}

int ThreadManager::Depth() const {
  std::lock_guard<std::mutex> lock(registry_->mutex);
  auto it = registry_->records.find(std::this_thread::get_id());
  return it == registry_->records.end() ? 0 : it->second.depth;
}

bool ThreadManager::IsBridgeOwned() const {
  std::lock_guard<std::mutex> lock(registry_->mutex);
  auto it = registry_->records.find(std::this_thread::get_id());
  return it != registry_->records.end() && it->second.bridge_owned;
}

void ThreadManager::EnterFrame() {
  {
    std::lock_guard<std::mutex> lock(registry_->mutex);
    auto it = registry_->records.find(std::this_thread::get_id());
    if (it != registry_->records.end()) {
      ++it->second.depth;
      return;
    }
  }
  // Direct RunAsync use without a prior attach: adopt or attach, unowned.
  EnsureAttached();
  std::lock_guard<std::mutex> lock(registry_->mutex);
  ++registry_->records[std::this_thread::get_id()].depth;
}

void ThreadManager::LeaveFrame() {
  std::lock_guard<std::mutex> lock(registry_->mutex);
  auto it = registry_->records.find(std::this_thread::get_id());
  // DetachAll may have dropped the record mid-frame.
  if (it != registry_->records.end() && it->second.depth > 0) --it->second.depth;
}

void ThreadManager::WatchThreadExit() {
  t_exit_watch.Add(registry_);
}

}  // namespace monoattach
