#include "pch.h"

#include "log.h"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <thread>
#include <unordered_set>

namespace monoattach {

namespace {
  struct LogEntry {
    std::string ts;
    std::string stage;
    std::string msg;
    LogLevel level{ LogLevel::kInfo };
    uint32_t tid{ 0 };
  };

  constexpr size_t kLogRingCap = 256;

  std::mutex g_log_mutex;
  std::deque<LogEntry> g_log_ring;
  std::unordered_set<std::string> g_log_once;
  std::atomic<int> g_log_level(static_cast<int>(LogLevel::kInfo));
  std::atomic<bool> g_log_file_enabled{true};
  std::string g_log_path;

  std::string DefaultLogPath() {
    const char* explicit_path = std::getenv("MONOATTACH_LOG");
    if (explicit_path && *explicit_path) return explicit_path;
    std::string base = ".";
#if defined(_WIN32)
    char* buf = nullptr;
    size_t sz = 0;
    if (_dupenv_s(&buf, &sz, "USERPROFILE") == 0 && buf) {
      base.assign(buf);
      free(buf);
    }
#else
    const char* user = std::getenv("HOME");
    if (user) base.assign(user);
#endif
    return (std::filesystem::path(base) / ".monoattach" / "monoattach.log").string();
  }

  void EnsureLogDir(const std::string& path) {
    std::error_code ec;
    std::filesystem::path p(path);
    if (p.has_parent_path()) std::filesystem::create_directories(p.parent_path(), ec);
  }

  // Caller holds g_log_mutex.
  void EnsureLogPathUnlocked() {
    if (!g_log_path.empty()) return;
    g_log_path = DefaultLogPath();
    EnsureLogDir(g_log_path);
  }

  std::string NowString() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    std::tm tm_local = {};
#if defined(_WIN32)
    localtime_s(&tm_local, &t);
#else
    localtime_r(&t, &tm_local);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm_local, "%F %T") << "." << std::setw(3) << std::setfill('0')
      << ms.count();
    return oss.str();
  }

  std::string FormatEntry(const LogEntry& e) {
    std::ostringstream oss;
    oss << "[" << e.ts << "] "
        << "L" << static_cast<int>(e.level) << " "
        << "T" << e.tid << " "
        << "[" << e.stage << "] "
        << e.msg;
    return oss.str();
  }

  void WriteLogLineUnlocked(const LogEntry& e) {
    if (!g_log_file_enabled.load(std::memory_order_relaxed)) return;
    EnsureLogPathUnlocked();
    std::ofstream file(g_log_path, std::ios::app);
    if (!file) return;
    file << FormatEntry(e) << "\n";
  }

  void PushUnlocked(const LogEntry& e) {
    g_log_ring.push_back(e);
    if (g_log_ring.size() > kLogRingCap) g_log_ring.pop_front();
    WriteLogLineUnlocked(e);
  }
}  // namespace

uint32_t CurrentThreadTag() {
#if defined(_WIN32)
  return static_cast<uint32_t>(GetCurrentThreadId());
#else
  return static_cast<uint32_t>(std::hash<std::thread::id>{}(std::this_thread::get_id()));
#endif
}

void AppendLogInternal(LogLevel lvl, const char* stage, const std::string& message) {
  if (static_cast<int>(lvl) > g_log_level.load(std::memory_order_relaxed)) return;
  LogEntry e{};
  e.ts = NowString();
  e.stage = stage ? stage : "general";
  e.msg = message;
  e.level = lvl;
  e.tid = CurrentThreadTag();
  std::lock_guard<std::mutex> lock(g_log_mutex);
  PushUnlocked(e);
}

void AppendLog(const std::string& message) {
  AppendLogInternal(LogLevel::kInfo, "general", message);
}

bool AppendLogOnce(const std::string& key, const std::string& message) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  if (!g_log_once.insert(key).second) return false;
  LogEntry e{NowString(), "once", message, LogLevel::kInfo, CurrentThreadTag()};
  PushUnlocked(e);
  return true;
}

void SetLogLevel(LogLevel lvl) {
  g_log_level.store(static_cast<int>(lvl), std::memory_order_relaxed);
}

LogLevel GetLogLevel() {
  return static_cast<LogLevel>(g_log_level.load(std::memory_order_relaxed));
}

bool ParseLogLevel(const std::string& text, LogLevel& out_level) {
  if (text == "error") out_level = LogLevel::kError;
  else if (text == "warn") out_level = LogLevel::kWarn;
  else if (text == "info") out_level = LogLevel::kInfo;
  else if (text == "debug") out_level = LogLevel::kDebug;
  else if (text == "trace") out_level = LogLevel::kTrace;
  else return false;
  return true;
}

const std::string& GetLogPath() {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  EnsureLogPathUnlocked();
  return g_log_path;
}

void SetLogPath(const std::string& path_utf8) {
  if (path_utf8.empty()) return;
  std::lock_guard<std::mutex> lock(g_log_mutex);
  g_log_path = path_utf8;
  EnsureLogDir(g_log_path);
}

void SetLogFileEnabled(bool enabled) {
  g_log_file_enabled.store(enabled, std::memory_order_relaxed);
}

bool GetLogSnapshot(int max_lines, std::vector<std::string>& out) {
  out.clear();
  std::lock_guard<std::mutex> lock(g_log_mutex);
  int n = static_cast<int>(g_log_ring.size());
  if (n == 0) return true;
  int start = n > max_lines ? n - max_lines : 0;
  for (int i = start; i < n; ++i) {
    out.push_back(FormatEntry(g_log_ring[i]));
  }
  return true;
}

void ClearLog() {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  g_log_ring.clear();
  g_log_once.clear();
}

}  // namespace monoattach
