#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace monoattach {

enum class LogLevel : int { kError = 0, kWarn = 1, kInfo = 2, kDebug = 3, kTrace = 4 };

// Structured logging (thread-safe, ring-buffered, mirrored to a file).
void AppendLogInternal(LogLevel lvl, const char* stage, const std::string& message);
void AppendLog(const std::string& message);
// Returns true only the first time |key| is seen.
bool AppendLogOnce(const std::string& key, const std::string& message);

void SetLogLevel(LogLevel lvl);
LogLevel GetLogLevel();
bool ParseLogLevel(const std::string& text, LogLevel& out_level);

const std::string& GetLogPath();
void SetLogPath(const std::string& path_utf8);
// Disables the file mirror; the ring buffer keeps working.
void SetLogFileEnabled(bool enabled);

bool GetLogSnapshot(int max_lines, std::vector<std::string>& out);
void ClearLog();

uint32_t CurrentThreadTag();

}  // namespace monoattach
