// Repository: TuneLedger
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission for ledger, spool and harness threads.
// Copyright (c) 2026 TuneLedger

#ifndef TUNELEDGER_UTIL_LOGGER_HPP_
#define TUNELEDGER_UTIL_LOGGER_HPP_

#include <functional>
#include <mutex>
#include <sstream>
#include <string>

namespace tuneledger::util {

// Logger provides thread-safe log emission with a single static mutex.
// Each call acquires the mutex, writes the full line, appends '\n', and
// flushes, so lines from concurrent ledger callers, the spool writer thread
// and the gRPC exporter never interleave.
//
// Info  → stdout (registrations, publications, withdrawals)
// Debug → stdout only when TUNELEDGER_DEBUG env is set (per-stream detail)
// Warn  → stderr (rejected operations)
// Error → stderr (transfer failures, spool faults)
class Logger {
 public:
  enum class Level { kDebug, kInfo, kWarn, kError };

  static void Info(const std::string& line);
  static void Debug(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  // Test-only: capture every line emitted at `level` (in addition to the
  // stream). Debug lines reach the sink only when debug output is enabled.
  // Call with nullptr to clear.
  static void SetSink(Level level, std::function<void(const std::string&)> sink);
  static void ClearSinks();

  static bool DebugEnabled();

 private:
  static void Emit(Level level, const std::string& line);

  static std::mutex mutex_;
  static std::function<void(const std::string&)> sinks_[4];
};

// Builds one "[Component] EVENT key=value ..." line.
//
//   Logger::Warn(LogLine("StreamingLedger", "STREAM_REJECTED")
//                    .Kv("work_id", id).Kv("error", "WORK_NOT_FOUND").str());
class LogLine {
 public:
  LogLine(const char* component, const char* event) {
    out_ << '[' << component << "] " << event;
  }

  template <typename T>
  LogLine& Kv(const char* key, const T& value) {
    out_ << ' ' << key << '=' << value;
    return *this;
  }

  std::string str() const { return out_.str(); }

 private:
  std::ostringstream out_;
};

}  // namespace tuneledger::util

#endif  // TUNELEDGER_UTIL_LOGGER_HPP_
