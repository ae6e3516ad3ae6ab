// Repository: TuneLedger
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission for ledger, spool and harness threads.
// Copyright (c) 2026 TuneLedger

#include "tuneledger/util/Logger.hpp"

#include <cstdlib>
#include <iostream>

namespace tuneledger::util {

std::mutex Logger::mutex_;
std::function<void(const std::string&)> Logger::sinks_[4];

namespace {

size_t SlotFor(Logger::Level level) {
  return static_cast<size_t>(level);
}

}  // namespace

bool Logger::DebugEnabled() {
  return std::getenv("TUNELEDGER_DEBUG") != nullptr;
}

void Logger::SetSink(Level level, std::function<void(const std::string&)> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  sinks_[SlotFor(level)] = std::move(sink);
}

void Logger::ClearSinks() {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto& sink : sinks_) sink = nullptr;
}

void Logger::Emit(Level level, const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto& sink = sinks_[SlotFor(level)];
  if (sink) {
    sink(line);
  }
  std::ostream& os = (level == Level::kWarn || level == Level::kError) ? std::cerr : std::cout;
  os << line << '\n';
  os.flush();
}

void Logger::Info(const std::string& line) { Emit(Level::kInfo, line); }

void Logger::Debug(const std::string& line) {
  if (!DebugEnabled()) return;
  Emit(Level::kDebug, line);
}

void Logger::Warn(const std::string& line) { Emit(Level::kWarn, line); }

void Logger::Error(const std::string& line) { Emit(Level::kError, line); }

}  // namespace tuneledger::util
