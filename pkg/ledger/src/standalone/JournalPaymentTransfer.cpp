// Repository: TuneLedger
// Component: Journal-backed payment transfer implementation
// Copyright (c) 2026 TuneLedger

#include "JournalPaymentTransfer.hpp"

#include <chrono>
#include <fstream>

#include "tuneledger/util/Logger.hpp"

namespace tuneledger::standalone {

JournalPaymentTransfer::JournalPaymentTransfer(std::string journal_path)
    : journal_path_(std::move(journal_path)) {}

ledger::TransferResult JournalPaymentTransfer::Transfer(const std::string& to_identity,
                                                        ledger::Amount amount) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::system_clock::now().time_since_epoch()).count();

  std::ofstream of(journal_path_, std::ios::app);
  if (!of) {
    return ledger::TransferResult::Failure("cannot open payout journal " + journal_path_);
  }
  of << now_ms << ' ' << to_identity << ' ' << amount << '\n';
  of.flush();
  if (!of) {
    return ledger::TransferResult::Failure("cannot write payout journal " + journal_path_);
  }

  ++transfers_recorded_;
  util::Logger::Info(util::LogLine("JournalPaymentTransfer", "PAYOUT_RECORDED")
                         .Kv("to", to_identity)
                         .Kv("amount", amount)
                         .Kv("journal", journal_path_)
                         .str());
  return ledger::TransferResult::Success();
}

uint64_t JournalPaymentTransfer::TransfersRecorded() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return transfers_recorded_;
}

}  // namespace tuneledger::standalone
