// Repository: TuneLedger
// Component: Journal-backed payment transfer (harness only)
// Purpose: Records each escrow payout as one line in a journal file.
// Copyright (c) 2026 TuneLedger

#pragma once

#include <cstdint>
#include <mutex>
#include <string>

#include "tuneledger/ledger/IPaymentTransfer.hpp"

namespace tuneledger::standalone {

// Appends "<utc_ms> <to_identity> <amount>" per payout and reports failure
// when the line cannot be written, which makes the ledger restore escrow.
class JournalPaymentTransfer : public ledger::IPaymentTransfer {
 public:
  explicit JournalPaymentTransfer(std::string journal_path);

  ledger::TransferResult Transfer(const std::string& to_identity,
                                  ledger::Amount amount) override;

  uint64_t TransfersRecorded() const;
  const std::string& JournalPath() const { return journal_path_; }

 private:
  std::string journal_path_;
  mutable std::mutex mutex_;
  uint64_t transfers_recorded_ = 0;
};

}  // namespace tuneledger::standalone
