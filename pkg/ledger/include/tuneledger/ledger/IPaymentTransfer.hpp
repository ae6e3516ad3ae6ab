// Repository: TuneLedger
// Component: Payment Transfer Interface
// Purpose: Dependency inversion for escrow payouts. The ledger never moves
//          money itself; it hands the amount to this collaborator.
// Copyright (c) 2026 TuneLedger

#ifndef TUNELEDGER_LEDGER_IPAYMENT_TRANSFER_HPP_
#define TUNELEDGER_LEDGER_IPAYMENT_TRANSFER_HPP_

#include <string>

#include "tuneledger/ledger/LedgerTypes.hpp"

namespace tuneledger::ledger {

struct TransferResult {
  bool success = false;
  std::string detail;

  static TransferResult Success() { return {true, ""}; }
  static TransferResult Failure(const std::string& detail) { return {false, detail}; }
};

// Fallible and non-idempotent: the ledger calls Transfer() at most once per
// withdrawal and never retries. A reported failure (or an exception) makes
// the ledger restore the escrow it had cleared.
class IPaymentTransfer {
 public:
  virtual ~IPaymentTransfer() = default;

  virtual TransferResult Transfer(const std::string& to_identity, Amount amount) = 0;
};

}  // namespace tuneledger::ledger

#endif  // TUNELEDGER_LEDGER_IPAYMENT_TRANSFER_HPP_
