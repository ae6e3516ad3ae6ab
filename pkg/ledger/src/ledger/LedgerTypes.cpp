// Repository: TuneLedger
// Component: Ledger Types Implementation
// Copyright (c) 2026 TuneLedger

#include "tuneledger/ledger/LedgerTypes.hpp"

namespace tuneledger::ledger {

// New error codes may be added; existing codes must not change meaning.
const char* LedgerErrorToString(LedgerError error) {
  switch (error) {
    case LedgerError::kNone:
      return "NONE";
    case LedgerError::kAlreadyRegistered:
      return "ALREADY_REGISTERED";
    case LedgerError::kNotRegisteredCreator:
      return "NOT_REGISTERED_CREATOR";
    case LedgerError::kNotRegisteredConsumer:
      return "NOT_REGISTERED_CONSUMER";
    case LedgerError::kWorkNotFound:
      return "WORK_NOT_FOUND";
    case LedgerError::kInsufficientPayment:
      return "INSUFFICIENT_PAYMENT";
    case LedgerError::kNotOwner:
      return "NOT_OWNER";
    case LedgerError::kNothingToWithdraw:
      return "NOTHING_TO_WITHDRAW";
    case LedgerError::kTransferFailed:
      return "TRANSFER_FAILED";
    case LedgerError::kInvalidRoyaltyRate:
      return "INVALID_ROYALTY_RATE";
    case LedgerError::kBalanceOverflow:
      return "BALANCE_OVERFLOW";
  }
  return "UNKNOWN_ERROR";
}

// payment = q * 10000 + r, so floor(payment * bp / 10000) = q * bp + floor(r * bp / 10000).
// Neither product can overflow while bp <= 10000 and q * bp <= payment.
Amount ComputeRoyaltyShare(Amount payment, uint32_t basis_points) {
  const Amount q = payment / kBasisPointsDenominator;
  const Amount r = payment % kBasisPointsDenominator;
  return q * basis_points + (r * basis_points) / kBasisPointsDenominator;
}

}  // namespace tuneledger::ledger
