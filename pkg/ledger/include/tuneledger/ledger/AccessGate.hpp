// Repository: TuneLedger
// Component: Access Gate
// Purpose: Per-work payment-for-access state machine and royalty escrow.
// Copyright (c) 2026 TuneLedger

#ifndef TUNELEDGER_LEDGER_ACCESS_GATE_HPP_
#define TUNELEDGER_LEDGER_ACCESS_GATE_HPP_

#include <memory>
#include <string>
#include <unordered_map>

#include "tuneledger/ledger/IPaymentTransfer.hpp"
#include "tuneledger/ledger/LedgerTypes.hpp"

namespace tuneledger::evidence {
class EvidenceEmitter;
}

namespace tuneledger::ledger {

// AccessGate
//
// One gate per published work, created with the work and never destroyed
// while it exists. For each (gate, consumer) pair:
//
//   kNoGrant --settle--> kGranted    (terminal; grants are never revoked)
//
// Settlement credits floor(payment * royalty_bp / 10000) to escrow, records
// the grant and bumps issued_count as one step: either all three happen or
// none do. The rest of the payment is not tracked here.
//
// Escrow is cleared only by WithdrawEscrow, which zeroes the balance before
// calling the transfer collaborator and restores it if the transfer fails.
//
// Not thread-safe. StreamingLedger serializes all access.
class AccessGate {
 public:
  enum class GrantState {
    kNoGrant,
    kGranted,
  };

  // Throws std::invalid_argument if royalty_basis_points > 10000.
  AccessGate(WorkId work_id,
             CreatorId owner_creator_id,
             std::string owner_identity,
             Amount unit_price,
             uint32_t royalty_basis_points = kDefaultRoyaltyBasisPoints,
             std::shared_ptr<evidence::EvidenceEmitter> emitter = nullptr);

  AccessGate(const AccessGate&) = delete;
  AccessGate& operator=(const AccessGate&) = delete;

  struct AccessResult {
    bool granted;
    bool settled;           // true only for the call that performed settlement
    LedgerError error;
    Amount royalty_share;   // credited by this call (0 on re-access)
    uint64_t grant_serial;  // serial of the consumer's grant (1-based)

    static AccessResult Settled(Amount share, uint64_t serial) {
      return {true, true, LedgerError::kNone, share, serial};
    }
    static AccessResult AlreadyGranted(uint64_t serial) {
      return {true, false, LedgerError::kNone, 0, serial};
    }
    static AccessResult Failure(LedgerError err) {
      return {false, false, err, 0, 0};
    }
  };

  // Already granted: succeeds without payment and without state change.
  // Otherwise requires payment >= unit price and settles. Emits
  // ROYALTY_ACCRUED then GRANT_ISSUED on settlement.
  AccessResult RequestAccess(const std::string& consumer, Amount payment);

  // Side-effect-free preview of RequestAccess's failure modes.
  LedgerError CheckAccess(const std::string& consumer, Amount payment) const;

  struct WithdrawResult {
    bool success;
    LedgerError error;
    Amount amount;       // paid out (0 on failure)
    std::string detail;  // collaborator detail on kTransferFailed

    static WithdrawResult Success(Amount amount) {
      return {true, LedgerError::kNone, amount, ""};
    }
    static WithdrawResult Failure(LedgerError err, const std::string& detail = "") {
      return {false, err, 0, detail};
    }
  };

  // kNotOwner unless caller is the owner identity, then kNothingToWithdraw
  // while the balance is zero. Side-effect free.
  LedgerError CheckWithdraw(const std::string& caller) const;

  // Requires caller == owner identity and a non-zero balance. Pays the full
  // balance through `transfer`. Reported failure → balance restored,
  // kTransferFailed. Exception from `transfer` → balance restored, rethrown.
  // Emits ROYALTY_PAID on success.
  WithdrawResult WithdrawEscrow(const std::string& caller, IPaymentTransfer& transfer);

  GrantState StateFor(const std::string& consumer) const;
  bool HasGrant(const std::string& consumer) const {
    return StateFor(consumer) == GrantState::kGranted;
  }

  GateInfo Info() const;

  WorkId work_id() const { return work_id_; }
  Amount unit_price() const { return unit_price_; }
  Amount escrow_balance() const { return escrow_balance_; }
  uint32_t royalty_basis_points() const { return royalty_basis_points_; }
  uint64_t issued_count() const { return issued_count_; }
  const std::string& owner_identity() const { return owner_identity_; }

 private:
  WorkId work_id_;
  CreatorId owner_creator_id_;
  std::string owner_identity_;
  Amount unit_price_;
  uint32_t royalty_basis_points_;
  std::shared_ptr<evidence::EvidenceEmitter> emitter_;

  Amount escrow_balance_ = 0;
  uint64_t issued_count_ = 0;
  Amount total_royalty_accrued_ = 0;
  Amount total_royalty_paid_ = 0;

  // consumer identity -> grant serial. Only ever grows.
  std::unordered_map<std::string, uint64_t> granted_to_;
};

const char* GrantStateName(AccessGate::GrantState state);

}  // namespace tuneledger::ledger

#endif  // TUNELEDGER_LEDGER_ACCESS_GATE_HPP_
