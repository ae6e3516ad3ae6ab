// Repository: TuneLedger
// Component: Ledger Types
// Purpose: Identities, records, snapshots and error codes shared by the ledger.
// Copyright (c) 2026 TuneLedger

#ifndef TUNELEDGER_LEDGER_LEDGER_TYPES_HPP_
#define TUNELEDGER_LEDGER_LEDGER_TYPES_HPP_

#include <cstdint>
#include <string>

namespace tuneledger::ledger {

// Smallest currency unit. Single currency only.
using Amount = uint64_t;
using CreatorId = uint64_t;
using WorkId = uint64_t;

// Id 0 is never issued; it means "does not exist".
inline constexpr WorkId kNoWork = 0;
inline constexpr CreatorId kNoCreator = 0;

// Royalty rate in hundredths of a percent (10000 = 100%).
inline constexpr uint32_t kBasisPointsDenominator = 10000;
inline constexpr uint32_t kDefaultRoyaltyBasisPoints = 3000;

// =============================================================================
// Error Codes
// =============================================================================

enum class LedgerError {
  kNone = 0,

  // Identity already holds a record in that namespace.
  kAlreadyRegistered,

  // Publisher identity has no creator record.
  kNotRegisteredCreator,

  // Streaming identity has no consumer record (only when the ledger is
  // configured to require consumer registration).
  kNotRegisteredConsumer,

  // Work id is 0 or was never assigned.
  kWorkNotFound,

  // No grant yet and payment < unit price.
  kInsufficientPayment,

  // Withdrawal caller is not the work's creator.
  kNotOwner,

  // Escrow balance is zero.
  kNothingToWithdraw,

  // Payment-transfer collaborator reported failure; escrow restored.
  kTransferFailed,

  // Royalty basis points outside [0, 10000].
  kInvalidRoyaltyRate,

  // Escrow credit would exceed the Amount range.
  kBalanceOverflow,
};

const char* LedgerErrorToString(LedgerError error);

// floor(payment * basis_points / 10000) without intermediate overflow.
Amount ComputeRoyaltyShare(Amount payment, uint32_t basis_points);

// =============================================================================
// Records
// =============================================================================

struct Creator {
  CreatorId id = kNoCreator;
  std::string identity;
  std::string name;
  std::string profile_ref;
};

struct Consumer {
  std::string identity;
  std::string name;
  std::string profile_ref;
};

// Read-only snapshot of an AccessGate.
struct GateInfo {
  WorkId work_id = kNoWork;
  Amount unit_price = 0;
  CreatorId owner_creator_id = kNoCreator;
  std::string owner_identity;
  Amount escrow_balance = 0;
  uint32_t royalty_basis_points = kDefaultRoyaltyBasisPoints;
  uint64_t granted_count = 0;
  uint64_t issued_count = 0;
  Amount total_royalty_accrued = 0;
  Amount total_royalty_paid = 0;
};

// Read-only snapshot of a published work and its gate.
struct Work {
  WorkId id = kNoWork;
  CreatorId creator_id = kNoCreator;
  std::string creator_identity;
  std::string title;
  std::string audio_ref;   // Opaque; resolved by the media host
  std::string cover_ref;   // Opaque; resolved by the media host
  uint64_t play_count = 0;
  GateInfo gate;
};

struct PlayRecord {
  WorkId work_id = kNoWork;
  std::string consumer_identity;
  uint64_t sequence = 0;      // Ledger-wide play counter, starts at 1
  int64_t played_utc_ms = 0;
};

struct LedgerStats {
  uint64_t creators = 0;
  uint64_t consumers = 0;
  uint64_t active_consumers = 0;  // Identities with at least one recorded play
  uint64_t works = 0;
  uint64_t plays = 0;
  uint64_t grants = 0;
};

}  // namespace tuneledger::ledger

#endif  // TUNELEDGER_LEDGER_LEDGER_TYPES_HPP_
