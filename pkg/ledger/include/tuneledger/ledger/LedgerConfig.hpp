// Repository: TuneLedger
// Component: Ledger Configuration
// Purpose: Configuration structure for StreamingLedger.
// Copyright (c) 2026 TuneLedger

#ifndef TUNELEDGER_LEDGER_LEDGER_CONFIG_HPP_
#define TUNELEDGER_LEDGER_LEDGER_CONFIG_HPP_

#include <cstdint>
#include <string>

#include "tuneledger/ledger/LedgerTypes.hpp"

namespace tuneledger::ledger {

// POD struct - immutable after the ledger is constructed
struct LedgerConfig {
  std::string ledger_id = "default";   // Names the event stream and spool files
  uint32_t default_royalty_basis_points = kDefaultRoyaltyBasisPoints;  // Gate rate when Publish gives none
  bool require_registered_consumer = false;  // Stream rejects unknown consumers when set

  // Returns false and fills *error (if non-null) when a field is out of range.
  bool IsValid(std::string* error = nullptr) const {
    if (ledger_id.empty()) {
      if (error) *error = "ledger_id must not be empty";
      return false;
    }
    if (ledger_id.find('/') != std::string::npos) {
      if (error) *error = "ledger_id must not contain '/'";
      return false;
    }
    if (default_royalty_basis_points > kBasisPointsDenominator) {
      if (error) {
        *error = "default_royalty_basis_points " +
                 std::to_string(default_royalty_basis_points) + " exceeds " +
                 std::to_string(kBasisPointsDenominator);
      }
      return false;
    }
    return true;
  }
};

}  // namespace tuneledger::ledger

#endif  // TUNELEDGER_LEDGER_LEDGER_CONFIG_HPP_
