// Repository: TuneLedger
// Component: Catalog
// Purpose: Published works, each bound to its own AccessGate.
// Copyright (c) 2026 TuneLedger

#ifndef TUNELEDGER_LEDGER_CATALOG_HPP_
#define TUNELEDGER_LEDGER_CATALOG_HPP_

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "tuneledger/ledger/AccessGate.hpp"
#include "tuneledger/ledger/IdentityRegistry.hpp"
#include "tuneledger/ledger/LedgerTypes.hpp"

namespace tuneledger::ledger {

// Catalog
//
// Work ids come from one counter shared by all creators: 1, 2, 3, ... in
// publish order, 0 never issued. A work and its gate are created together and
// live for the catalog's lifetime. Listings keep insertion order.
//
// Not thread-safe. StreamingLedger serializes all access.
class Catalog {
 public:
  Catalog(const IdentityRegistry& registry,
          std::shared_ptr<evidence::EvidenceEmitter> emitter = nullptr,
          uint32_t default_royalty_basis_points = kDefaultRoyaltyBasisPoints);

  Catalog(const Catalog&) = delete;
  Catalog& operator=(const Catalog&) = delete;

  struct PublishResult {
    bool success;
    LedgerError error;
    WorkId work_id;

    static PublishResult Success(WorkId id) { return {true, LedgerError::kNone, id}; }
    static PublishResult Failure(LedgerError err) { return {false, err, kNoWork}; }
  };

  struct WorkResult {
    bool success;
    LedgerError error;
    Work work;

    static WorkResult Success(Work w) { return {true, LedgerError::kNone, std::move(w)}; }
    static WorkResult Failure(LedgerError err) { return {false, err, Work{}}; }
  };

  // kNotRegisteredCreator if creator_identity has no creator record.
  // kInvalidRoyaltyRate if royalty_basis_points is given and exceeds 10000.
  // Emits WORK_PUBLISHED.
  PublishResult Publish(const std::string& creator_identity,
                        const std::string& title,
                        const std::string& audio_ref,
                        const std::string& cover_ref,
                        Amount unit_price,
                        std::optional<uint32_t> royalty_basis_points = std::nullopt);

  // kWorkNotFound for 0 or an id never assigned.
  WorkResult GetWork(WorkId work_id) const;

  std::vector<Work> ListAll() const;
  std::vector<Work> ListByCreator(const std::string& creator_identity) const;

  // nullptr when the work does not exist.
  AccessGate* MutableGate(WorkId work_id);
  const AccessGate* Gate(WorkId work_id) const;

  // Increments play_count; returns the new count (0 if the work is unknown).
  uint64_t RecordPlay(WorkId work_id);

  bool Contains(WorkId work_id) const { return works_.count(work_id) != 0; }
  size_t Size() const { return works_.size(); }
  uint64_t TotalGrants() const;

 private:
  struct WorkRecord {
    Work meta;  // gate field left default; filled from `gate` on snapshot
    std::unique_ptr<AccessGate> gate;
  };

  Work Snapshot(const WorkRecord& record) const;

  const IdentityRegistry& registry_;
  std::shared_ptr<evidence::EvidenceEmitter> emitter_;
  uint32_t default_royalty_basis_points_;

  std::unordered_map<WorkId, WorkRecord> works_;
  std::vector<WorkId> all_work_ids_;
  std::unordered_map<std::string, std::vector<WorkId>> works_by_creator_;
  WorkId last_work_id_ = kNoWork;
};

}  // namespace tuneledger::ledger

#endif  // TUNELEDGER_LEDGER_CATALOG_HPP_
