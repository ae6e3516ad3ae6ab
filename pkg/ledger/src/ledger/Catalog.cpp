// Repository: TuneLedger
// Component: Catalog Implementation
// Copyright (c) 2026 TuneLedger

#include "tuneledger/ledger/Catalog.hpp"

#include <stdexcept>

#include "evidence/EvidenceEmitter.hpp"
#include "tuneledger/util/Logger.hpp"

namespace tuneledger::ledger {

using util::LogLine;
using util::Logger;

Catalog::Catalog(const IdentityRegistry& registry,
                 std::shared_ptr<evidence::EvidenceEmitter> emitter,
                 uint32_t default_royalty_basis_points)
    : registry_(registry),
      emitter_(std::move(emitter)),
      default_royalty_basis_points_(default_royalty_basis_points) {
  if (default_royalty_basis_points_ > kBasisPointsDenominator) {
    throw std::invalid_argument("Catalog: default royalty rate exceeds 10000 basis points");
  }
}

Catalog::PublishResult Catalog::Publish(const std::string& creator_identity,
                                        const std::string& title,
                                        const std::string& audio_ref,
                                        const std::string& cover_ref,
                                        Amount unit_price,
                                        std::optional<uint32_t> royalty_basis_points) {
  auto creator = registry_.FindCreator(creator_identity);
  if (!creator) {
    Logger::Warn(LogLine("Catalog", "PUBLISH_REJECTED")
                     .Kv("creator", creator_identity)
                     .Kv("error", LedgerErrorToString(LedgerError::kNotRegisteredCreator))
                     .str());
    return PublishResult::Failure(LedgerError::kNotRegisteredCreator);
  }

  const uint32_t bp = royalty_basis_points.value_or(default_royalty_basis_points_);
  if (bp > kBasisPointsDenominator) {
    Logger::Warn(LogLine("Catalog", "PUBLISH_REJECTED")
                     .Kv("creator", creator_identity)
                     .Kv("royalty_bp", bp)
                     .Kv("error", LedgerErrorToString(LedgerError::kInvalidRoyaltyRate))
                     .str());
    return PublishResult::Failure(LedgerError::kInvalidRoyaltyRate);
  }

  const WorkId id = last_work_id_ + 1;

  WorkRecord record;
  record.meta.id = id;
  record.meta.creator_id = creator->id;
  record.meta.creator_identity = creator_identity;
  record.meta.title = title;
  record.meta.audio_ref = audio_ref;
  record.meta.cover_ref = cover_ref;
  record.gate = std::make_unique<AccessGate>(id, creator->id, creator_identity,
                                             unit_price, bp, emitter_);

  // Reserve index slots first so the inserts below cannot leave a
  // half-registered work behind.
  auto& by_creator = works_by_creator_[creator_identity];
  by_creator.reserve(by_creator.size() + 1);
  all_work_ids_.reserve(all_work_ids_.size() + 1);

  works_.emplace(id, std::move(record));
  all_work_ids_.push_back(id);
  by_creator.push_back(id);
  last_work_id_ = id;

  Logger::Info(LogLine("Catalog", "WORK_PUBLISHED")
                   .Kv("work_id", id)
                   .Kv("creator", creator_identity)
                   .Kv("unit_price", unit_price)
                   .Kv("royalty_bp", bp)
                   .str());
  if (emitter_) {
    evidence::WorkPublishedPayload p;
    p.work_id = id;
    p.creator_identity = creator_identity;
    p.title = title;
    p.unit_price = unit_price;
    p.royalty_basis_points = bp;
    emitter_->EmitWorkPublished(p);
  }
  return PublishResult::Success(id);
}

Work Catalog::Snapshot(const WorkRecord& record) const {
  Work w = record.meta;
  w.gate = record.gate->Info();
  return w;
}

Catalog::WorkResult Catalog::GetWork(WorkId work_id) const {
  auto it = works_.find(work_id);
  if (it == works_.end()) {
    return WorkResult::Failure(LedgerError::kWorkNotFound);
  }
  return WorkResult::Success(Snapshot(it->second));
}

std::vector<Work> Catalog::ListAll() const {
  std::vector<Work> out;
  out.reserve(all_work_ids_.size());
  for (WorkId id : all_work_ids_) {
    out.push_back(Snapshot(works_.at(id)));
  }
  return out;
}

std::vector<Work> Catalog::ListByCreator(const std::string& creator_identity) const {
  std::vector<Work> out;
  auto it = works_by_creator_.find(creator_identity);
  if (it == works_by_creator_.end()) return out;
  out.reserve(it->second.size());
  for (WorkId id : it->second) {
    out.push_back(Snapshot(works_.at(id)));
  }
  return out;
}

AccessGate* Catalog::MutableGate(WorkId work_id) {
  auto it = works_.find(work_id);
  return it == works_.end() ? nullptr : it->second.gate.get();
}

const AccessGate* Catalog::Gate(WorkId work_id) const {
  auto it = works_.find(work_id);
  return it == works_.end() ? nullptr : it->second.gate.get();
}

uint64_t Catalog::RecordPlay(WorkId work_id) {
  auto it = works_.find(work_id);
  if (it == works_.end()) return 0;
  return ++it->second.meta.play_count;
}

uint64_t Catalog::TotalGrants() const {
  uint64_t total = 0;
  for (const auto& entry : works_) {
    total += entry.second.gate->issued_count();
  }
  return total;
}

}  // namespace tuneledger::ledger
