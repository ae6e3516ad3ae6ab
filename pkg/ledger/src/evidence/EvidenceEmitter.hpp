// Repository: TuneLedger
// Component: Ledger evidence emitter (wraps ledger events, appends to spool)
// Purpose: Observability/indexing feed for registrations, publications,
//          settlements, payouts and plays.
// Copyright (c) 2026 TuneLedger

#pragma once

#include "evidence/EvidenceSpool.hpp"
#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace tuneledger::evidence {

// Payload type names (wire-compatible with ledger_evidence_v1.proto oneof).
inline constexpr const char* kCreatorRegistered = "CREATOR_REGISTERED";
inline constexpr const char* kConsumerRegistered = "CONSUMER_REGISTERED";
inline constexpr const char* kWorkPublished = "WORK_PUBLISHED";
inline constexpr const char* kRoyaltyAccrued = "ROYALTY_ACCRUED";
inline constexpr const char* kGrantIssued = "GRANT_ISSUED";
inline constexpr const char* kRoyaltyPaid = "ROYALTY_PAID";
inline constexpr const char* kWorkPlayed = "WORK_PLAYED";

// Payload parameter structs (mirror of proto messages).
struct CreatorRegisteredPayload {
  std::string identity;
  std::string name;
  uint64_t creator_id = 0;
};

struct ConsumerRegisteredPayload {
  std::string identity;
  std::string name;
};

struct WorkPublishedPayload {
  uint64_t work_id = 0;
  std::string creator_identity;
  std::string title;
  uint64_t unit_price = 0;
  uint32_t royalty_basis_points = 0;
};

struct RoyaltyAccruedPayload {
  uint64_t work_id = 0;
  std::string consumer_identity;
  uint64_t payment = 0;
  uint64_t royalty_share = 0;
  uint64_t escrow_balance = 0;   // Balance after the credit
};

struct GrantIssuedPayload {
  uint64_t work_id = 0;
  std::string consumer_identity;
  uint64_t grant_serial = 0;
};

struct RoyaltyPaidPayload {
  uint64_t work_id = 0;
  std::string owner_identity;
  uint64_t amount = 0;
};

struct WorkPlayedPayload {
  uint64_t work_id = 0;
  std::string consumer_identity;
  uint64_t play_sequence = 0;
  uint64_t play_count = 0;
};

// Emits ledger events: assigns sequence, UUID, UTC and CRC, appends to the
// spool (when one is attached) and hands the envelope to every listener.
// Emission never fails a ledger operation: if the spool is full or broken
// the emitter enters degraded mode, logs once, and keeps notifying listeners.
//
// Envelopes are queued in sequence order and delivered to listeners outside
// emit_mutex_, one deliverer at a time. While a DeferredDelivery for this
// emitter is alive on the emitting thread, delivery waits until that scope
// ends. StreamingLedger opens one around its lock, so listeners run after the
// ledger mutex is released and may read the ledger.
class EvidenceEmitter {
 public:
  using Listener = std::function<void(const LedgerEvidence&)>;

  // Holds back listener delivery for `emitter` on the current thread until
  // destruction. Nests. A null emitter makes this a no-op.
  class DeferredDelivery {
   public:
    explicit DeferredDelivery(EvidenceEmitter* emitter);
    ~DeferredDelivery();

    DeferredDelivery(const DeferredDelivery&) = delete;
    DeferredDelivery& operator=(const DeferredDelivery&) = delete;

   private:
    EvidenceEmitter* emitter_;
  };

  explicit EvidenceEmitter(std::string ledger_id,
                           std::shared_ptr<EvidenceSpool> spool = nullptr);

  EvidenceEmitter(const EvidenceEmitter&) = delete;
  EvidenceEmitter& operator=(const EvidenceEmitter&) = delete;

  // Listeners run on a thread that emitted, after its deferral scope (if any)
  // has closed, in sequence order.
  void AddListener(Listener listener);

  // Hands queued envelopes to the listeners. Returns immediately when another
  // thread is delivering (it drains the queue) or when called from a listener.
  void DeliverPending();

  void EmitCreatorRegistered(const CreatorRegisteredPayload& p);
  void EmitConsumerRegistered(const ConsumerRegisteredPayload& p);
  void EmitWorkPublished(const WorkPublishedPayload& p);
  void EmitRoyaltyAccrued(const RoyaltyAccruedPayload& p);
  void EmitGrantIssued(const GrantIssuedPayload& p);
  void EmitRoyaltyPaid(const RoyaltyPaidPayload& p);
  void EmitWorkPlayed(const WorkPlayedPayload& p);

  // Returns current epoch ms (UTC).
  static int64_t NowUtcMs();

  uint64_t CurrentSequence() const { return sequence_.load(std::memory_order_relaxed); }
  bool IsDegraded() const { return degraded_.load(std::memory_order_relaxed); }
  const std::string& LedgerId() const { return ledger_id_; }

 private:
  void Dispatch(const std::string& payload_type, const std::string& payload_json);
  LedgerEvidence MakeEnvelope(const std::string& payload_type, const std::string& payload_json);
  void Enqueue(LedgerEvidence msg);  // Requires emit_mutex_; spool append + queue
  static std::string NowUtcIso8601();
  static std::string GenerateUuidV4();

  std::string ledger_id_;
  std::shared_ptr<EvidenceSpool> spool_;

  bool IsDeferredOnThisThread() const;

  std::mutex emit_mutex_;  // Keeps sequence assignment and spool order identical
  std::vector<Listener> listeners_;
  std::deque<LedgerEvidence> pending_;  // Guarded by emit_mutex_

  std::mutex deliver_mutex_;
  std::atomic<std::thread::id> deliverer_{};
  std::atomic<uint64_t> sequence_{0};
  std::atomic<bool> degraded_{false};
};

}  // namespace tuneledger::evidence
