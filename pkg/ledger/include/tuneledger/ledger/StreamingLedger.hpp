// Repository: TuneLedger
// Component: Streaming Ledger
// Purpose: Top-level orchestrator. Serializes every operation on the
//          registry, catalog and gates behind one mutex.
// Copyright (c) 2026 TuneLedger

#ifndef TUNELEDGER_LEDGER_STREAMING_LEDGER_HPP_
#define TUNELEDGER_LEDGER_STREAMING_LEDGER_HPP_

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "tuneledger/ledger/Catalog.hpp"
#include "tuneledger/ledger/IPaymentTransfer.hpp"
#include "tuneledger/ledger/IdentityRegistry.hpp"
#include "tuneledger/ledger/LedgerConfig.hpp"
#include "tuneledger/ledger/LedgerTypes.hpp"

namespace tuneledger::evidence {
class EvidenceEmitter;
}

namespace tuneledger::ledger {

// StreamingLedger
//
// Every public method takes mutex_ and runs to completion, including the
// payment transfer during WithdrawEscrow. Two concurrent first-time streams
// of the same work by the same consumer therefore settle exactly once, and
// a withdrawal's rollback can never interleave with a settlement.
//
// The ledger owns its registry and catalog. The emitter and the payment
// transfer are shared with the caller (the harness or a test).
//
// Events are spooled under mutex_ but handed to emitter listeners only after
// mutex_ is released, so a listener may call back into the ledger.
class StreamingLedger {
 public:
  struct StreamResult {
    bool success;
    LedgerError error;
    std::string audio_ref;
    bool settled;            // this call paid for access
    Amount royalty_share;    // credited to escrow by this call
    uint64_t play_sequence;  // ledger-wide play number

    static StreamResult Success(std::string audio_ref, bool settled,
                                Amount share, uint64_t sequence) {
      return {true, LedgerError::kNone, std::move(audio_ref), settled, share, sequence};
    }
    static StreamResult Failure(LedgerError err) {
      return {false, err, "", false, 0, 0};
    }
  };

  using RegisterResult = IdentityRegistry::RegisterResult;
  using PublishResult = Catalog::PublishResult;
  using WorkResult = Catalog::WorkResult;
  using WithdrawResult = AccessGate::WithdrawResult;

  // Throws std::invalid_argument if config.IsValid() is false.
  explicit StreamingLedger(LedgerConfig config = LedgerConfig{},
                           std::shared_ptr<evidence::EvidenceEmitter> emitter = nullptr,
                           std::shared_ptr<IPaymentTransfer> transfer = nullptr);
  ~StreamingLedger();

  StreamingLedger(const StreamingLedger&) = delete;
  StreamingLedger& operator=(const StreamingLedger&) = delete;

  RegisterResult RegisterCreator(const std::string& identity,
                                 const std::string& name,
                                 const std::string& profile_ref);
  RegisterResult RegisterConsumer(const std::string& identity,
                                  const std::string& name,
                                  const std::string& profile_ref);

  PublishResult Publish(const std::string& creator_identity,
                        const std::string& title,
                        const std::string& audio_ref,
                        const std::string& cover_ref,
                        Amount unit_price,
                        std::optional<uint32_t> royalty_basis_points = std::nullopt);

  // Grants access on first sufficient payment, then records a play. Later
  // streams by the same consumer need no payment. On failure nothing changes.
  StreamResult Stream(const std::string& consumer, WorkId work_id, Amount payment);

  // Pays the work's full escrow to its creator through the configured
  // IPaymentTransfer. kNotOwner and kNothingToWithdraw are checked first;
  // then kTransferFailed if no transfer is configured. Exceptions from the
  // transfer propagate after the escrow has been restored.
  WithdrawResult WithdrawEscrow(const std::string& caller, WorkId work_id);

  // Reads. Snapshots are copies, safe to keep after the lock is released.
  std::vector<Work> AllWorks() const;
  std::vector<Work> WorksByCreator(const std::string& creator_identity) const;
  std::vector<PlayRecord> PlayHistory(const std::string& consumer) const;
  WorkResult GetWork(WorkId work_id) const;
  bool HasAccess(const std::string& consumer, WorkId work_id) const;
  LedgerStats Stats() const;

  std::optional<Creator> FindCreator(const std::string& identity) const;
  std::optional<Consumer> FindConsumer(const std::string& identity) const;
  bool IsRegisteredCreator(const std::string& identity) const;
  bool IsRegisteredConsumer(const std::string& identity) const;

  const LedgerConfig& config() const { return config_; }

 private:
  const LedgerConfig config_;
  std::shared_ptr<evidence::EvidenceEmitter> emitter_;
  std::shared_ptr<IPaymentTransfer> transfer_;

  mutable std::mutex mutex_;
  IdentityRegistry registry_;
  Catalog catalog_;

  // consumer identity -> plays in order
  std::unordered_map<std::string, std::vector<PlayRecord>> play_history_;
  uint64_t play_sequence_ = 0;
};

}  // namespace tuneledger::ledger

#endif  // TUNELEDGER_LEDGER_STREAMING_LEDGER_HPP_
