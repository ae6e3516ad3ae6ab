// Repository: TuneLedger
// Component: Streaming Ledger Implementation
// Copyright (c) 2026 TuneLedger

#include "tuneledger/ledger/StreamingLedger.hpp"

#include <stdexcept>

#include "evidence/EvidenceEmitter.hpp"
#include "tuneledger/util/Logger.hpp"

namespace tuneledger::ledger {

using util::LogLine;
using util::Logger;

namespace {

const LedgerConfig& ValidatedConfig(const LedgerConfig& config) {
  std::string error;
  if (!config.IsValid(&error)) {
    throw std::invalid_argument("StreamingLedger: invalid config: " + error);
  }
  return config;
}

}  // namespace

StreamingLedger::StreamingLedger(LedgerConfig config,
                                 std::shared_ptr<evidence::EvidenceEmitter> emitter,
                                 std::shared_ptr<IPaymentTransfer> transfer)
    : config_(ValidatedConfig(config)),
      emitter_(std::move(emitter)),
      transfer_(std::move(transfer)),
      registry_(emitter_),
      catalog_(registry_, emitter_, config_.default_royalty_basis_points) {
  Logger::Info(LogLine("StreamingLedger", "LEDGER_OPENED")
                   .Kv("ledger", config_.ledger_id)
                   .Kv("royalty_bp", config_.default_royalty_basis_points)
                   .Kv("require_registered_consumer",
                       config_.require_registered_consumer ? "true" : "false")
                   .Kv("transfer", transfer_ ? "configured" : "none")
                   .str());
}

StreamingLedger::~StreamingLedger() = default;

StreamingLedger::RegisterResult StreamingLedger::RegisterCreator(
    const std::string& identity, const std::string& name, const std::string& profile_ref) {
  evidence::EvidenceEmitter::DeferredDelivery deliver(emitter_.get());
  std::lock_guard<std::mutex> lock(mutex_);
  return registry_.RegisterCreator(identity, name, profile_ref);
}

StreamingLedger::RegisterResult StreamingLedger::RegisterConsumer(
    const std::string& identity, const std::string& name, const std::string& profile_ref) {
  evidence::EvidenceEmitter::DeferredDelivery deliver(emitter_.get());
  std::lock_guard<std::mutex> lock(mutex_);
  return registry_.RegisterConsumer(identity, name, profile_ref);
}

StreamingLedger::PublishResult StreamingLedger::Publish(
    const std::string& creator_identity,
    const std::string& title,
    const std::string& audio_ref,
    const std::string& cover_ref,
    Amount unit_price,
    std::optional<uint32_t> royalty_basis_points) {
  evidence::EvidenceEmitter::DeferredDelivery deliver(emitter_.get());
  std::lock_guard<std::mutex> lock(mutex_);
  return catalog_.Publish(creator_identity, title, audio_ref, cover_ref, unit_price,
                          royalty_basis_points);
}

StreamingLedger::StreamResult StreamingLedger::Stream(const std::string& consumer,
                                                      WorkId work_id,
                                                      Amount payment) {
  evidence::EvidenceEmitter::DeferredDelivery deliver(emitter_.get());
  std::lock_guard<std::mutex> lock(mutex_);

  AccessGate* gate = catalog_.MutableGate(work_id);
  if (gate == nullptr) {
    Logger::Warn(LogLine("StreamingLedger", "STREAM_REJECTED")
                     .Kv("consumer", consumer)
                     .Kv("work_id", work_id)
                     .Kv("error", LedgerErrorToString(LedgerError::kWorkNotFound))
                     .str());
    return StreamResult::Failure(LedgerError::kWorkNotFound);
  }

  if (config_.require_registered_consumer && !registry_.IsRegisteredConsumer(consumer)) {
    Logger::Warn(LogLine("StreamingLedger", "STREAM_REJECTED")
                     .Kv("consumer", consumer)
                     .Kv("work_id", work_id)
                     .Kv("error", LedgerErrorToString(LedgerError::kNotRegisteredConsumer))
                     .str());
    return StreamResult::Failure(LedgerError::kNotRegisteredConsumer);
  }

  const LedgerError denied = gate->CheckAccess(consumer, payment);
  if (denied != LedgerError::kNone) {
    Logger::Warn(LogLine("StreamingLedger", "STREAM_REJECTED")
                     .Kv("consumer", consumer)
                     .Kv("work_id", work_id)
                     .Kv("payment", payment)
                     .Kv("unit_price", gate->unit_price())
                     .Kv("error", LedgerErrorToString(denied))
                     .str());
    return StreamResult::Failure(denied);
  }

  // The audio ref and the play record storage are taken before the gate
  // settles, so once payment is taken the remaining steps cannot fail.
  std::string audio_ref = catalog_.GetWork(work_id).work.audio_ref;
  auto& history = play_history_[consumer];
  history.reserve(history.size() + 1);

  AccessGate::AccessResult access = gate->RequestAccess(consumer, payment);
  if (!access.granted) {
    if (history.empty()) play_history_.erase(consumer);
    return StreamResult::Failure(access.error);
  }

  const uint64_t play_count = catalog_.RecordPlay(work_id);
  const uint64_t sequence = ++play_sequence_;
  PlayRecord record;
  record.work_id = work_id;
  record.consumer_identity = consumer;
  record.sequence = sequence;
  record.played_utc_ms = evidence::EvidenceEmitter::NowUtcMs();
  history.push_back(std::move(record));

  Logger::Debug(LogLine("StreamingLedger", "WORK_PLAYED")
                    .Kv("consumer", consumer)
                    .Kv("work_id", work_id)
                    .Kv("settled", access.settled ? "true" : "false")
                    .Kv("royalty_share", access.royalty_share)
                    .Kv("play_count", play_count)
                    .Kv("seq", sequence)
                    .str());
  if (emitter_) {
    evidence::WorkPlayedPayload p;
    p.work_id = work_id;
    p.consumer_identity = consumer;
    p.play_sequence = sequence;
    p.play_count = play_count;
    emitter_->EmitWorkPlayed(p);
  }

  return StreamResult::Success(std::move(audio_ref), access.settled,
                               access.royalty_share, sequence);
}

StreamingLedger::WithdrawResult StreamingLedger::WithdrawEscrow(const std::string& caller,
                                                                WorkId work_id) {
  evidence::EvidenceEmitter::DeferredDelivery deliver(emitter_.get());
  std::lock_guard<std::mutex> lock(mutex_);

  AccessGate* gate = catalog_.MutableGate(work_id);
  if (gate == nullptr) {
    Logger::Warn(LogLine("StreamingLedger", "WITHDRAW_REJECTED")
                     .Kv("caller", caller)
                     .Kv("work_id", work_id)
                     .Kv("error", LedgerErrorToString(LedgerError::kWorkNotFound))
                     .str());
    return WithdrawResult::Failure(LedgerError::kWorkNotFound);
  }

  const LedgerError precondition = gate->CheckWithdraw(caller);
  if (precondition != LedgerError::kNone) {
    Logger::Warn(LogLine("StreamingLedger", "WITHDRAW_REJECTED")
                     .Kv("caller", caller)
                     .Kv("work_id", work_id)
                     .Kv("error", LedgerErrorToString(precondition))
                     .str());
    return WithdrawResult::Failure(precondition);
  }

  if (!transfer_) {
    Logger::Error(LogLine("StreamingLedger", "WITHDRAW_FAILED")
                      .Kv("caller", caller)
                      .Kv("work_id", work_id)
                      .Kv("error", LedgerErrorToString(LedgerError::kTransferFailed))
                      .Kv("detail", "no payment transfer configured")
                      .str());
    return WithdrawResult::Failure(LedgerError::kTransferFailed,
                                   "no payment transfer configured");
  }

  WithdrawResult result = gate->WithdrawEscrow(caller, *transfer_);
  if (result.success) {
    Logger::Info(LogLine("StreamingLedger", "ESCROW_WITHDRAWN")
                     .Kv("caller", caller)
                     .Kv("work_id", work_id)
                     .Kv("amount", result.amount)
                     .str());
  } else {
    Logger::Error(LogLine("StreamingLedger", "WITHDRAW_FAILED")
                      .Kv("caller", caller)
                      .Kv("work_id", work_id)
                      .Kv("error", LedgerErrorToString(result.error))
                      .Kv("detail", result.detail)
                      .str());
  }
  return result;
}

std::vector<Work> StreamingLedger::AllWorks() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return catalog_.ListAll();
}

std::vector<Work> StreamingLedger::WorksByCreator(const std::string& creator_identity) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return catalog_.ListByCreator(creator_identity);
}

std::vector<PlayRecord> StreamingLedger::PlayHistory(const std::string& consumer) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = play_history_.find(consumer);
  if (it == play_history_.end()) return {};
  return it->second;
}

StreamingLedger::WorkResult StreamingLedger::GetWork(WorkId work_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return catalog_.GetWork(work_id);
}

bool StreamingLedger::HasAccess(const std::string& consumer, WorkId work_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const AccessGate* gate = catalog_.Gate(work_id);
  return gate != nullptr && gate->HasGrant(consumer);
}

LedgerStats StreamingLedger::Stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  LedgerStats stats;
  stats.creators = registry_.CreatorCount();
  stats.consumers = registry_.ConsumerCount();
  stats.active_consumers = play_history_.size();
  stats.works = catalog_.Size();
  stats.plays = play_sequence_;
  stats.grants = catalog_.TotalGrants();
  return stats;
}

std::optional<Creator> StreamingLedger::FindCreator(const std::string& identity) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return registry_.FindCreator(identity);
}

std::optional<Consumer> StreamingLedger::FindConsumer(const std::string& identity) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return registry_.FindConsumer(identity);
}

bool StreamingLedger::IsRegisteredCreator(const std::string& identity) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return registry_.IsRegisteredCreator(identity);
}

bool StreamingLedger::IsRegisteredConsumer(const std::string& identity) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return registry_.IsRegisteredConsumer(identity);
}

}  // namespace tuneledger::ledger
