// Repository: TuneLedger
// Component: Ledger evidence emitter implementation
// Copyright (c) 2026 TuneLedger

#include "evidence/EvidenceEmitter.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iterator>
#include <random>
#include <sstream>
#include <stdexcept>

#include "tuneledger/util/Logger.hpp"

namespace tuneledger::evidence {

namespace {

std::string JsonEscape(const std::string& s) {
  std::string out;
  out.reserve(s.size() + 8);
  for (char c : s) {
    if (c == '"') out += "\\\"";
    else if (c == '\\') out += "\\\\";
    else if (c == '\n') out += "\\n";
    else if (c == '\r') out += "\\r";
    else if (c == '\t') out += "\\t";
    else out += c;
  }
  return out;
}

const char* AppendStatusName(AppendStatus status) {
  switch (status) {
    case AppendStatus::kOk: return "OK";
    case AppendStatus::kSpoolFull: return "SPOOL_FULL";
    case AppendStatus::kWriteFailed: return "WRITE_FAILED";
  }
  return "UNKNOWN";
}

// Emitters whose delivery is held back on this thread, one entry per scope.
thread_local std::vector<const EvidenceEmitter*> t_deferred;

}  // namespace

EvidenceEmitter::DeferredDelivery::DeferredDelivery(EvidenceEmitter* emitter)
    : emitter_(emitter) {
  if (emitter_) t_deferred.push_back(emitter_);
}

EvidenceEmitter::DeferredDelivery::~DeferredDelivery() {
  if (!emitter_) return;
  for (auto it = t_deferred.rbegin(); it != t_deferred.rend(); ++it) {
    if (*it == emitter_) {
      t_deferred.erase(std::next(it).base());
      break;
    }
  }
  if (!emitter_->IsDeferredOnThisThread()) {
    emitter_->DeliverPending();
  }
}

bool EvidenceEmitter::IsDeferredOnThisThread() const {
  return std::find(t_deferred.begin(), t_deferred.end(), this) != t_deferred.end();
}

EvidenceEmitter::EvidenceEmitter(std::string ledger_id,
                                 std::shared_ptr<EvidenceSpool> spool)
    : ledger_id_(std::move(ledger_id)),
      spool_(std::move(spool)) {
  // Continue the on-disk sequence so a restarted ledger never reuses numbers.
  if (spool_) {
    sequence_.store(spool_->LastSpooledSequence(), std::memory_order_relaxed);
  }
}

void EvidenceEmitter::AddListener(Listener listener) {
  std::lock_guard<std::mutex> lock(emit_mutex_);
  listeners_.push_back(std::move(listener));
}

int64_t EvidenceEmitter::NowUtcMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string EvidenceEmitter::NowUtcIso8601() {
  auto ms = NowUtcMs();
  time_t s = static_cast<time_t>(ms / 1000);
  int frac_ms = static_cast<int>(ms % 1000);
  struct tm tm;
  if (gmtime_r(&s, &tm) == nullptr) return "";
  char buf[64];
  int n = snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                   tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                   tm.tm_hour, tm.tm_min, tm.tm_sec, frac_ms);
  if (n <= 0 || n >= static_cast<int>(sizeof(buf))) return "";
  return std::string(buf, static_cast<size_t>(n));
}

std::string EvidenceEmitter::GenerateUuidV4() {
  static thread_local std::random_device rd;
  static thread_local std::mt19937 gen(rd());
  static thread_local std::uniform_int_distribution<int> dis(0, 15);
  const char* hexdig = "0123456789abcdef";
  std::string out;
  out.reserve(36);
  for (int i = 0; i < 32; ++i) {
    if (i == 8 || i == 12 || i == 16 || i == 20) out += '-';
    if (i == 12) out += '4';
    else if (i == 16) out += hexdig[8 + dis(gen) % 4];
    else out += hexdig[dis(gen)];
  }
  return out;
}

LedgerEvidence EvidenceEmitter::MakeEnvelope(const std::string& payload_type,
                                             const std::string& payload_json) {
  LedgerEvidence msg;
  msg.schema_version = LedgerEvidence::kSchemaVersion;
  msg.ledger_id = ledger_id_;
  msg.sequence = sequence_.fetch_add(1, std::memory_order_relaxed) + 1;
  msg.event_uuid = GenerateUuidV4();
  msg.emitted_utc = NowUtcIso8601();
  msg.payload_type = payload_type;
  msg.payload = payload_json.empty() ? "{}" : payload_json;
  msg.payload_crc32 = LedgerEvidence::ChecksumOf(msg.payload);
  return msg;
}

void EvidenceEmitter::Dispatch(const std::string& payload_type,
                               const std::string& payload_json) {
  {
    std::lock_guard<std::mutex> lock(emit_mutex_);
    Enqueue(MakeEnvelope(payload_type, payload_json));
  }
  if (!IsDeferredOnThisThread()) {
    DeliverPending();
  }
}

void EvidenceEmitter::Enqueue(LedgerEvidence msg) {
  if (spool_) {
    auto status = spool_->Append(msg);
    if (status != AppendStatus::kOk) {
      if (!degraded_.exchange(true)) {
        util::Logger::Error(util::LogLine("EvidenceEmitter", "EVIDENCE_DEGRADED_MODE_ENTERED")
                                .Kv("ledger", ledger_id_)
                                .Kv("seq", msg.sequence)
                                .Kv("status", AppendStatusName(status))
                                .str());
      }
    } else if (degraded_.exchange(false)) {
      util::Logger::Warn(util::LogLine("EvidenceEmitter", "EVIDENCE_DEGRADED_MODE_EXITED")
                             .Kv("ledger", ledger_id_)
                             .Kv("seq", msg.sequence)
                             .str());
    }
  }

  pending_.push_back(std::move(msg));
}

void EvidenceEmitter::DeliverPending() {
  const auto self = std::this_thread::get_id();
  if (deliverer_.load() == self) return;  // Listener emitted; outer loop drains

  for (;;) {
    std::unique_lock<std::mutex> deliver_lock(deliver_mutex_, std::try_to_lock);
    if (!deliver_lock.owns_lock()) return;
    deliverer_.store(self);

    for (;;) {
      std::deque<LedgerEvidence> batch;
      std::vector<Listener> listeners;
      {
        std::lock_guard<std::mutex> lock(emit_mutex_);
        if (pending_.empty()) break;
        batch.swap(pending_);
        listeners = listeners_;
      }
      // A failing listener must not undo a committed ledger operation.
      for (const auto& msg : batch) {
        for (const auto& listener : listeners) {
          try {
            listener(msg);
          } catch (const std::exception& e) {
            util::Logger::Error(util::LogLine("EvidenceEmitter", "LISTENER_FAILED")
                                    .Kv("ledger", ledger_id_)
                                    .Kv("seq", msg.sequence)
                                    .Kv("type", msg.payload_type)
                                    .Kv("what", e.what())
                                    .str());
          }
        }
      }
    }

    deliverer_.store(std::thread::id());
    deliver_lock.unlock();

    // An envelope queued while the lock was being released has no deliverer.
    std::lock_guard<std::mutex> lock(emit_mutex_);
    if (pending_.empty()) return;
  }
}

void EvidenceEmitter::EmitCreatorRegistered(const CreatorRegisteredPayload& p) {
  std::ostringstream o;
  o << "{\"identity\":\"" << JsonEscape(p.identity) << "\""
    << ",\"name\":\"" << JsonEscape(p.name) << "\""
    << ",\"creator_id\":" << p.creator_id << "}";
  Dispatch(kCreatorRegistered, o.str());
}

void EvidenceEmitter::EmitConsumerRegistered(const ConsumerRegisteredPayload& p) {
  std::ostringstream o;
  o << "{\"identity\":\"" << JsonEscape(p.identity) << "\""
    << ",\"name\":\"" << JsonEscape(p.name) << "\"}";
  Dispatch(kConsumerRegistered, o.str());
}

void EvidenceEmitter::EmitWorkPublished(const WorkPublishedPayload& p) {
  std::ostringstream o;
  o << "{\"work_id\":" << p.work_id
    << ",\"creator_identity\":\"" << JsonEscape(p.creator_identity) << "\""
    << ",\"title\":\"" << JsonEscape(p.title) << "\""
    << ",\"unit_price\":" << p.unit_price
    << ",\"royalty_basis_points\":" << p.royalty_basis_points << "}";
  Dispatch(kWorkPublished, o.str());
}

void EvidenceEmitter::EmitRoyaltyAccrued(const RoyaltyAccruedPayload& p) {
  std::ostringstream o;
  o << "{\"work_id\":" << p.work_id
    << ",\"consumer_identity\":\"" << JsonEscape(p.consumer_identity) << "\""
    << ",\"payment\":" << p.payment
    << ",\"royalty_share\":" << p.royalty_share
    << ",\"escrow_balance\":" << p.escrow_balance << "}";
  Dispatch(kRoyaltyAccrued, o.str());
}

void EvidenceEmitter::EmitGrantIssued(const GrantIssuedPayload& p) {
  std::ostringstream o;
  o << "{\"work_id\":" << p.work_id
    << ",\"consumer_identity\":\"" << JsonEscape(p.consumer_identity) << "\""
    << ",\"grant_serial\":" << p.grant_serial << "}";
  Dispatch(kGrantIssued, o.str());
}

void EvidenceEmitter::EmitRoyaltyPaid(const RoyaltyPaidPayload& p) {
  std::ostringstream o;
  o << "{\"work_id\":" << p.work_id
    << ",\"owner_identity\":\"" << JsonEscape(p.owner_identity) << "\""
    << ",\"amount\":" << p.amount << "}";
  Dispatch(kRoyaltyPaid, o.str());
}

void EvidenceEmitter::EmitWorkPlayed(const WorkPlayedPayload& p) {
  std::ostringstream o;
  o << "{\"work_id\":" << p.work_id
    << ",\"consumer_identity\":\"" << JsonEscape(p.consumer_identity) << "\""
    << ",\"play_sequence\":" << p.play_sequence
    << ",\"play_count\":" << p.play_count << "}";
  Dispatch(kWorkPlayed, o.str());
}

}  // namespace tuneledger::evidence
