// Repository: TuneLedger
// Component: Ledger evidence gRPC exporter implementation
// Copyright (c) 2026 TuneLedger

#include "evidence/GrpcEvidenceClient.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <limits>
#include <stdexcept>

#include "tuneledger/util/Logger.hpp"

namespace tuneledger::evidence {

namespace proto = tuneledger::evidence::v1;

using util::LogLine;
using util::Logger;

namespace {

// Flat-object extractors for the payloads written by EvidenceEmitter.

bool ExtractString(const std::string& json, const std::string& key, std::string* out) {
  std::string search = "\"" + key + "\":\"";
  size_t start = json.find(search);
  if (start == std::string::npos) return false;
  start += search.size();
  out->clear();
  for (size_t i = start; i < json.size(); ++i) {
    if (json[i] == '\\' && i + 1 < json.size()) {
      char next = json[i + 1];
      if (next == '"')  { *out += '"';  i++; continue; }
      if (next == '\\') { *out += '\\'; i++; continue; }
      if (next == 'n')  { *out += '\n'; i++; continue; }
      if (next == 'r')  { *out += '\r'; i++; continue; }
      if (next == 't')  { *out += '\t'; i++; continue; }
    }
    if (json[i] == '"') return true;
    *out += json[i];
  }
  return false;
}

bool ExtractUint64(const std::string& json, const std::string& key, uint64_t* out) {
  std::string search = "\"" + key + "\":";
  size_t start = json.find(search);
  if (start == std::string::npos) return false;
  start += search.size();
  if (start >= json.size() || !std::isdigit(static_cast<unsigned char>(json[start]))) {
    return false;
  }
  constexpr uint64_t kMax = std::numeric_limits<uint64_t>::max();
  uint64_t v = 0;
  for (size_t i = start; i < json.size() && std::isdigit(static_cast<unsigned char>(json[i])); ++i) {
    uint64_t digit = static_cast<uint64_t>(json[i] - '0');
    if (v > (kMax - digit) / 10) return false;
    v = v * 10 + digit;
  }
  *out = v;
  return true;
}

bool ExtractUint32(const std::string& json, const std::string& key, uint32_t* out) {
  uint64_t v;
  if (!ExtractUint64(json, key, &v) || v > std::numeric_limits<uint32_t>::max()) return false;
  *out = static_cast<uint32_t>(v);
  return true;
}

}  // namespace

GrpcEvidenceClient::GrpcEvidenceClient(const std::string& target_address,
                                       std::shared_ptr<EvidenceSpool> spool)
    : target_address_(target_address),
      spool_(std::move(spool)) {
  if (!spool_) {
    throw std::invalid_argument("GrpcEvidenceClient: spool is required");
  }
  grpc_channel_ = grpc::CreateChannel(target_address_, grpc::InsecureChannelCredentials());
  stub_ = proto::LedgerEvidenceService::NewStub(grpc_channel_);

  last_acked_.store(spool_->GetLastAck(), std::memory_order_release);
  last_emitted_.store(spool_->LastSpooledSequence(), std::memory_order_relaxed);
  connection_thread_ = std::thread([this] { ConnectionLoop(); });
}

GrpcEvidenceClient::~GrpcEvidenceClient() {
  shutdown_.store(true, std::memory_order_release);
  {
    std::lock_guard<std::mutex> lock(context_mutex_);
    if (active_context_ != nullptr) active_context_->TryCancel();
  }
  queue_cv_.notify_all();
  hello_ack_cv_.notify_all();
  if (connection_thread_.joinable()) {
    connection_thread_.join();
  }
}

void GrpcEvidenceClient::Send(const LedgerEvidence& msg) {
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    send_queue_.push_back(msg);
  }
  uint64_t prev = last_emitted_.load(std::memory_order_relaxed);
  while (msg.sequence > prev) {
    if (last_emitted_.compare_exchange_weak(prev, msg.sequence, std::memory_order_relaxed)) break;
  }
  queue_cv_.notify_one();
}

EvidenceEmitter::Listener GrpcEvidenceClient::AsListener() {
  return [this](const LedgerEvidence& msg) { Send(msg); };
}

// ---------------------------------------------------------------------------
// Proto conversion
// ---------------------------------------------------------------------------

proto::LedgerEvidence GrpcEvidenceClient::ToProto(const LedgerEvidence& m) {
  proto::LedgerEvidence p;
  p.set_schema_version(m.schema_version);
  p.set_ledger_id(m.ledger_id);
  p.set_sequence(m.sequence);
  p.set_event_uuid(m.event_uuid);
  p.set_emitted_utc(m.emitted_utc);
  p.set_payload_crc32(m.payload_crc32);

  const std::string& j = m.payload;
  std::string s;
  uint64_t u64;
  uint32_t u32;

  if (m.payload_type == kCreatorRegistered) {
    auto* cr = p.mutable_creator_registered();
    if (ExtractString(j, "identity", &s)) cr->set_identity(s);
    if (ExtractString(j, "name", &s)) cr->set_name(s);
    if (ExtractUint64(j, "creator_id", &u64)) cr->set_creator_id(u64);

  } else if (m.payload_type == kConsumerRegistered) {
    auto* cr = p.mutable_consumer_registered();
    if (ExtractString(j, "identity", &s)) cr->set_identity(s);
    if (ExtractString(j, "name", &s)) cr->set_name(s);

  } else if (m.payload_type == kWorkPublished) {
    auto* wp = p.mutable_work_published();
    if (ExtractUint64(j, "work_id", &u64)) wp->set_work_id(u64);
    if (ExtractString(j, "creator_identity", &s)) wp->set_creator_identity(s);
    if (ExtractString(j, "title", &s)) wp->set_title(s);
    if (ExtractUint64(j, "unit_price", &u64)) wp->set_unit_price(u64);
    if (ExtractUint32(j, "royalty_basis_points", &u32)) wp->set_royalty_basis_points(u32);

  } else if (m.payload_type == kRoyaltyAccrued) {
    auto* ra = p.mutable_royalty_accrued();
    if (ExtractUint64(j, "work_id", &u64)) ra->set_work_id(u64);
    if (ExtractString(j, "consumer_identity", &s)) ra->set_consumer_identity(s);
    if (ExtractUint64(j, "payment", &u64)) ra->set_payment(u64);
    if (ExtractUint64(j, "royalty_share", &u64)) ra->set_royalty_share(u64);
    if (ExtractUint64(j, "escrow_balance", &u64)) ra->set_escrow_balance(u64);

  } else if (m.payload_type == kGrantIssued) {
    auto* gi = p.mutable_grant_issued();
    if (ExtractUint64(j, "work_id", &u64)) gi->set_work_id(u64);
    if (ExtractString(j, "consumer_identity", &s)) gi->set_consumer_identity(s);
    if (ExtractUint64(j, "grant_serial", &u64)) gi->set_grant_serial(u64);

  } else if (m.payload_type == kRoyaltyPaid) {
    auto* rp = p.mutable_royalty_paid();
    if (ExtractUint64(j, "work_id", &u64)) rp->set_work_id(u64);
    if (ExtractString(j, "owner_identity", &s)) rp->set_owner_identity(s);
    if (ExtractUint64(j, "amount", &u64)) rp->set_amount(u64);

  } else if (m.payload_type == kWorkPlayed) {
    auto* wp = p.mutable_work_played();
    if (ExtractUint64(j, "work_id", &u64)) wp->set_work_id(u64);
    if (ExtractString(j, "consumer_identity", &s)) wp->set_consumer_identity(s);
    if (ExtractUint64(j, "play_sequence", &u64)) wp->set_play_sequence(u64);
    if (ExtractUint64(j, "play_count", &u64)) wp->set_play_count(u64);
  }

  return p;
}

proto::LedgerEvidence GrpcEvidenceClient::MakeHello(uint64_t last_sequence_emitted) const {
  proto::LedgerEvidence p;
  p.set_schema_version(LedgerEvidence::kSchemaVersion);
  p.set_ledger_id(spool_->LedgerId());
  p.set_sequence(0);
  p.set_event_uuid("hello");

  auto* hello = p.mutable_hello();
  hello->set_first_sequence_available(1);
  hello->set_last_sequence_emitted(last_sequence_emitted);
  return p;
}

// ---------------------------------------------------------------------------
// Connection loop
// ---------------------------------------------------------------------------

void GrpcEvidenceClient::ConnectionLoop() {
  int backoff_ms = kInitialBackoffMs;

  while (!shutdown_.load(std::memory_order_acquire)) {
    {
      std::lock_guard<std::mutex> lock(hello_ack_mutex_);
      hello_ack_received_ = false;
    }

    bool ok = RunOneSession();
    running_.store(false, std::memory_order_relaxed);

    if (shutdown_.load(std::memory_order_acquire)) break;

    if (ok) {
      backoff_ms = kInitialBackoffMs;
    } else {
      Logger::Warn(LogLine("GrpcEvidenceClient", "STREAM_DISCONNECTED")
                       .Kv("target", target_address_)
                       .Kv("ledger", spool_->LedgerId())
                       .Kv("retry_in_ms", backoff_ms)
                       .str());
    }

    std::unique_lock<std::mutex> lock(queue_mutex_);
    queue_cv_.wait_for(lock, std::chrono::milliseconds(backoff_ms), [this] {
      return shutdown_.load(std::memory_order_relaxed);
    });

    backoff_ms = std::min(backoff_ms * 2, kMaxBackoffMs);
  }
}

// ---------------------------------------------------------------------------
// Single stream session
// ---------------------------------------------------------------------------

bool GrpcEvidenceClient::RunOneSession() {
  grpc::ClientContext context;
  {
    std::lock_guard<std::mutex> lock(context_mutex_);
    if (shutdown_.load(std::memory_order_acquire)) return true;
    active_context_ = &context;
  }
  struct ContextReset {
    GrpcEvidenceClient* self;
    ~ContextReset() {
      std::lock_guard<std::mutex> lock(self->context_mutex_);
      self->active_context_ = nullptr;
    }
  } context_reset{this};

  auto stream = stub_->EvidenceStream(&context);
  if (!stream) return false;

  running_.store(true, std::memory_order_relaxed);

  auto finish = [this, &stream](std::thread& ack_thread) {
    stream->WritesDone();
    if (ack_thread.joinable()) ack_thread.join();
    grpc::Status status = stream->Finish();
    if (!status.ok()) {
      Logger::Debug(LogLine("GrpcEvidenceClient", "STREAM_FINISHED")
                        .Kv("target", target_address_)
                        .Kv("code", static_cast<int>(status.error_code()))
                        .Kv("message", status.error_message())
                        .str());
    }
  };

  // --- 1. HELLO ---
  if (!stream->Write(MakeHello(last_emitted_.load(std::memory_order_relaxed)))) {
    std::thread none;
    finish(none);
    return false;
  }

  // --- 2. Ack reader ---
  std::thread ack_thread([this, &stream] { AckReaderLoop(stream.get()); });

  // --- 3. Initial ack ---
  {
    std::unique_lock<std::mutex> lock(hello_ack_mutex_);
    hello_ack_cv_.wait_for(lock, std::chrono::milliseconds(kHelloAckTimeoutMs), [this] {
      return hello_ack_received_ || shutdown_.load(std::memory_order_relaxed);
    });
    if (!hello_ack_received_ || shutdown_.load(std::memory_order_relaxed)) {
      lock.unlock();
      context.TryCancel();
      finish(ack_thread);
      return shutdown_.load(std::memory_order_relaxed);
    }
  }
  sessions_.fetch_add(1, std::memory_order_relaxed);
  Logger::Info(LogLine("GrpcEvidenceClient", "STREAM_OPEN")
                   .Kv("target", target_address_)
                   .Kv("ledger", spool_->LedgerId())
                   .Kv("acked", last_acked_.load(std::memory_order_acquire))
                   .str());

  // --- 4. Replay ---
  uint64_t last_sent = last_acked_.load(std::memory_order_acquire);
  spool_->Flush();
  for (const auto& msg : spool_->ReplayFrom(last_sent)) {
    if (!stream->Write(ToProto(msg))) {
      finish(ack_thread);
      return false;
    }
    last_sent = std::max(last_sent, msg.sequence);
  }

  // --- 5. Live ---
  while (!shutdown_.load(std::memory_order_relaxed)) {
    std::vector<LedgerEvidence> batch;
    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      queue_cv_.wait_for(lock, std::chrono::milliseconds(50), [this] {
        return !send_queue_.empty() || shutdown_.load(std::memory_order_relaxed);
      });
      batch.swap(send_queue_);
    }

    for (const auto& msg : batch) {
      if (msg.sequence <= last_sent) continue;  // Already covered by replay
      if (!stream->Write(ToProto(msg))) {
        finish(ack_thread);
        return false;
      }
      last_sent = msg.sequence;
    }
  }

  finish(ack_thread);
  return true;
}

// ---------------------------------------------------------------------------
// Ack reader
// ---------------------------------------------------------------------------

void GrpcEvidenceClient::AdvanceAck(uint64_t seq) {
  uint64_t current = last_acked_.load(std::memory_order_acquire);
  while (seq > current) {
    if (last_acked_.compare_exchange_weak(current, seq, std::memory_order_release)) {
      spool_->UpdateAck(seq);
      break;
    }
  }
}

void GrpcEvidenceClient::AckReaderLoop(
    grpc::ClientReaderWriter<proto::LedgerEvidence, proto::EvidenceAck>* stream) {
  proto::EvidenceAck ack;
  bool first_ack = true;

  while (stream->Read(&ack)) {
    const uint64_t seq = ack.acked_sequence();
    if (first_ack) {
      // The indexer's answer to HELLO is authoritative for where replay
      // starts, even if it is behind the persisted ack.
      first_ack = false;
      last_acked_.store(seq, std::memory_order_release);
      if (seq > 0) spool_->UpdateAck(seq);
      std::lock_guard<std::mutex> lock(hello_ack_mutex_);
      hello_ack_received_ = true;
      hello_ack_cv_.notify_one();
      continue;
    }
    AdvanceAck(seq);
  }
}

}  // namespace tuneledger::evidence
