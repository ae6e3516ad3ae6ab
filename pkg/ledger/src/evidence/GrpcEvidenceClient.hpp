// Repository: TuneLedger
// Component: Ledger evidence gRPC exporter
// Purpose: Streams spooled and live ledger events to an external indexer.
// Copyright (c) 2026 TuneLedger

#pragma once

#include "evidence/EvidenceEmitter.hpp"
#include "evidence/EvidenceSpool.hpp"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <grpcpp/grpcpp.h>
#include "ledger_evidence_v1.grpc.pb.h"

namespace tuneledger::evidence {

// Streams LedgerEvidence to an indexer's LedgerEvidenceService over gRPC
// from a dedicated connection thread; ledger callers never block on it.
//
// Lifecycle:
//   1. Construct with target address and the ledger's spool
//   2. Register AsListener() with the EvidenceEmitter (or call Send())
//   3. Destructor shuts down cleanly
//
// Per session:
//   - Send HELLO {first_sequence_available=1, last_sequence_emitted}
//   - Wait up to 5 s for the indexer's first ack
//   - Flush the spool and replay every record after the acked sequence
//   - Stream live events, skipping any already covered by the replay
//
// Every ack is persisted with EvidenceSpool::UpdateAck. On disconnect the
// client reconnects with exponential backoff (100 ms doubling to 5 s) and
// resumes from the persisted ack.
class GrpcEvidenceClient {
 public:
  static constexpr int kInitialBackoffMs = 100;
  static constexpr int kMaxBackoffMs = 5000;
  static constexpr int kHelloAckTimeoutMs = 5000;

  // Throws std::invalid_argument if spool is null.
  GrpcEvidenceClient(const std::string& target_address,
                     std::shared_ptr<EvidenceSpool> spool);
  ~GrpcEvidenceClient();

  GrpcEvidenceClient(const GrpcEvidenceClient&) = delete;
  GrpcEvidenceClient& operator=(const GrpcEvidenceClient&) = delete;

  // Enqueue for streaming. Non-blocking.
  void Send(const LedgerEvidence& msg);

  // Listener forwarding to Send(). The client must outlive the emitter's use
  // of it.
  EvidenceEmitter::Listener AsListener();

  uint64_t LastAckedSequence() const { return last_acked_.load(std::memory_order_acquire); }

  // Whether a stream session is currently open.
  bool IsRunning() const { return running_.load(std::memory_order_relaxed); }

  // Number of sessions that completed the HELLO handshake.
  uint64_t SessionCount() const { return sessions_.load(std::memory_order_relaxed); }

  // Proto conversion of a spooled/live record. Unknown payload types produce
  // an envelope with no payload set.
  static tuneledger::evidence::v1::LedgerEvidence ToProto(const LedgerEvidence& msg);

 private:
  tuneledger::evidence::v1::LedgerEvidence MakeHello(uint64_t last_sequence_emitted) const;

  // Outer loop: connect, stream, back off, reconnect.
  void ConnectionLoop();

  // One stream session. Returns false when the session ended abnormally.
  bool RunOneSession();

  void AckReaderLoop(
      grpc::ClientReaderWriter<tuneledger::evidence::v1::LedgerEvidence,
                               tuneledger::evidence::v1::EvidenceAck>* stream);

  void AdvanceAck(uint64_t seq);

  std::string target_address_;
  std::shared_ptr<EvidenceSpool> spool_;
  std::shared_ptr<grpc::Channel> grpc_channel_;
  std::unique_ptr<tuneledger::evidence::v1::LedgerEvidenceService::Stub> stub_;

  std::mutex queue_mutex_;
  std::condition_variable queue_cv_;
  std::vector<LedgerEvidence> send_queue_;

  std::atomic<uint64_t> last_emitted_{0};
  std::atomic<uint64_t> last_acked_{0};
  std::atomic<uint64_t> sessions_{0};
  std::atomic<bool> shutdown_{false};
  std::atomic<bool> running_{false};

  std::mutex hello_ack_mutex_;
  std::condition_variable hello_ack_cv_;
  bool hello_ack_received_ = false;

  std::mutex context_mutex_;
  grpc::ClientContext* active_context_ = nullptr;  // Cancelled on shutdown

  std::thread connection_thread_;
};

}  // namespace tuneledger::evidence
