// Repository: TuneLedger
// Component: Ledger evidence spool (durable, crash-resilient)
// Purpose: Append-only JSONL record of every ledger event, with ack cursor.
// Copyright (c) 2026 TuneLedger

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace tuneledger::evidence {

// C++ mirror of the LedgerEvidence proto (ledger_evidence_v1.proto).
// Used for spool storage and replay; payload stored as a JSON object.
struct LedgerEvidence {
  static constexpr uint32_t kSchemaVersion = 1u;

  uint32_t schema_version = kSchemaVersion;
  std::string ledger_id;
  uint64_t sequence = 0;
  std::string event_uuid;
  std::string emitted_utc;
  std::string payload_type;   // CREATOR_REGISTERED, WORK_PUBLISHED, GRANT_ISSUED, ...
  std::string payload;        // JSON object
  uint32_t payload_crc32 = 0; // zlib crc32 of payload bytes

  // CRC32 of `payload` as stored in payload_crc32.
  static uint32_t ChecksumOf(const std::string& payload);

  // Serialize to single-line JSON (one line of JSONL).
  std::string ToJsonLine() const;
  // Parse from single line; returns false if the line is incomplete, corrupt,
  // or its payload does not match payload_crc32.
  static bool FromJsonLine(const std::string& line, LedgerEvidence& out);
};

enum class AppendStatus {
  kOk,
  kSpoolFull,     // Pending bytes would exceed the configured cap.
  kWriteFailed,   // Writer thread could not write the spool file.
};

// Durable evidence spool: append-only JSONL + ack file, dedicated writer thread.
// Paths: {spool_root}/{ledger_id}.spool.jsonl and {spool_root}/{ledger_id}.ack
class EvidenceSpool {
 public:
  static constexpr int kFlushIntervalMs = 250;
  static constexpr size_t kFlushRecordsMax = 50;
  // 0 means unlimited (default).
  static constexpr size_t kDefaultMaxSpoolBytes = 0;

  // Throws std::runtime_error if spool_root cannot be created.
  EvidenceSpool(std::string ledger_id,
                const std::string& spool_root,
                size_t max_spool_bytes = kDefaultMaxSpoolBytes);
  ~EvidenceSpool();

  EvidenceSpool(const EvidenceSpool&) = delete;
  EvidenceSpool& operator=(const EvidenceSpool&) = delete;

  // Enqueues for write. Sequences must be contiguous; a gap throws
  // std::logic_error. Returns kSpoolFull when the unacked byte cap would be
  // exceeded (the record is dropped but its sequence is consumed) and
  // kWriteFailed once the writer thread has hit an I/O error.
  AppendStatus Append(const LedgerEvidence& msg);

  // Blocks until every record appended so far has been written.
  void Flush();

  // Estimated file size including queued records.
  size_t CurrentSpoolBytes() const;

  // Pending (unacked) bytes.
  size_t PendingBytes() const;

  // Records with sequence > acked_sequence, in file order. Corrupt lines
  // (torn final write, CRC mismatch) are skipped.
  std::vector<LedgerEvidence> ReplayFrom(uint64_t acked_sequence) const;

  // Highest sequence present in the spool file (0 if empty).
  uint64_t LastSpooledSequence() const;

  // Persist the indexer's ack; only updates if seq is strictly higher.
  void UpdateAck(uint64_t seq);

  // Last acked sequence from the .ack file; 0 if missing or unreadable.
  uint64_t GetLastAck() const;

  const std::string& LedgerId() const { return ledger_id_; }
  const std::string& SpoolPath() const { return spool_path_; }
  const std::string& AckPath() const { return ack_path_; }

 private:
  void WriterLoop();

  std::string ledger_id_;
  std::string spool_path_;
  std::string ack_path_;
  size_t max_spool_bytes_;

  mutable std::mutex queue_mutex_;
  std::condition_variable queue_cv_;
  std::condition_variable drained_cv_;
  std::vector<LedgerEvidence> write_queue_;
  bool writing_ = false;
  bool write_failed_ = false;
  bool shutdown_ = false;
  uint64_t last_appended_sequence_ = 0;

  // Tracked in-memory: file bytes at open + bytes appended since.
  size_t estimated_spool_bytes_ = 0;
  size_t acked_byte_offset_ = 0;
  std::vector<size_t> record_byte_sizes_;  // Records appended by this instance, in order
  uint64_t first_sequence_this_run_ = 0;
  uint64_t ack_cursor_ = 0;

  std::thread writer_thread_;
};

}  // namespace tuneledger::evidence
