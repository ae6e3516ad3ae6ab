// Repository: TuneLedger
// Component: Ledger evidence spool implementation
// Copyright (c) 2026 TuneLedger

#include "evidence/EvidenceSpool.hpp"

#include <cctype>
#include <cerrno>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <sys/stat.h>
#include <unistd.h>
#include <zlib.h>

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

// Parse string value after key; advances *pos past the value.
bool ParseJsonStringValue(const std::string& line, const std::string& key,
                          size_t* pos, std::string* out) {
  std::string search = "\"" + key + "\":\"";
  size_t start = line.find(search, *pos);
  if (start == std::string::npos) return false;
  start += search.size();
  out->clear();
  for (size_t i = start; i < line.size(); ++i) {
    if (line[i] == '\\' && i + 1 < line.size()) {
      char next = line[i + 1];
      if (next == '"')  { *out += '"';  i++; continue; }
      if (next == '\\') { *out += '\\'; i++; continue; }
      if (next == 'n')  { *out += '\n'; i++; continue; }
      if (next == 'r')  { *out += '\r'; i++; continue; }
      if (next == 't')  { *out += '\t'; i++; continue; }
    }
    if (line[i] == '"') {
      *pos = i + 1;
      return true;
    }
    *out += line[i];
  }
  return false;
}

bool ParseJsonUint64Value(const std::string& line, const std::string& key,
                          size_t* pos, uint64_t* out) {
  std::string search = "\"" + key + "\":";
  size_t start = line.find(search, *pos);
  if (start == std::string::npos) return false;
  start += search.size();
  size_t end = start;
  while (end < line.size() && std::isdigit(static_cast<unsigned char>(line[end]))) ++end;
  if (end == start || end - start > 20) return false;
  try {
    *out = static_cast<uint64_t>(std::stoull(line.substr(start, end - start)));
  } catch (const std::out_of_range&) {
    return false;
  }
  *pos = end;
  return true;
}

bool ParseJsonUint32Value(const std::string& line, const std::string& key,
                          size_t* pos, uint32_t* out) {
  uint64_t v;
  if (!ParseJsonUint64Value(line, key, pos, &v)) return false;
  if (v > 0xFFFFFFFFu) return false;
  *out = static_cast<uint32_t>(v);
  return true;
}

// Extract value of "payload" as a JSON object (first '{' to its matching '}').
bool ParsePayloadObject(const std::string& line, size_t* pos, std::string* out) {
  static const std::string kKey = "\"payload\":";
  size_t start = line.find(kKey, *pos);
  if (start == std::string::npos) return false;
  start += kKey.size();
  if (start >= line.size() || line[start] != '{') return false;
  size_t depth = 1;
  size_t i = start + 1;
  while (i < line.size() && depth > 0) {
    if (line[i] == '{') {
      ++depth;
    } else if (line[i] == '}') {
      --depth;
    } else if (line[i] == '"') {
      ++i;
      while (i < line.size() && line[i] != '"') {
        if (line[i] == '\\') ++i;
        ++i;
      }
    }
    ++i;
  }
  if (depth != 0) return false;
  *out = line.substr(start, i - start);
  *pos = i;
  return true;
}

std::string NowUtcIso8601() {
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::system_clock::now().time_since_epoch()).count();
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

}  // namespace

// -----------------------------------------------------------------------------
// LedgerEvidence
// -----------------------------------------------------------------------------

uint32_t LedgerEvidence::ChecksumOf(const std::string& payload) {
  uLong crc = crc32(0L, Z_NULL, 0);
  crc = crc32(crc, reinterpret_cast<const Bytef*>(payload.data()),
              static_cast<uInt>(payload.size()));
  return static_cast<uint32_t>(crc);
}

std::string LedgerEvidence::ToJsonLine() const {
  std::ostringstream o;
  o << "{\"schema_version\":" << schema_version
    << ",\"ledger_id\":\"" << JsonEscape(ledger_id) << "\""
    << ",\"sequence\":" << sequence
    << ",\"event_uuid\":\"" << JsonEscape(event_uuid) << "\""
    << ",\"emitted_utc\":\"" << JsonEscape(emitted_utc) << "\""
    << ",\"payload_type\":\"" << JsonEscape(payload_type) << "\""
    << ",\"payload_crc32\":" << payload_crc32
    << ",\"payload\":";
  if (payload.empty() || payload.front() != '{')
    o << "{}";
  else
    o << payload;
  o << "}";
  return o.str();
}

bool LedgerEvidence::FromJsonLine(const std::string& line, LedgerEvidence& out) {
  if (line.empty() || line.front() != '{' || line.back() != '}')
    return false;
  size_t pos = 0;
  if (!ParseJsonUint32Value(line, "schema_version", &pos, &out.schema_version)) return false;
  if (!ParseJsonStringValue(line, "ledger_id", &pos, &out.ledger_id)) return false;
  if (!ParseJsonUint64Value(line, "sequence", &pos, &out.sequence)) return false;
  if (!ParseJsonStringValue(line, "event_uuid", &pos, &out.event_uuid)) return false;
  if (!ParseJsonStringValue(line, "emitted_utc", &pos, &out.emitted_utc)) return false;
  if (!ParseJsonStringValue(line, "payload_type", &pos, &out.payload_type)) return false;
  if (!ParseJsonUint32Value(line, "payload_crc32", &pos, &out.payload_crc32)) return false;
  if (!ParsePayloadObject(line, &pos, &out.payload)) return false;
  return ChecksumOf(out.payload) == out.payload_crc32;
}

// -----------------------------------------------------------------------------
// EvidenceSpool
// -----------------------------------------------------------------------------

EvidenceSpool::EvidenceSpool(std::string ledger_id,
                             const std::string& spool_root,
                             size_t max_spool_bytes)
    : ledger_id_(std::move(ledger_id)),
      max_spool_bytes_(max_spool_bytes) {
  spool_path_ = spool_root + "/" + ledger_id_ + ".spool.jsonl";
  ack_path_ = spool_root + "/" + ledger_id_ + ".ack";

  if (mkdir(spool_root.c_str(), 0755) != 0 && errno != EEXIST) {
    throw std::runtime_error("EvidenceSpool: cannot create directory " + spool_root);
  }

  // Restart: continue the sequence already on disk. Bytes from earlier runs
  // do not count toward the pending cap.
  struct stat st;
  if (stat(spool_path_.c_str(), &st) == 0) {
    estimated_spool_bytes_ = static_cast<size_t>(st.st_size);
    acked_byte_offset_ = estimated_spool_bytes_;
  }
  last_appended_sequence_ = LastSpooledSequence();
  first_sequence_this_run_ = last_appended_sequence_ + 1;
  ack_cursor_ = last_appended_sequence_;

  writer_thread_ = std::thread(&EvidenceSpool::WriterLoop, this);
}

EvidenceSpool::~EvidenceSpool() {
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    shutdown_ = true;
  }
  queue_cv_.notify_all();
  if (writer_thread_.joinable())
    writer_thread_.join();
}

AppendStatus EvidenceSpool::Append(const LedgerEvidence& msg) {
  std::lock_guard<std::mutex> lock(queue_mutex_);
  if (write_failed_) return AppendStatus::kWriteFailed;
  if (msg.sequence != last_appended_sequence_ + 1)
    throw std::logic_error("EvidenceSpool: sequence gap detected (expected " +
                           std::to_string(last_appended_sequence_ + 1) + ", got " +
                           std::to_string(msg.sequence) + ")");

  size_t record_bytes = msg.ToJsonLine().size() + 1;
  if (max_spool_bytes_ > 0) {
    size_t pending = estimated_spool_bytes_ - acked_byte_offset_;
    if (pending + record_bytes > max_spool_bytes_) {
      // Dropped record still consumes its sequence; replay shows the hole.
      record_byte_sizes_.push_back(0);
      last_appended_sequence_ = msg.sequence;
      return AppendStatus::kSpoolFull;
    }
  }
  estimated_spool_bytes_ += record_bytes;
  record_byte_sizes_.push_back(record_bytes);

  last_appended_sequence_ = msg.sequence;
  write_queue_.push_back(msg);
  if (write_queue_.size() >= kFlushRecordsMax)
    queue_cv_.notify_one();
  return AppendStatus::kOk;
}

void EvidenceSpool::Flush() {
  std::unique_lock<std::mutex> lock(queue_mutex_);
  queue_cv_.notify_one();
  drained_cv_.wait(lock, [this] {
    return (write_queue_.empty() && !writing_) || write_failed_;
  });
}

size_t EvidenceSpool::CurrentSpoolBytes() const {
  std::lock_guard<std::mutex> lock(queue_mutex_);
  return estimated_spool_bytes_;
}

size_t EvidenceSpool::PendingBytes() const {
  std::lock_guard<std::mutex> lock(queue_mutex_);
  return estimated_spool_bytes_ - acked_byte_offset_;
}

void EvidenceSpool::WriterLoop() {
  std::unique_lock<std::mutex> lock(queue_mutex_);
  while (true) {
    queue_cv_.wait_for(lock, std::chrono::milliseconds(kFlushIntervalMs), [this] {
      return shutdown_ || !write_queue_.empty();
    });
    if (write_queue_.empty()) {
      drained_cv_.notify_all();
      if (shutdown_) break;
      continue;
    }

    std::vector<LedgerEvidence> batch;
    batch.swap(write_queue_);
    writing_ = true;
    lock.unlock();

    bool ok = true;
    {
      std::ofstream of(spool_path_, std::ios::app);
      if (of) {
        for (const auto& msg : batch)
          of << msg.ToJsonLine() << '\n';
        of.flush();
      }
      ok = static_cast<bool>(of);
    }
    if (!ok) {
      util::Logger::Error(util::LogLine("EvidenceSpool", "SPOOL_WRITE_FAILED")
                              .Kv("ledger", ledger_id_)
                              .Kv("path", spool_path_)
                              .Kv("records", batch.size())
                              .str());
    }

    lock.lock();
    writing_ = false;
    if (!ok) write_failed_ = true;
    drained_cv_.notify_all();
    if (write_failed_) break;
  }
}

std::vector<LedgerEvidence> EvidenceSpool::ReplayFrom(uint64_t acked_sequence) const {
  std::ifstream in(spool_path_);
  if (!in) return {};

  std::vector<LedgerEvidence> result;
  std::string line;
  while (std::getline(in, line)) {
    if (line.empty()) continue;
    LedgerEvidence msg;
    if (!LedgerEvidence::FromJsonLine(line, msg))
      continue;
    if (msg.sequence > acked_sequence)
      result.push_back(std::move(msg));
  }
  return result;
}

uint64_t EvidenceSpool::LastSpooledSequence() const {
  std::ifstream in(spool_path_);
  if (!in) return 0;
  uint64_t last = 0;
  std::string line;
  while (std::getline(in, line)) {
    LedgerEvidence msg;
    if (LedgerEvidence::FromJsonLine(line, msg) && msg.sequence > last)
      last = msg.sequence;
  }
  return last;
}

void EvidenceSpool::UpdateAck(uint64_t seq) {
  uint64_t current = GetLastAck();
  if (seq <= current) return;

  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    // record_byte_sizes_[0] belongs to first_sequence_this_run_.
    while (ack_cursor_ < seq) {
      uint64_t index = ack_cursor_ + 1 - first_sequence_this_run_;
      if (index >= record_byte_sizes_.size()) break;
      acked_byte_offset_ += record_byte_sizes_[index];
      ack_cursor_++;
    }
  }

  std::string content = "acked_sequence=" + std::to_string(seq) +
                        "\nupdated_utc=" + NowUtcIso8601() + "\n";
  std::string tmp_path = ack_path_ + ".tmp." + std::to_string(static_cast<unsigned long>(getpid()));
  {
    std::ofstream of(tmp_path, std::ios::out | std::ios::trunc);
    of << content;
    of.flush();
    if (!of) {
      util::Logger::Error(util::LogLine("EvidenceSpool", "ACK_WRITE_FAILED")
                              .Kv("ledger", ledger_id_)
                              .Kv("path", tmp_path)
                              .Kv("acked_sequence", seq)
                              .str());
      return;
    }
  }
  if (rename(tmp_path.c_str(), ack_path_.c_str()) != 0) {
    util::Logger::Error(util::LogLine("EvidenceSpool", "ACK_RENAME_FAILED")
                            .Kv("ledger", ledger_id_)
                            .Kv("path", ack_path_)
                            .Kv("errno", errno)
                            .str());
    (void)unlink(tmp_path.c_str());
  }
}

uint64_t EvidenceSpool::GetLastAck() const {
  std::ifstream in(ack_path_);
  if (!in) return 0;
  std::string line;
  static const std::string kPrefix = "acked_sequence=";
  if (!std::getline(in, line) || line.compare(0, kPrefix.size(), kPrefix) != 0) return 0;
  size_t pos = 0;
  std::string digits = line.substr(kPrefix.size());
  if (digits.empty() || digits.size() > 20) return 0;
  for (char c : digits) {
    if (!std::isdigit(static_cast<unsigned char>(c))) return 0;
  }
  try {
    return static_cast<uint64_t>(std::stoull(digits, &pos));
  } catch (const std::out_of_range&) {
    return 0;
  }
}

}  // namespace tuneledger::evidence
