// Repository: TuneLedger
// Component: Ledger command script runner implementation
// Copyright (c) 2026 TuneLedger

#include "LedgerScript.hpp"

#include <cctype>
#include <limits>
#include <sstream>

namespace tuneledger::standalone {

using ledger::LedgerErrorToString;

namespace {

std::vector<std::string> Tokenize(const std::string& line) {
  std::vector<std::string> tokens;
  std::istringstream in(line);
  std::string tok;
  while (in >> tok) tokens.push_back(tok);
  return tokens;
}

std::string Join(const std::vector<std::string>& parts, size_t from) {
  std::string out;
  for (size_t i = from; i < parts.size(); ++i) {
    if (!out.empty()) out += ' ';
    out += parts[i];
  }
  return out;
}

void PrintWork(std::ostream& out, const ledger::Work& w) {
  out << "  work id=" << w.id
      << " creator=" << w.creator_identity
      << " title=\"" << w.title << "\""
      << " price=" << w.gate.unit_price
      << " royalty_bp=" << w.gate.royalty_basis_points
      << " plays=" << w.play_count
      << " grants=" << w.gate.issued_count
      << " escrow=" << w.gate.escrow_balance
      << " paid=" << w.gate.total_royalty_paid
      << " audio=" << w.audio_ref
      << " cover=" << w.cover_ref << "\n";
}

}  // namespace

bool ParseUint64(const std::string& text, uint64_t* out) {
  if (text.empty()) return false;
  constexpr uint64_t kMax = std::numeric_limits<uint64_t>::max();
  uint64_t v = 0;
  for (char c : text) {
    if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    uint64_t digit = static_cast<uint64_t>(c - '0');
    if (v > (kMax - digit) / 10) return false;
    v = v * 10 + digit;
  }
  *out = v;
  return true;
}

LedgerScript::LedgerScript(ledger::StreamingLedger& ledger, std::ostream& out)
    : ledger_(ledger), out_(out) {}

ScriptSummary LedgerScript::Run(std::istream& in, bool fail_fast) {
  ScriptSummary summary;
  std::string line;
  uint64_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    auto tokens = Tokenize(line);
    if (tokens.empty() || tokens[0][0] == '#') continue;

    ++summary.commands;
    if (!RunLine(line_no, line)) {
      ++summary.failed;
      summary.failed_lines.push_back(line_no);
      if (fail_fast) {
        summary.stopped_early = true;
        break;
      }
    }
  }
  return summary;
}

bool LedgerScript::RunLine(uint64_t line_no, const std::string& line) {
  auto tokens = Tokenize(line);
  if (tokens.empty() || tokens[0][0] == '#') return true;

  const std::string prefix = "line " + std::to_string(line_no) + ": " + Join(tokens, 0) + " -> ";
  const std::string& cmd = tokens[0];
  std::vector<std::string> args(tokens.begin() + 1, tokens.end());

  if (cmd == "register-creator") return CmdRegisterCreator(prefix, args);
  if (cmd == "register-consumer") return CmdRegisterConsumer(prefix, args);
  if (cmd == "publish") return CmdPublish(prefix, args);
  if (cmd == "stream") return CmdStream(prefix, args);
  if (cmd == "withdraw") return CmdWithdraw(prefix, args);
  if (cmd == "works") return CmdWorks(prefix, args);
  if (cmd == "history") return CmdHistory(prefix, args);
  if (cmd == "stats") return CmdStats(prefix, args);
  return Fail(prefix, "UNKNOWN_COMMAND");
}

bool LedgerScript::Fail(const std::string& prefix, const std::string& code) {
  out_ << prefix << "ERROR " << code << "\n";
  return false;
}

bool LedgerScript::CmdRegisterCreator(const std::string& prefix,
                                      const std::vector<std::string>& args) {
  if (args.size() < 2 || args.size() > 3) return Fail(prefix, "USAGE");
  auto r = ledger_.RegisterCreator(args[0], args[1], args.size() == 3 ? args[2] : "");
  if (!r.success) return Fail(prefix, LedgerErrorToString(r.error));
  out_ << prefix << "OK creator_id=" << r.creator_id << "\n";
  return true;
}

bool LedgerScript::CmdRegisterConsumer(const std::string& prefix,
                                       const std::vector<std::string>& args) {
  if (args.size() < 2 || args.size() > 3) return Fail(prefix, "USAGE");
  auto r = ledger_.RegisterConsumer(args[0], args[1], args.size() == 3 ? args[2] : "");
  if (!r.success) return Fail(prefix, LedgerErrorToString(r.error));
  out_ << prefix << "OK\n";
  return true;
}

bool LedgerScript::CmdPublish(const std::string& prefix, const std::vector<std::string>& args) {
  uint64_t price = 0;
  if (args.size() < 5 || !ParseUint64(args[1], &price)) return Fail(prefix, "USAGE");
  auto r = ledger_.Publish(args[0], Join(args, 4), args[2], args[3], price);
  if (!r.success) return Fail(prefix, LedgerErrorToString(r.error));
  out_ << prefix << "OK work_id=" << r.work_id << "\n";
  return true;
}

bool LedgerScript::CmdStream(const std::string& prefix, const std::vector<std::string>& args) {
  uint64_t work_id = 0;
  uint64_t payment = 0;
  if (args.size() != 3 || !ParseUint64(args[1], &work_id) || !ParseUint64(args[2], &payment)) {
    return Fail(prefix, "USAGE");
  }
  auto r = ledger_.Stream(args[0], work_id, payment);
  if (!r.success) return Fail(prefix, LedgerErrorToString(r.error));
  out_ << prefix << "OK audio=" << r.audio_ref
       << " settled=" << (r.settled ? "true" : "false")
       << " royalty_share=" << r.royalty_share
       << " play_sequence=" << r.play_sequence << "\n";
  return true;
}

bool LedgerScript::CmdWithdraw(const std::string& prefix, const std::vector<std::string>& args) {
  uint64_t work_id = 0;
  if (args.size() != 2 || !ParseUint64(args[1], &work_id)) return Fail(prefix, "USAGE");
  auto r = ledger_.WithdrawEscrow(args[0], work_id);
  if (!r.success) {
    if (!r.detail.empty()) {
      out_ << prefix << "ERROR " << LedgerErrorToString(r.error) << " detail=\"" << r.detail << "\"\n";
      return false;
    }
    return Fail(prefix, LedgerErrorToString(r.error));
  }
  out_ << prefix << "OK amount=" << r.amount << "\n";
  return true;
}

bool LedgerScript::CmdWorks(const std::string& prefix, const std::vector<std::string>& args) {
  if (args.size() > 1) return Fail(prefix, "USAGE");
  auto works = args.empty() ? ledger_.AllWorks() : ledger_.WorksByCreator(args[0]);
  out_ << prefix << "OK count=" << works.size() << "\n";
  for (const auto& w : works) PrintWork(out_, w);
  return true;
}

bool LedgerScript::CmdHistory(const std::string& prefix, const std::vector<std::string>& args) {
  if (args.size() != 1) return Fail(prefix, "USAGE");
  auto plays = ledger_.PlayHistory(args[0]);
  out_ << prefix << "OK count=" << plays.size() << "\n";
  for (const auto& p : plays) {
    out_ << "  play seq=" << p.sequence << " work=" << p.work_id
         << " at_ms=" << p.played_utc_ms << "\n";
  }
  return true;
}

bool LedgerScript::CmdStats(const std::string& prefix, const std::vector<std::string>& args) {
  if (!args.empty()) return Fail(prefix, "USAGE");
  auto s = ledger_.Stats();
  out_ << prefix << "OK creators=" << s.creators
       << " consumers=" << s.consumers
       << " works=" << s.works
       << " plays=" << s.plays
       << " grants=" << s.grants << "\n";
  return true;
}

}  // namespace tuneledger::standalone
