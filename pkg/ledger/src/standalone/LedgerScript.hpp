// Repository: TuneLedger
// Component: Ledger command script runner
// Purpose: Replays a line-oriented command script against a StreamingLedger.
// Copyright (c) 2026 TuneLedger

#pragma once

#include <cstdint>
#include <istream>
#include <ostream>
#include <string>
#include <vector>

#include "tuneledger/ledger/StreamingLedger.hpp"

namespace tuneledger::standalone {

// Script grammar, one command per line, '#' starts a comment:
//
//   register-creator IDENTITY NAME [PROFILE]
//   register-consumer IDENTITY NAME [PROFILE]
//   publish CREATOR PRICE AUDIO COVER TITLE...
//   stream CONSUMER WORK_ID PAYMENT
//   withdraw CALLER WORK_ID
//   works [CREATOR]
//   history CONSUMER
//   stats
//
// Each command prints one "line N: <command> -> OK ..." or
// "line N: <command> -> ERROR <CODE>" line; listings follow indented.
struct ScriptSummary {
  uint64_t commands = 0;
  uint64_t failed = 0;
  bool stopped_early = false;  // fail_fast hit a failing command
  std::vector<uint64_t> failed_lines;
};

class LedgerScript {
 public:
  LedgerScript(ledger::StreamingLedger& ledger, std::ostream& out);

  // Runs every command in `in`. With fail_fast, stops at the first failure.
  ScriptSummary Run(std::istream& in, bool fail_fast);

  // Runs one line; returns false if the command failed or was malformed.
  // Blank and comment lines succeed without output.
  bool RunLine(uint64_t line_no, const std::string& line);

 private:
  bool CmdRegisterCreator(const std::string& prefix, const std::vector<std::string>& args);
  bool CmdRegisterConsumer(const std::string& prefix, const std::vector<std::string>& args);
  bool CmdPublish(const std::string& prefix, const std::vector<std::string>& args);
  bool CmdStream(const std::string& prefix, const std::vector<std::string>& args);
  bool CmdWithdraw(const std::string& prefix, const std::vector<std::string>& args);
  bool CmdWorks(const std::string& prefix, const std::vector<std::string>& args);
  bool CmdHistory(const std::string& prefix, const std::vector<std::string>& args);
  bool CmdStats(const std::string& prefix, const std::vector<std::string>& args);

  bool Fail(const std::string& prefix, const std::string& code);

  ledger::StreamingLedger& ledger_;
  std::ostream& out_;
};

// Strict decimal parse; false on empty input, sign, junk or overflow.
bool ParseUint64(const std::string& text, uint64_t* out);

}  // namespace tuneledger::standalone
