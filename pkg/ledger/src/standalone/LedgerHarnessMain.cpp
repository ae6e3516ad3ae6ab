// Repository: TuneLedger
// Component: Standalone Ledger Harness
// Purpose: Replays a command script against an in-process StreamingLedger.
// Copyright (c) 2026 TuneLedger
//
// This binary is for testing and diagnostics only. The ledger does not know
// it is being driven from a script.
//
// EXAMPLE:
//   tuneledger_harness --script demo.ledger --spool-dir /tmp/ledger \
//                      --payout-journal /tmp/payouts.log --fail-fast

#include <cstdlib>
#include <exception>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

#include "evidence/EvidenceEmitter.hpp"
#include "evidence/EvidenceSpool.hpp"
#include "tuneledger/ledger/LedgerConfig.hpp"
#include "tuneledger/ledger/StreamingLedger.hpp"

#include "JournalPaymentTransfer.hpp"
#include "LedgerScript.hpp"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitCommandFailed = 2;

// =============================================================================
// CLI Arguments
// =============================================================================
struct CliArgs {
  std::string script_path;
  std::string ledger_id = "default";
  uint32_t royalty_bps = tuneledger::ledger::kDefaultRoyaltyBasisPoints;
  bool require_registered_consumer = false;
  std::string spool_dir;        // Empty: events are not spooled
  std::string payout_journal;   // Empty: withdrawals fail with TRANSFER_FAILED
  bool fail_fast = false;
  bool help = false;
  bool valid = false;
  std::string error;
};

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " --script FILE [OPTIONS]\n"
            << "\n"
            << "Replays a ledger command script and prints one result line per command.\n"
            << "\n"
            << "OPTIONS:\n"
            << "  --script FILE                 Command script (required)\n"
            << "  --ledger-id ID                Ledger id for events and spool files (default: default)\n"
            << "  --royalty-bps N               Default royalty rate, 0..10000 (default: 3000)\n"
            << "  --require-registered-consumer Reject streams from unregistered consumers\n"
            << "  --spool-dir DIR               Spool ledger events to DIR/<ledger-id>.spool.jsonl\n"
            << "  --payout-journal FILE         Pay withdrawals by appending to FILE\n"
            << "  --fail-fast                   Stop at the first failed command (exit 2)\n"
            << "  --help                        Show this help message\n"
            << "\n"
            << "SCRIPT COMMANDS:\n"
            << "  register-creator IDENTITY NAME [PROFILE]\n"
            << "  register-consumer IDENTITY NAME [PROFILE]\n"
            << "  publish CREATOR PRICE AUDIO COVER TITLE...\n"
            << "  stream CONSUMER WORK_ID PAYMENT\n"
            << "  withdraw CALLER WORK_ID\n"
            << "  works [CREATOR]\n"
            << "  history CONSUMER\n"
            << "  stats\n"
            << "\n";
}

CliArgs ParseArgs(int argc, char* argv[]) {
  CliArgs args;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      args.help = true;
      args.valid = true;
      return args;
    } else if (arg == "--script" && i + 1 < argc) {
      args.script_path = argv[++i];
    } else if (arg == "--ledger-id" && i + 1 < argc) {
      args.ledger_id = argv[++i];
    } else if (arg == "--royalty-bps" && i + 1 < argc) {
      uint64_t bps = 0;
      if (!tuneledger::standalone::ParseUint64(argv[++i], &bps) ||
          bps > tuneledger::ledger::kBasisPointsDenominator) {
        args.error = "--royalty-bps must be an integer in 0..10000";
        return args;
      }
      args.royalty_bps = static_cast<uint32_t>(bps);
    } else if (arg == "--require-registered-consumer") {
      args.require_registered_consumer = true;
    } else if (arg == "--spool-dir" && i + 1 < argc) {
      args.spool_dir = argv[++i];
    } else if (arg == "--payout-journal" && i + 1 < argc) {
      args.payout_journal = argv[++i];
    } else if (arg == "--fail-fast") {
      args.fail_fast = true;
    } else {
      args.error = "Unknown argument: " + arg;
      return args;
    }
  }

  if (args.script_path.empty()) {
    args.error = "Must specify --script";
    return args;
  }

  args.valid = true;
  return args;
}

int RunHarness(const CliArgs& args) {
  using namespace tuneledger;

  std::ifstream script(args.script_path);
  if (!script) {
    std::cerr << "Error: cannot open script " << args.script_path << "\n";
    return kExitUsage;
  }

  ledger::LedgerConfig config;
  config.ledger_id = args.ledger_id;
  config.default_royalty_basis_points = args.royalty_bps;
  config.require_registered_consumer = args.require_registered_consumer;
  std::string config_error;
  if (!config.IsValid(&config_error)) {
    std::cerr << "Error: " << config_error << "\n";
    return kExitUsage;
  }

  std::shared_ptr<evidence::EvidenceSpool> spool;
  std::shared_ptr<evidence::EvidenceEmitter> emitter;
  if (!args.spool_dir.empty()) {
    spool = std::make_shared<evidence::EvidenceSpool>(config.ledger_id, args.spool_dir);
    emitter = std::make_shared<evidence::EvidenceEmitter>(config.ledger_id, spool);
  }

  std::shared_ptr<ledger::IPaymentTransfer> transfer;
  if (!args.payout_journal.empty()) {
    transfer = std::make_shared<standalone::JournalPaymentTransfer>(args.payout_journal);
  }

  ledger::StreamingLedger ledger(config, emitter, transfer);
  standalone::LedgerScript runner(ledger, std::cout);
  standalone::ScriptSummary summary = runner.Run(script, args.fail_fast);

  if (spool) spool->Flush();

  std::cout << "summary commands=" << summary.commands
            << " failed=" << summary.failed
            << (summary.stopped_early ? " stopped_early=true" : "") << "\n";
  if (emitter) {
    std::cout << "evidence last_sequence=" << emitter->CurrentSequence()
              << " degraded=" << (emitter->IsDegraded() ? "true" : "false") << "\n";
  }

  if (args.fail_fast && summary.failed > 0) return kExitCommandFailed;
  return kExitOk;
}

}  // namespace

int main(int argc, char* argv[]) {
  CliArgs args = ParseArgs(argc, argv);

  if (args.help) {
    PrintUsage(argv[0]);
    return kExitOk;
  }

  if (!args.valid) {
    std::cerr << "Error: " << args.error << "\n\n";
    PrintUsage(argv[0]);
    return kExitUsage;
  }

  try {
    return RunHarness(args);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return kExitUsage;
  }
}
