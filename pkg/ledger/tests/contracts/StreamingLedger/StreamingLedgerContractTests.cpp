// Repository: TuneLedger
// Component: Streaming Ledger Contract Tests
// Purpose: Validates stream, withdrawal, concurrency and event rules of the ledger.
// Copyright (c) 2026 TuneLedger

#include "../../BaseContractTest.h"
#include "../ContractRegistryEnvironment.h"

#include <atomic>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "tuneledger/ledger/StreamingLedger.hpp"
#include "../../fixtures/EventCaptureStub.h"
#include "../../fixtures/PaymentTransferStub.h"

namespace tuneledger::tests::contracts {

using namespace tuneledger::ledger;
using namespace tuneledger::tests::fixtures;

namespace {

const bool kRegisterCoverage = []() {
  RegisterExpectedDomainCoverage(
      "StreamingLedger",
      {"SL-001", "SL-002", "SL-003", "SL-004", "SL-005", "SL-006", "SL-007",
       "SL-008", "SL-009", "SL-010", "SL-011"});
  return true;
}();

const std::string kCreator = "0xcarol";
const std::string kAudio = "ipfs://song.mp3";

}  // namespace

class StreamingLedgerContractTest : public BaseContractTest {
 protected:
  [[nodiscard]] std::string DomainName() const override {
    return "StreamingLedger";
  }

  [[nodiscard]] std::vector<std::string> CoveredRuleIds() const override {
    return {"SL-001", "SL-002", "SL-003", "SL-004", "SL-005", "SL-006", "SL-007",
            "SL-008", "SL-009", "SL-010", "SL-011"};
  }

  void SetUp() override {
    BaseContractTest::SetUp();
    LedgerConfig config;
    config.ledger_id = "contract-ledger";
    ledger_ = std::make_unique<StreamingLedger>(config, events_.Emitter(), transfer_);
    ASSERT_TRUE(ledger_->RegisterCreator(kCreator, "Carol", "ipfs://carol.png").success);
    auto published = ledger_->Publish(kCreator, "Song", kAudio, "ipfs://song.jpg", 1000);
    ASSERT_TRUE(published.success);
    work_ = published.work_id;
  }

  Work CurrentWork() const {
    auto r = ledger_->GetWork(work_);
    EXPECT_TRUE(r.success);
    return r.work;
  }

  EventCaptureStub events_;
  std::shared_ptr<PaymentTransferStub> transfer_ = std::make_shared<PaymentTransferStub>();
  std::unique_ptr<StreamingLedger> ledger_;
  WorkId work_ = kNoWork;
};

// Rule: SL-001 Underpaid first stream fails and changes nothing
TEST_F(StreamingLedgerContractTest, SL_001_UnderpaidStreamChangesNothing) {
  auto r = ledger_->Stream("0xbob", work_, 999);
  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.error, LedgerError::kInsufficientPayment);
  EXPECT_TRUE(r.audio_ref.empty());

  Work w = CurrentWork();
  EXPECT_EQ(w.gate.escrow_balance, 0u);
  EXPECT_EQ(w.play_count, 0u);
  EXPECT_TRUE(ledger_->PlayHistory("0xbob").empty());
  EXPECT_FALSE(ledger_->HasAccess("0xbob", work_));
  EXPECT_EQ(ledger_->Stats().plays, 0u);

  for (int i = 0; i < 5; ++i) {
    ASSERT_FALSE(ledger_->Stream("0xunder" + std::to_string(i), work_, 1).success);
  }
  EXPECT_EQ(ledger_->Stats().active_consumers, 0u)
      << "Rejected streams must not leave per-consumer history behind";
}

// Rule: SL-002 Escrow is credited exactly once per consumer
TEST_F(StreamingLedgerContractTest, SL_002_SingleSettlementPerConsumer) {
  auto first = ledger_->Stream("0xbob", work_, 1000);
  ASSERT_TRUE(first.success);
  EXPECT_EQ(first.audio_ref, kAudio);
  EXPECT_TRUE(first.settled);
  EXPECT_EQ(first.royalty_share, 300u);
  EXPECT_EQ(first.play_sequence, 1u);
  EXPECT_EQ(CurrentWork().gate.escrow_balance, 300u);

  auto again = ledger_->Stream("0xbob", work_, 0);
  ASSERT_TRUE(again.success);
  EXPECT_EQ(again.audio_ref, kAudio);
  EXPECT_FALSE(again.settled);
  EXPECT_EQ(again.play_sequence, 2u);

  auto generous = ledger_->Stream("0xbob", work_, 5000);
  ASSERT_TRUE(generous.success);
  EXPECT_FALSE(generous.settled);

  Work w = CurrentWork();
  EXPECT_EQ(w.play_count, 3u);
  EXPECT_EQ(w.gate.escrow_balance, 300u);
  EXPECT_EQ(w.gate.issued_count, 1u);
  EXPECT_TRUE(ledger_->HasAccess("0xbob", work_));
}

// Rule: SL-003 Unknown works are rejected for stream and withdraw
TEST_F(StreamingLedgerContractTest, SL_003_UnknownWorkRejected) {
  EXPECT_EQ(ledger_->Stream("0xbob", kNoWork, 1000).error, LedgerError::kWorkNotFound);
  EXPECT_EQ(ledger_->Stream("0xbob", work_ + 1, 1000).error, LedgerError::kWorkNotFound);
  EXPECT_EQ(ledger_->WithdrawEscrow(kCreator, work_ + 1).error, LedgerError::kWorkNotFound);
  EXPECT_FALSE(ledger_->HasAccess("0xbob", work_ + 1));
  EXPECT_EQ(ledger_->GetWork(work_ + 1).error, LedgerError::kWorkNotFound);
  EXPECT_EQ(transfer_->CallCount(), 0u);
}

// Rule: SL-004 Withdrawal through the ledger honours owner, balance, rollback
TEST_F(StreamingLedgerContractTest, SL_004_WithdrawalThroughLedger) {
  EXPECT_EQ(ledger_->WithdrawEscrow(kCreator, work_).error, LedgerError::kNothingToWithdraw);
  ASSERT_TRUE(ledger_->Stream("0xbob", work_, 1000).success);
  EXPECT_EQ(ledger_->WithdrawEscrow("0xbob", work_).error, LedgerError::kNotOwner);

  transfer_->SetMode(PaymentTransferStub::Mode::kFail);
  auto failed = ledger_->WithdrawEscrow(kCreator, work_);
  EXPECT_EQ(failed.error, LedgerError::kTransferFailed);
  EXPECT_EQ(CurrentWork().gate.escrow_balance, 300u);

  transfer_->SetMode(PaymentTransferStub::Mode::kThrow);
  EXPECT_THROW(ledger_->WithdrawEscrow(kCreator, work_), std::runtime_error);
  EXPECT_EQ(CurrentWork().gate.escrow_balance, 300u);

  transfer_->SetMode(PaymentTransferStub::Mode::kSucceed);
  auto paid = ledger_->WithdrawEscrow(kCreator, work_);
  ASSERT_TRUE(paid.success);
  EXPECT_EQ(paid.amount, 300u);
  EXPECT_EQ(CurrentWork().gate.escrow_balance, 0u);
  EXPECT_EQ(transfer_->CallCount(), 3u);

  StreamingLedger no_transfer;
  ASSERT_TRUE(no_transfer.RegisterCreator(kCreator, "Carol", "").success);
  WorkId id = no_transfer.Publish(kCreator, "Song", kAudio, "", 1000).work_id;
  EXPECT_EQ(no_transfer.WithdrawEscrow(kCreator, id).error, LedgerError::kNothingToWithdraw);
  ASSERT_TRUE(no_transfer.Stream("0xbob", id, 1000).success);
  EXPECT_EQ(no_transfer.WithdrawEscrow("0xmallory", id).error, LedgerError::kNotOwner);
  auto unconfigured = no_transfer.WithdrawEscrow(kCreator, id);
  EXPECT_EQ(unconfigured.error, LedgerError::kTransferFailed);
  EXPECT_EQ(unconfigured.detail, "no payment transfer configured");
  EXPECT_EQ(no_transfer.GetWork(id).work.gate.escrow_balance, 300u);
}

// Rule: SL-005 Concurrent first streams from distinct consumers all settle
TEST_F(StreamingLedgerContractTest, SL_005_ConcurrentDistinctConsumers) {
  constexpr int kThreads = 16;
  constexpr int kConsumersPerThread = 25;
  std::atomic<int> failures{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t] {
      for (int i = 0; i < kConsumersPerThread; ++i) {
        std::string consumer = "0xc" + std::to_string(t) + "_" + std::to_string(i);
        auto r = ledger_->Stream(consumer, work_, 1000);
        if (!r.success || !r.settled) failures.fetch_add(1);
      }
    });
  }
  for (auto& th : threads) th.join();

  constexpr uint64_t kN = kThreads * kConsumersPerThread;
  EXPECT_EQ(failures.load(), 0);
  Work w = CurrentWork();
  EXPECT_EQ(w.gate.escrow_balance, kN * 300u) << "No lost update, no double credit";
  EXPECT_EQ(w.gate.granted_count, kN);
  EXPECT_EQ(w.gate.issued_count, kN);
  EXPECT_EQ(w.play_count, kN);
}

// Rule: SL-006 Concurrent first streams from one consumer settle once
TEST_F(StreamingLedgerContractTest, SL_006_ConcurrentSameConsumerSettlesOnce) {
  constexpr int kThreads = 12;
  std::atomic<int> settled{0};
  std::atomic<int> succeeded{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&] {
      auto r = ledger_->Stream("0xbob", work_, 1000);
      if (r.success) succeeded.fetch_add(1);
      if (r.settled) settled.fetch_add(1);
    });
  }
  for (auto& th : threads) th.join();

  EXPECT_EQ(succeeded.load(), kThreads);
  EXPECT_EQ(settled.load(), 1);
  EXPECT_EQ(CurrentWork().gate.escrow_balance, 300u);
  EXPECT_EQ(ledger_->PlayHistory("0xbob").size(), static_cast<size_t>(kThreads));
}

// Rule: SL-007 Per-identity listings keep insertion order and isolation
TEST_F(StreamingLedgerContractTest, SL_007_ListingsOrderedAndIsolated) {
  ASSERT_TRUE(ledger_->RegisterCreator("0xalice", "Alice", "").success);
  WorkId a1 = ledger_->Publish("0xalice", "a1", "ipfs://a1", "", 10).work_id;
  WorkId c2 = ledger_->Publish(kCreator, "c2", "ipfs://c2", "", 10).work_id;
  WorkId a2 = ledger_->Publish("0xalice", "a2", "ipfs://a2", "", 10).work_id;

  auto alice = ledger_->WorksByCreator("0xalice");
  ASSERT_EQ(alice.size(), 2u);
  EXPECT_EQ(alice[0].id, a1);
  EXPECT_EQ(alice[1].id, a2);

  auto carol = ledger_->WorksByCreator(kCreator);
  ASSERT_EQ(carol.size(), 2u);
  EXPECT_EQ(carol[0].id, work_);
  EXPECT_EQ(carol[1].id, c2);

  ASSERT_EQ(ledger_->AllWorks().size(), 4u);

  ASSERT_TRUE(ledger_->Stream("0xbob", a2, 10).success);
  ASSERT_TRUE(ledger_->Stream("0xdave", a1, 10).success);
  ASSERT_TRUE(ledger_->Stream("0xbob", work_, 1000).success);
  ASSERT_TRUE(ledger_->Stream("0xbob", a2, 0).success);
  ASSERT_FALSE(ledger_->Stream("0xbob", c2, 1).success);

  auto bob = ledger_->PlayHistory("0xbob");
  ASSERT_EQ(bob.size(), 3u);
  EXPECT_EQ(bob[0].work_id, a2);
  EXPECT_EQ(bob[1].work_id, work_);
  EXPECT_EQ(bob[2].work_id, a2);
  EXPECT_LT(bob[0].sequence, bob[1].sequence);
  EXPECT_LT(bob[1].sequence, bob[2].sequence);
  for (const auto& p : bob) {
    EXPECT_EQ(p.consumer_identity, "0xbob");
    EXPECT_GT(p.played_utc_ms, 0);
  }

  auto dave = ledger_->PlayHistory("0xdave");
  ASSERT_EQ(dave.size(), 1u);
  EXPECT_EQ(dave[0].work_id, a1);
  EXPECT_TRUE(ledger_->PlayHistory("0xnobody").empty());
}

// Rule: SL-008 Configuration: validation and optional consumer registration
TEST_F(StreamingLedgerContractTest, SL_008_ConfigurationEnforced) {
  LedgerConfig bad;
  bad.default_royalty_basis_points = 10001;
  EXPECT_THROW({ StreamingLedger rejected(bad); }, std::invalid_argument);
  bad = LedgerConfig{};
  bad.ledger_id = "";
  EXPECT_THROW({ StreamingLedger rejected(bad); }, std::invalid_argument);
  bad.ledger_id = "a/b";
  EXPECT_THROW({ StreamingLedger rejected(bad); }, std::invalid_argument);

  LedgerConfig strict;
  strict.require_registered_consumer = true;
  strict.default_royalty_basis_points = 2500;
  StreamingLedger ledger(strict);
  ASSERT_TRUE(ledger.RegisterCreator(kCreator, "Carol", "").success);
  WorkId id = ledger.Publish(kCreator, "Song", kAudio, "", 1000).work_id;

  EXPECT_EQ(ledger.Stream("0xbob", id, 1000).error, LedgerError::kNotRegisteredConsumer);
  EXPECT_EQ(ledger.GetWork(id).work.gate.escrow_balance, 0u);

  ASSERT_TRUE(ledger.RegisterConsumer("0xbob", "Bob", "").success);
  auto r = ledger.Stream("0xbob", id, 1000);
  ASSERT_TRUE(r.success);
  EXPECT_EQ(r.royalty_share, 250u);

  // Default ledger: unregistered consumers may stream.
  EXPECT_TRUE(ledger_->Stream("0xunregistered", work_, 1000).success);
}

// Rule: SL-009 Concurrent withdrawals and settlements conserve royalty
TEST_F(StreamingLedgerContractTest, SL_009_WithdrawalsConserveRoyalty) {
  constexpr int kStreamers = 8;
  constexpr int kPerStreamer = 50;
  std::atomic<bool> done{false};
  std::atomic<uint64_t> withdrawn{0};

  // Every third transfer fails; its amount must come back to escrow.
  std::atomic<int> calls{0};
  transfer_->SetOnTransfer([&] {
    transfer_->SetMode(calls.fetch_add(1) % 3 == 2 ? PaymentTransferStub::Mode::kFail
                                                    : PaymentTransferStub::Mode::kSucceed);
  });

  std::thread withdrawer([&] {
    while (!done.load()) {
      auto r = ledger_->WithdrawEscrow(kCreator, work_);
      if (r.success) withdrawn.fetch_add(r.amount);
      std::this_thread::yield();
    }
  });

  std::vector<std::thread> streamers;
  for (int t = 0; t < kStreamers; ++t) {
    streamers.emplace_back([&, t] {
      for (int i = 0; i < kPerStreamer; ++i) {
        ledger_->Stream("0xs" + std::to_string(t) + "_" + std::to_string(i), work_, 1000);
      }
    });
  }
  for (auto& th : streamers) th.join();
  done.store(true);
  withdrawer.join();

  Work w = CurrentWork();
  const uint64_t accrued = static_cast<uint64_t>(kStreamers) * kPerStreamer * 300u;
  EXPECT_EQ(w.gate.total_royalty_accrued, accrued);
  EXPECT_EQ(w.gate.total_royalty_paid, withdrawn.load());
  EXPECT_EQ(w.gate.escrow_balance + withdrawn.load(), accrued);
}

// Rule: SL-010 Stats and the event stream reflect committed operations only
TEST_F(StreamingLedgerContractTest, SL_010_StatsAndEventStream) {
  ASSERT_TRUE(ledger_->RegisterConsumer("0xbob", "Bob", "").success);
  ASSERT_TRUE(ledger_->Stream("0xbob", work_, 1000).success);
  ASSERT_FALSE(ledger_->Stream("0xdave", work_, 1).success);
  ASSERT_TRUE(ledger_->Stream("0xbob", work_, 0).success);
  ASSERT_TRUE(ledger_->WithdrawEscrow(kCreator, work_).success);

  LedgerStats stats = ledger_->Stats();
  EXPECT_EQ(stats.creators, 1u);
  EXPECT_EQ(stats.consumers, 1u);
  EXPECT_EQ(stats.active_consumers, 1u);
  EXPECT_EQ(stats.works, 1u);
  EXPECT_EQ(stats.plays, 2u);
  EXPECT_EQ(stats.grants, 1u);

  const std::vector<std::string> expected = {
      evidence::kCreatorRegistered, evidence::kWorkPublished,
      evidence::kConsumerRegistered, evidence::kRoyaltyAccrued,
      evidence::kGrantIssued,        evidence::kWorkPlayed,
      evidence::kWorkPlayed,         evidence::kRoyaltyPaid};
  EXPECT_EQ(events_.Types(), expected);

  auto events = events_.GetEvents();
  for (size_t i = 0; i < events.size(); ++i) {
    EXPECT_EQ(events[i].sequence, i + 1) << "Sequences must be gap-free";
    EXPECT_EQ(events[i].ledger_id, "contract-ledger");
  }

  EXPECT_TRUE(ledger_->IsRegisteredCreator(kCreator));
  EXPECT_TRUE(ledger_->IsRegisteredConsumer("0xbob"));
  EXPECT_FALSE(ledger_->IsRegisteredConsumer("0xdave"));
  ASSERT_TRUE(ledger_->FindCreator(kCreator).has_value());
  EXPECT_EQ(ledger_->FindCreator(kCreator)->profile_ref, "ipfs://carol.png");
  EXPECT_EQ(ledger_->FindConsumer("0xbob")->name, "Bob");
}

// Rule: SL-011 Event listeners run after the ledger lock is released
TEST_F(StreamingLedgerContractTest, SL_011_ListenersMayCallBackIntoLedger) {
  StreamingLedger* ledger = ledger_.get();
  const WorkId work = work_;
  std::vector<uint64_t> plays_seen;
  std::vector<uint64_t> escrow_seen;
  events_.Emitter()->AddListener([&, ledger, work](const evidence::LedgerEvidence& e) {
    if (e.payload_type == evidence::kWorkPlayed) {
      plays_seen.push_back(ledger->Stats().plays);
      escrow_seen.push_back(ledger->GetWork(work).work.gate.escrow_balance);
    } else if (e.payload_type == evidence::kConsumerRegistered) {
      // Writes from a listener are queued behind the event being delivered.
      ledger->Stream("0xindexer", work, 1000);
    }
  });
  events_.Clear();

  ASSERT_TRUE(ledger_->RegisterConsumer("0xbob", "Bob", "").success);
  ASSERT_TRUE(ledger_->Stream("0xbob", work_, 1000).success);

  ASSERT_EQ(plays_seen.size(), 2u);
  EXPECT_EQ(plays_seen[0], 1u);
  EXPECT_EQ(plays_seen[1], 2u);
  EXPECT_EQ(escrow_seen[0], 300u);
  EXPECT_EQ(escrow_seen[1], 600u);
  EXPECT_TRUE(ledger_->HasAccess("0xindexer", work_));

  const std::vector<std::string> expected = {
      evidence::kConsumerRegistered, evidence::kRoyaltyAccrued,
      evidence::kGrantIssued,        evidence::kWorkPlayed,
      evidence::kRoyaltyAccrued,     evidence::kGrantIssued,
      evidence::kWorkPlayed};
  EXPECT_EQ(events_.Types(), expected);
  auto events = events_.GetEvents();
  for (size_t i = 1; i < events.size(); ++i) {
    EXPECT_EQ(events[i].sequence, events[i - 1].sequence + 1)
        << "Listeners must see events in sequence order";
  }
}

}  // namespace tuneledger::tests::contracts
