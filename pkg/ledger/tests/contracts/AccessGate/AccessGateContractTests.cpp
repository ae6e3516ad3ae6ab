// Repository: TuneLedger
// Component: Access Gate Contract Tests
// Purpose: Validates settlement, escrow and withdrawal rules of a single gate.
// Copyright (c) 2026 TuneLedger

#include "../../BaseContractTest.h"
#include "../ContractRegistryEnvironment.h"

#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

#include "tuneledger/ledger/AccessGate.hpp"
#include "../../fixtures/EventCaptureStub.h"
#include "../../fixtures/PaymentTransferStub.h"

namespace tuneledger::tests::contracts {

using namespace tuneledger::ledger;
using namespace tuneledger::tests::fixtures;

namespace {

const bool kRegisterCoverage = []() {
  RegisterExpectedDomainCoverage(
      "AccessGate",
      {"AG-001", "AG-002", "AG-003", "AG-004", "AG-005", "AG-006", "AG-007", "AG-008"});
  return true;
}();

constexpr WorkId kWork = 7;
constexpr CreatorId kOwnerId = 3;
const std::string kOwner = "0xcarol";

}  // namespace

class AccessGateContractTest : public BaseContractTest {
 protected:
  [[nodiscard]] std::string DomainName() const override {
    return "AccessGate";
  }

  [[nodiscard]] std::vector<std::string> CoveredRuleIds() const override {
    return {"AG-001", "AG-002", "AG-003", "AG-004", "AG-005", "AG-006", "AG-007", "AG-008"};
  }

  EventCaptureStub events_;
  PaymentTransferStub transfer_;
  AccessGate gate_{kWork, kOwnerId, kOwner, /*unit_price=*/1000,
                   kDefaultRoyaltyBasisPoints, events_.Emitter()};
};

// Rule: AG-001 Underpayment without a grant changes nothing
TEST_F(AccessGateContractTest, AG_001_InsufficientPaymentRejected) {
  auto r = gate_.RequestAccess("0xbob", 999);
  EXPECT_FALSE(r.granted);
  EXPECT_FALSE(r.settled);
  EXPECT_EQ(r.error, LedgerError::kInsufficientPayment);
  EXPECT_EQ(gate_.StateFor("0xbob"), AccessGate::GrantState::kNoGrant);
  EXPECT_EQ(gate_.escrow_balance(), 0u);
  EXPECT_EQ(gate_.issued_count(), 0u);
  EXPECT_TRUE(events_.GetEvents().empty());
}

// Rule: AG-002 Settlement credits floor(payment * bp / 10000) and grants
TEST_F(AccessGateContractTest, AG_002_SettlementCreditsRoyaltyShare) {
  auto r = gate_.RequestAccess("0xbob", 1000);
  ASSERT_TRUE(r.granted);
  EXPECT_TRUE(r.settled);
  EXPECT_EQ(r.royalty_share, 300u);
  EXPECT_EQ(r.grant_serial, 1u);
  EXPECT_EQ(gate_.escrow_balance(), 300u);
  EXPECT_EQ(gate_.issued_count(), 1u);
  EXPECT_TRUE(gate_.HasGrant("0xbob"));

  // Overpayment: share is computed on the full payment, floored.
  auto over = gate_.RequestAccess("0xdave", 1999);
  ASSERT_TRUE(over.settled);
  EXPECT_EQ(over.royalty_share, 599u);
  EXPECT_EQ(over.grant_serial, 2u);
  EXPECT_EQ(gate_.escrow_balance(), 899u);

  GateInfo info = gate_.Info();
  EXPECT_EQ(info.granted_count, 2u);
  EXPECT_EQ(info.issued_count, 2u);
  EXPECT_EQ(info.total_royalty_accrued, 899u);
  EXPECT_EQ(info.total_royalty_paid, 0u);
}

// Rule: AG-003 Re-access by a granted consumer is free and idempotent
TEST_F(AccessGateContractTest, AG_003_ReaccessDoesNotSettleAgain) {
  ASSERT_TRUE(gate_.RequestAccess("0xbob", 1000).settled);

  for (Amount payment : {Amount{0}, Amount{1}, Amount{1000}, Amount{50000}}) {
    auto again = gate_.RequestAccess("0xbob", payment);
    EXPECT_TRUE(again.granted);
    EXPECT_FALSE(again.settled);
    EXPECT_EQ(again.royalty_share, 0u);
    EXPECT_EQ(again.grant_serial, 1u);
  }
  EXPECT_EQ(gate_.escrow_balance(), 300u);
  EXPECT_EQ(gate_.issued_count(), 1u);
  EXPECT_EQ(events_.GetEventCount(evidence::kGrantIssued), 1u);
}

// Rule: AG-004 Withdrawal: owner only, non-empty balance, pays full balance
TEST_F(AccessGateContractTest, AG_004_WithdrawalRules) {
  EXPECT_EQ(gate_.CheckWithdraw("0xbob"), LedgerError::kNotOwner)
      << "Ownership is checked before the balance";
  EXPECT_EQ(gate_.CheckWithdraw(kOwner), LedgerError::kNothingToWithdraw);
  auto empty = gate_.WithdrawEscrow(kOwner, transfer_);
  EXPECT_FALSE(empty.success);
  EXPECT_EQ(empty.error, LedgerError::kNothingToWithdraw);

  ASSERT_TRUE(gate_.RequestAccess("0xbob", 1000).settled);

  EXPECT_EQ(gate_.CheckWithdraw(kOwner), LedgerError::kNone);
  auto stranger = gate_.WithdrawEscrow("0xbob", transfer_);
  EXPECT_FALSE(stranger.success);
  EXPECT_EQ(stranger.error, LedgerError::kNotOwner);
  EXPECT_EQ(gate_.escrow_balance(), 300u);
  EXPECT_EQ(transfer_.CallCount(), 0u) << "Rejected withdrawals never reach the transfer";

  auto paid = gate_.WithdrawEscrow(kOwner, transfer_);
  ASSERT_TRUE(paid.success);
  EXPECT_EQ(paid.amount, 300u);
  EXPECT_EQ(gate_.escrow_balance(), 0u);
  ASSERT_EQ(transfer_.CallCount(), 1u);
  EXPECT_EQ(transfer_.Calls()[0].to_identity, kOwner);
  EXPECT_EQ(transfer_.Calls()[0].amount, 300u);
  EXPECT_EQ(gate_.Info().total_royalty_paid, 300u);
  EXPECT_EQ(events_.GetEventCount(evidence::kRoyaltyPaid), 1u);

  auto twice = gate_.WithdrawEscrow(kOwner, transfer_);
  EXPECT_EQ(twice.error, LedgerError::kNothingToWithdraw);
}

// Rule: AG-005 Reported transfer failure restores the balance
TEST_F(AccessGateContractTest, AG_005_TransferFailureRestoresEscrow) {
  ASSERT_TRUE(gate_.RequestAccess("0xbob", 1000).settled);
  transfer_.SetMode(PaymentTransferStub::Mode::kFail);

  Amount seen_during_transfer = 12345;
  transfer_.SetOnTransfer([&] { seen_during_transfer = gate_.escrow_balance(); });

  auto r = gate_.WithdrawEscrow(kOwner, transfer_);
  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.error, LedgerError::kTransferFailed);
  EXPECT_EQ(r.amount, 0u);
  EXPECT_EQ(r.detail, PaymentTransferStub::FailureDetail());
  EXPECT_EQ(seen_during_transfer, 0u) << "Balance is zeroed before the transfer runs";
  EXPECT_EQ(gate_.escrow_balance(), 300u);
  EXPECT_EQ(gate_.Info().total_royalty_paid, 0u);
  EXPECT_FALSE(events_.HasEvent(evidence::kRoyaltyPaid));

  transfer_.SetOnTransfer(nullptr);
  transfer_.SetMode(PaymentTransferStub::Mode::kSucceed);
  auto retry = gate_.WithdrawEscrow(kOwner, transfer_);
  ASSERT_TRUE(retry.success);
  EXPECT_EQ(retry.amount, 300u);
}

// Rule: AG-006 A throwing transfer restores the balance and propagates
TEST_F(AccessGateContractTest, AG_006_TransferExceptionRestoresEscrow) {
  ASSERT_TRUE(gate_.RequestAccess("0xbob", 1000).settled);
  transfer_.SetMode(PaymentTransferStub::Mode::kThrow);

  EXPECT_THROW(gate_.WithdrawEscrow(kOwner, transfer_), std::runtime_error);
  EXPECT_EQ(gate_.escrow_balance(), 300u);
  EXPECT_EQ(transfer_.CallCount(), 1u);
  EXPECT_FALSE(events_.HasEvent(evidence::kRoyaltyPaid));
}

// Rule: AG-007 Royalty arithmetic is exact and overflow is rejected
TEST_F(AccessGateContractTest, AG_007_RoyaltyArithmeticBounds) {
  constexpr Amount kMax = std::numeric_limits<Amount>::max();
  EXPECT_EQ(ComputeRoyaltyShare(1000, 3000), 300u);
  EXPECT_EQ(ComputeRoyaltyShare(3, 3333), 0u);
  EXPECT_EQ(ComputeRoyaltyShare(kMax, 10000), kMax);
  EXPECT_EQ(ComputeRoyaltyShare(kMax, 0), 0u);
  EXPECT_EQ(ComputeRoyaltyShare(kMax, 5000), kMax / 2);

  AccessGate whole(1, 1, kOwner, /*unit_price=*/0, /*bp=*/10000);
  auto first = whole.RequestAccess("0xwhale", kMax);
  ASSERT_TRUE(first.settled);
  EXPECT_EQ(whole.escrow_balance(), kMax);

  auto overflow = whole.RequestAccess("0xminnow", 1);
  EXPECT_FALSE(overflow.granted);
  EXPECT_EQ(overflow.error, LedgerError::kBalanceOverflow);
  EXPECT_FALSE(whole.HasGrant("0xminnow"));
  EXPECT_EQ(whole.issued_count(), 1u);
  EXPECT_EQ(whole.escrow_balance(), kMax);

  // A zero share never overflows.
  auto free_share = whole.RequestAccess("0xfree", 0);
  EXPECT_TRUE(free_share.settled);
}

// Rule: AG-008 Settlement events are ordered; invalid rates are refused
TEST_F(AccessGateContractTest, AG_008_EventsAndConstruction) {
  ASSERT_TRUE(gate_.RequestAccess("0xbob", 1000).settled);
  auto types = events_.Types();
  ASSERT_EQ(types.size(), 2u);
  EXPECT_EQ(types[0], evidence::kRoyaltyAccrued);
  EXPECT_EQ(types[1], evidence::kGrantIssued);

  auto accrued = events_.GetEvents()[0];
  EXPECT_NE(accrued.payload.find("\"royalty_share\":300"), std::string::npos);
  EXPECT_NE(accrued.payload.find("\"escrow_balance\":300"), std::string::npos);
  EXPECT_EQ(accrued.payload_crc32, evidence::LedgerEvidence::ChecksumOf(accrued.payload));

  EXPECT_THROW({ AccessGate rejected(1, 1, kOwner, 100, 10001); }, std::invalid_argument);
  EXPECT_STREQ(GrantStateName(AccessGate::GrantState::kGranted), "GRANTED");
}

}  // namespace tuneledger::tests::contracts
