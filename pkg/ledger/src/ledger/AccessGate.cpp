// Repository: TuneLedger
// Component: Access Gate Implementation
// Copyright (c) 2026 TuneLedger

#include "tuneledger/ledger/AccessGate.hpp"

#include <limits>
#include <stdexcept>

#include "evidence/EvidenceEmitter.hpp"
#include "tuneledger/util/Logger.hpp"

namespace tuneledger::ledger {

using util::LogLine;
using util::Logger;

const char* GrantStateName(AccessGate::GrantState state) {
  switch (state) {
    case AccessGate::GrantState::kNoGrant: return "NO_GRANT";
    case AccessGate::GrantState::kGranted: return "GRANTED";
  }
  return "UNKNOWN";
}

AccessGate::AccessGate(WorkId work_id,
                       CreatorId owner_creator_id,
                       std::string owner_identity,
                       Amount unit_price,
                       uint32_t royalty_basis_points,
                       std::shared_ptr<evidence::EvidenceEmitter> emitter)
    : work_id_(work_id),
      owner_creator_id_(owner_creator_id),
      owner_identity_(std::move(owner_identity)),
      unit_price_(unit_price),
      royalty_basis_points_(royalty_basis_points),
      emitter_(std::move(emitter)) {
  if (royalty_basis_points_ > kBasisPointsDenominator) {
    throw std::invalid_argument("AccessGate: royalty_basis_points " +
                                std::to_string(royalty_basis_points_) +
                                " exceeds " + std::to_string(kBasisPointsDenominator));
  }
}

AccessGate::GrantState AccessGate::StateFor(const std::string& consumer) const {
  return granted_to_.count(consumer) != 0 ? GrantState::kGranted : GrantState::kNoGrant;
}

LedgerError AccessGate::CheckAccess(const std::string& consumer, Amount payment) const {
  if (granted_to_.count(consumer) != 0) {
    return LedgerError::kNone;
  }
  if (payment < unit_price_) {
    return LedgerError::kInsufficientPayment;
  }
  const Amount share = ComputeRoyaltyShare(payment, royalty_basis_points_);
  if (share > std::numeric_limits<Amount>::max() - escrow_balance_ ||
      share > std::numeric_limits<Amount>::max() - total_royalty_accrued_) {
    return LedgerError::kBalanceOverflow;
  }
  return LedgerError::kNone;
}

AccessGate::AccessResult AccessGate::RequestAccess(const std::string& consumer,
                                                   Amount payment) {
  auto existing = granted_to_.find(consumer);
  if (existing != granted_to_.end()) {
    return AccessResult::AlreadyGranted(existing->second);
  }

  LedgerError err = CheckAccess(consumer, payment);
  if (err != LedgerError::kNone) {
    return AccessResult::Failure(err);
  }

  // Settlement. The map insert is the only step that can throw, so it runs
  // first; the arithmetic below cannot fail once it has succeeded.
  const Amount share = ComputeRoyaltyShare(payment, royalty_basis_points_);
  const uint64_t serial = issued_count_ + 1;
  granted_to_.emplace(consumer, serial);
  escrow_balance_ += share;
  total_royalty_accrued_ += share;
  issued_count_ = serial;

  if (emitter_) {
    evidence::RoyaltyAccruedPayload accrued;
    accrued.work_id = work_id_;
    accrued.consumer_identity = consumer;
    accrued.payment = payment;
    accrued.royalty_share = share;
    accrued.escrow_balance = escrow_balance_;
    emitter_->EmitRoyaltyAccrued(accrued);

    evidence::GrantIssuedPayload grant;
    grant.work_id = work_id_;
    grant.consumer_identity = consumer;
    grant.grant_serial = serial;
    emitter_->EmitGrantIssued(grant);
  }
  return AccessResult::Settled(share, serial);
}

LedgerError AccessGate::CheckWithdraw(const std::string& caller) const {
  if (caller != owner_identity_) {
    return LedgerError::kNotOwner;
  }
  if (escrow_balance_ == 0) {
    return LedgerError::kNothingToWithdraw;
  }
  return LedgerError::kNone;
}

AccessGate::WithdrawResult AccessGate::WithdrawEscrow(const std::string& caller,
                                                      IPaymentTransfer& transfer) {
  LedgerError err = CheckWithdraw(caller);
  if (err != LedgerError::kNone) {
    return WithdrawResult::Failure(err);
  }

  const Amount amount = escrow_balance_;
  escrow_balance_ = 0;

  TransferResult result;
  try {
    result = transfer.Transfer(owner_identity_, amount);
  } catch (...) {
    escrow_balance_ += amount;
    Logger::Error(LogLine("AccessGate", "ESCROW_RESTORED")
                      .Kv("work_id", work_id_)
                      .Kv("amount", amount)
                      .Kv("cause", "transfer_threw")
                      .str());
    throw;
  }

  if (!result.success) {
    escrow_balance_ += amount;
    Logger::Error(LogLine("AccessGate", "ESCROW_RESTORED")
                      .Kv("work_id", work_id_)
                      .Kv("amount", amount)
                      .Kv("cause", "transfer_failed")
                      .Kv("detail", result.detail)
                      .str());
    return WithdrawResult::Failure(LedgerError::kTransferFailed, result.detail);
  }

  total_royalty_paid_ += amount;
  if (emitter_) {
    evidence::RoyaltyPaidPayload p;
    p.work_id = work_id_;
    p.owner_identity = owner_identity_;
    p.amount = amount;
    emitter_->EmitRoyaltyPaid(p);
  }
  return WithdrawResult::Success(amount);
}

GateInfo AccessGate::Info() const {
  GateInfo info;
  info.work_id = work_id_;
  info.unit_price = unit_price_;
  info.owner_creator_id = owner_creator_id_;
  info.owner_identity = owner_identity_;
  info.escrow_balance = escrow_balance_;
  info.royalty_basis_points = royalty_basis_points_;
  info.granted_count = granted_to_.size();
  info.issued_count = issued_count_;
  info.total_royalty_accrued = total_royalty_accrued_;
  info.total_royalty_paid = total_royalty_paid_;
  return info;
}

}  // namespace tuneledger::ledger
