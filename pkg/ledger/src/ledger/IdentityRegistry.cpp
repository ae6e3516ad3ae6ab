// Repository: TuneLedger
// Component: Identity Registry Implementation
// Copyright (c) 2026 TuneLedger

#include "tuneledger/ledger/IdentityRegistry.hpp"

#include "evidence/EvidenceEmitter.hpp"
#include "tuneledger/util/Logger.hpp"

namespace tuneledger::ledger {

using util::LogLine;
using util::Logger;

IdentityRegistry::IdentityRegistry(std::shared_ptr<evidence::EvidenceEmitter> emitter)
    : emitter_(std::move(emitter)) {}

IdentityRegistry::RegisterResult IdentityRegistry::RegisterCreator(
    const std::string& identity,
    const std::string& name,
    const std::string& profile_ref) {
  if (creators_.count(identity) != 0) {
    Logger::Warn(LogLine("IdentityRegistry", "CREATOR_REJECTED")
                     .Kv("identity", identity)
                     .Kv("error", LedgerErrorToString(LedgerError::kAlreadyRegistered))
                     .str());
    return RegisterResult::Failure(LedgerError::kAlreadyRegistered);
  }

  Creator creator;
  creator.id = last_creator_id_ + 1;
  creator.identity = identity;
  creator.name = name;
  creator.profile_ref = profile_ref;
  creators_.emplace(identity, creator);
  last_creator_id_ = creator.id;

  Logger::Info(LogLine("IdentityRegistry", "CREATOR_REGISTERED")
                   .Kv("identity", identity)
                   .Kv("creator_id", creator.id)
                   .str());
  if (emitter_) {
    evidence::CreatorRegisteredPayload p;
    p.identity = identity;
    p.name = name;
    p.creator_id = creator.id;
    emitter_->EmitCreatorRegistered(p);
  }
  return RegisterResult::Success(creator.id);
}

IdentityRegistry::RegisterResult IdentityRegistry::RegisterConsumer(
    const std::string& identity,
    const std::string& name,
    const std::string& profile_ref) {
  auto inserted = consumers_.emplace(identity, Consumer{identity, name, profile_ref});
  if (!inserted.second) {
    Logger::Warn(LogLine("IdentityRegistry", "CONSUMER_REJECTED")
                     .Kv("identity", identity)
                     .Kv("error", LedgerErrorToString(LedgerError::kAlreadyRegistered))
                     .str());
    return RegisterResult::Failure(LedgerError::kAlreadyRegistered);
  }

  Logger::Info(LogLine("IdentityRegistry", "CONSUMER_REGISTERED")
                   .Kv("identity", identity)
                   .str());
  if (emitter_) {
    emitter_->EmitConsumerRegistered({identity, name});
  }
  return RegisterResult::Success();
}

bool IdentityRegistry::IsRegisteredCreator(const std::string& identity) const {
  return creators_.count(identity) != 0;
}

bool IdentityRegistry::IsRegisteredConsumer(const std::string& identity) const {
  return consumers_.count(identity) != 0;
}

std::optional<Creator> IdentityRegistry::FindCreator(const std::string& identity) const {
  auto it = creators_.find(identity);
  if (it == creators_.end()) return std::nullopt;
  return it->second;
}

std::optional<Consumer> IdentityRegistry::FindConsumer(const std::string& identity) const {
  auto it = consumers_.find(identity);
  if (it == consumers_.end()) return std::nullopt;
  return it->second;
}

}  // namespace tuneledger::ledger
