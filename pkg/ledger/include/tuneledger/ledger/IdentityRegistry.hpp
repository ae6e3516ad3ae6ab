// Repository: TuneLedger
// Component: Identity Registry
// Purpose: Creator and consumer registration with duplicate rejection.
// Copyright (c) 2026 TuneLedger

#ifndef TUNELEDGER_LEDGER_IDENTITY_REGISTRY_HPP_
#define TUNELEDGER_LEDGER_IDENTITY_REGISTRY_HPP_

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

#include "tuneledger/ledger/LedgerTypes.hpp"

namespace tuneledger::evidence {
class EvidenceEmitter;
}

namespace tuneledger::ledger {

// Creators and consumers live in independent namespaces keyed by an external
// identity (account handle). Registration never overwrites: a second attempt
// for the same identity fails and leaves the registry unchanged. Presence is
// tracked by map membership, so an empty display name is still "registered".
//
// Not thread-safe. StreamingLedger serializes all access.
class IdentityRegistry {
 public:
  explicit IdentityRegistry(std::shared_ptr<evidence::EvidenceEmitter> emitter = nullptr);

  IdentityRegistry(const IdentityRegistry&) = delete;
  IdentityRegistry& operator=(const IdentityRegistry&) = delete;

  struct RegisterResult {
    bool success;
    LedgerError error;
    CreatorId creator_id;  // kNoCreator for consumers and failures

    static RegisterResult Success(CreatorId id = kNoCreator) {
      return {true, LedgerError::kNone, id};
    }
    static RegisterResult Failure(LedgerError err) {
      return {false, err, kNoCreator};
    }
  };

  // Allocates the next creator id (1, 2, ...). Emits CREATOR_REGISTERED.
  RegisterResult RegisterCreator(const std::string& identity,
                                 const std::string& name,
                                 const std::string& profile_ref);

  // Emits CONSUMER_REGISTERED.
  RegisterResult RegisterConsumer(const std::string& identity,
                                  const std::string& name,
                                  const std::string& profile_ref);

  bool IsRegisteredCreator(const std::string& identity) const;
  bool IsRegisteredConsumer(const std::string& identity) const;

  std::optional<Creator> FindCreator(const std::string& identity) const;
  std::optional<Consumer> FindConsumer(const std::string& identity) const;

  size_t CreatorCount() const { return creators_.size(); }
  size_t ConsumerCount() const { return consumers_.size(); }

 private:
  std::shared_ptr<evidence::EvidenceEmitter> emitter_;

  std::unordered_map<std::string, Creator> creators_;
  std::unordered_map<std::string, Consumer> consumers_;

  // Last issued creator id; pre-incremented so 0 is never handed out.
  CreatorId last_creator_id_ = kNoCreator;
};

}  // namespace tuneledger::ledger

#endif  // TUNELEDGER_LEDGER_IDENTITY_REGISTRY_HPP_
