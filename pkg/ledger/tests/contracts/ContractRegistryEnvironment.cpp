#include "ContractRegistryEnvironment.h"

#include <gtest/gtest.h>

#include <map>
#include <mutex>
#include <set>

#include "../ContractRegistry.h"

namespace tuneledger::tests
{

namespace
{

struct ExpectedCoverage
{
  std::mutex mutex;
  std::map<std::string, std::set<std::string>> rules;
};

ExpectedCoverage& Expected()
{
  static ExpectedCoverage expected;
  return expected;
}

// Fails the run when an expected rule id was not covered by any suite that
// actually executed. Skipped when a test filter narrows the run.
class ContractRegistryEnvironment : public ::testing::Environment
{
public:
  void TearDown() override
  {
    if (GTEST_FLAG_GET(filter) != "*")
    {
      return;
    }
    std::lock_guard<std::mutex> lock(Expected().mutex);
    for (const auto& entry : Expected().rules)
    {
      std::vector<std::string> expected(entry.second.begin(), entry.second.end());
      auto missing = ContractRegistry::Instance().MissingRules(entry.first, expected);
      for (const auto& rule : missing)
      {
        ADD_FAILURE() << "Contract rule " << rule << " in domain " << entry.first
                      << " has no executed test";
      }
    }
  }
};

const bool kEnvironmentRegistered = []() {
  ::testing::AddGlobalTestEnvironment(new ContractRegistryEnvironment());
  return true;
}();

} // namespace

void RegisterExpectedDomainCoverage(std::string domain,
                                    std::vector<std::string> rule_ids)
{
  std::lock_guard<std::mutex> lock(Expected().mutex);
  auto& rules = Expected().rules[domain];
  rules.insert(rule_ids.begin(), rule_ids.end());
}

} // namespace tuneledger::tests
