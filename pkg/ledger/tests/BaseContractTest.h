#ifndef TUNELEDGER_TESTS_BASE_CONTRACT_TEST_H_
#define TUNELEDGER_TESTS_BASE_CONTRACT_TEST_H_

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "ContractRegistry.h"
#include "tuneledger/util/Logger.hpp"

namespace tuneledger::tests
{

// Base fixture for contract suites. Each suite names its domain and the rule
// ids it covers; SetUp records that coverage so the registry environment can
// flag rules that no executed suite exercised.
class BaseContractTest : public ::testing::Test
{
protected:
  [[nodiscard]] virtual std::string DomainName() const = 0;
  [[nodiscard]] virtual std::vector<std::string> CoveredRuleIds() const = 0;

  void SetUp() override
  {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    ContractRegistry::Instance().RegisterSuite(
        DomainName(), info != nullptr ? info->test_suite_name() : "", CoveredRuleIds());
  }

  void TearDown() override
  {
    util::Logger::ClearSinks();
  }
};

} // namespace tuneledger::tests

#endif // TUNELEDGER_TESTS_BASE_CONTRACT_TEST_H_
