#pragma once

#include "trustflow/domain/order.hpp"

#include <string>
#include <vector>

namespace trustflow {

// -----------------------------------------------------------------------------
// IRuleChecker — static review of generated source text
// -----------------------------------------------------------------------------
// OrderOrchestrator::auditOrder runs the checker over an order's stored
// source and records the findings on the order. StaticRuleChecker is the
// default and always reports a single informational finding.
// -----------------------------------------------------------------------------
class IRuleChecker {
 public:
  virtual ~IRuleChecker() = default;

  virtual std::vector<domain::RuleFinding> check(
      const std::string& source_text) = 0;
};

class StaticRuleChecker final : public IRuleChecker {
 public:
  std::vector<domain::RuleFinding> check(
      const std::string& source_text) override;
};

}  // namespace trustflow
