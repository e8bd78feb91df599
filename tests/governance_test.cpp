// =============================================================================
// governance_test.cpp
// =============================================================================
// Unit tests for trustflow::SimulatedGovernance and the advisory
// collaborators (source generator, rule checker).
//
// Validates:
//   - Proposal ids start at the configured base and increase
//   - propose() records title, proposer, order and creation time
//   - simulateApproval() approves the order's latest proposal
//   - Lookups by id and by order; ProposalNotFound for unknown ids
//   - Placeholder source generation and static rule findings
// =============================================================================

#include "trustflow/advisory/i_rule_checker.hpp"
#include "trustflow/advisory/placeholder_source_generator.hpp"
#include "trustflow/errors.hpp"
#include "trustflow/governance/simulated_governance.hpp"
#include "trustflow/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <string>

namespace domain = trustflow::domain;

class SimulatedGovernanceTest : public ::testing::Test {
 protected:
  // 2025-07-31T01:40:14Z
  trustflow::SimulationTimeProvider clock{1753926014000};
  trustflow::SimulatedGovernance governance{clock};
};

// -----------------------------------------------------------------------------
// 1. Ids start at kFirstProposalId and increase by one.
// -----------------------------------------------------------------------------
TEST_F(SimulatedGovernanceTest, ProposalIdsAreSequential) {
  auto a = governance.propose(1, "first", "0xproposer");
  auto b = governance.propose(2, "second", "0xproposer");

  EXPECT_EQ(a.id, trustflow::SimulatedGovernance::kFirstProposalId);
  EXPECT_EQ(b.id, a.id + 1);
}

// -----------------------------------------------------------------------------
// 2. A new proposal is Pending and carries what it was raised with.
// -----------------------------------------------------------------------------
TEST_F(SimulatedGovernanceTest, ProposeRecordsFields) {
  auto p = governance.propose(7, "Approve Limit Order #7 (0.01 WETH)",
                              "0x7E5F4552091A69125d5DfCb7b8C2659029395Bdf");

  EXPECT_EQ(p.order_id, 7u);
  EXPECT_EQ(p.title, "Approve Limit Order #7 (0.01 WETH)");
  EXPECT_EQ(p.proposer, "0x7E5F4552091A69125d5DfCb7b8C2659029395Bdf");
  EXPECT_EQ(p.status, domain::ProposalStatus::Pending);
  EXPECT_EQ(p.created_at, 1753926014);
}

// -----------------------------------------------------------------------------
// 3. simulateApproval() flips the order's proposal to Approved, and the
//    stored copy reflects it.
// -----------------------------------------------------------------------------
TEST_F(SimulatedGovernanceTest, SimulateApprovalApproves) {
  auto p = governance.propose(3, "t", "w");
  auto decided = governance.simulateApproval(3);

  EXPECT_EQ(decided.id, p.id);
  EXPECT_EQ(decided.status, domain::ProposalStatus::Approved);
  EXPECT_EQ(governance.getProposal(p.id).status,
            domain::ProposalStatus::Approved);
}

// -----------------------------------------------------------------------------
// 4. Asking for a decision on an order without a proposal is an error.
// -----------------------------------------------------------------------------
TEST_F(SimulatedGovernanceTest, SimulateApprovalWithoutProposal) {
  EXPECT_THROW(governance.simulateApproval(99), trustflow::ProposalNotFound);
}

// -----------------------------------------------------------------------------
// 5. Lookup by id and by order.
// -----------------------------------------------------------------------------
TEST_F(SimulatedGovernanceTest, Lookups) {
  auto p = governance.propose(5, "t", "w");

  EXPECT_EQ(governance.getProposal(p.id).order_id, 5u);
  EXPECT_THROW(governance.getProposal(p.id + 100), trustflow::ProposalNotFound);

  auto by_order = governance.proposalForOrder(5);
  ASSERT_TRUE(by_order.has_value());
  EXPECT_EQ(by_order->id, p.id);
  EXPECT_FALSE(governance.proposalForOrder(6).has_value());
}

// -----------------------------------------------------------------------------
// 6. Re-proposing for the same order makes the newest proposal the one
//    that is decided.
// -----------------------------------------------------------------------------
TEST_F(SimulatedGovernanceTest, LatestProposalPerOrderWins) {
  auto first = governance.propose(8, "t1", "w");
  auto second = governance.propose(8, "t2", "w");

  auto decided = governance.simulateApproval(8);
  EXPECT_EQ(decided.id, second.id);
  EXPECT_EQ(governance.getProposal(first.id).status,
            domain::ProposalStatus::Pending);
}

// -----------------------------------------------------------------------------
// Advisory collaborators
// -----------------------------------------------------------------------------

// The placeholder source names the contract after the clock and keeps the
// prompt on a single comment line.
TEST(PlaceholderSourceGenerator, EmbedsPromptAndTimestamp) {
  trustflow::SimulationTimeProvider clock{1700000000000};
  trustflow::PlaceholderSourceGenerator generator{clock};

  std::string source = generator.generate("sell WETH\nfor USDC");

  EXPECT_NE(source.find("pragma solidity ^0.8.0;"), std::string::npos);
  EXPECT_NE(source.find("contract LimitOrderContract_1700000000"),
            std::string::npos);
  EXPECT_NE(source.find("// Prompt-based generation: sell WETH for USDC"),
            std::string::npos);
}

TEST(StaticRuleChecker, ReportsSingleInfoFinding) {
  trustflow::StaticRuleChecker checker;
  auto findings = checker.check("contract X {}");

  ASSERT_EQ(findings.size(), 1u);
  EXPECT_EQ(findings[0].severity, "info");
  EXPECT_EQ(findings[0].message, "No critical issues found.");
}
