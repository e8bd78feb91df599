#pragma once

#include "trustflow/domain/governance_proposal.hpp"

#include <optional>
#include <string>

namespace trustflow {

// -----------------------------------------------------------------------------
// IGovernance — pre-approval gate for on-chain submission
// -----------------------------------------------------------------------------
//
// @brief  Raises a proposal for an order and reports its decision.
//
// @details
// OrderOrchestrator calls propose() and then simulateApproval(); it moves
// the order to GovernanceApproved only when the returned proposal reports
// ProposalStatus::Approved. A real governance backend would return Pending
// from simulateApproval() until its quorum is reached.
//
// SimulatedGovernance is the default: it approves immediately.
//
// Errors:
//   simulateApproval  ProposalNotFound when no proposal exists for the order
//   getProposal       ProposalNotFound for unknown ids
//
// Thread-safety: Implementations must accept concurrent callers.
// -----------------------------------------------------------------------------
class IGovernance {
 public:
  virtual ~IGovernance() = default;

  virtual domain::GovernanceProposal propose(domain::OrderId order_id,
                                             const std::string& title,
                                             const std::string& proposer) = 0;

  virtual domain::GovernanceProposal simulateApproval(
      domain::OrderId order_id) = 0;

  virtual domain::GovernanceProposal getProposal(
      domain::ProposalId proposal_id) const = 0;

  // Latest proposal raised for the order, if any.
  virtual std::optional<domain::GovernanceProposal> proposalForOrder(
      domain::OrderId order_id) const = 0;
};

}  // namespace trustflow
