#include "trustflow/governance/simulated_governance.hpp"
#include "trustflow/errors.hpp"
#include "trustflow/time/time_utils.hpp"

#include <iostream>

namespace trustflow {

SimulatedGovernance::SimulatedGovernance(const ITimeProvider& clock,
                                         domain::ProposalId first_id)
    : clock_(clock), ids_(first_id) {}

// ---- propose ----

domain::GovernanceProposal SimulatedGovernance::propose(
    domain::OrderId order_id, const std::string& title,
    const std::string& proposer) {
  domain::GovernanceProposal proposal;
  proposal.id = ids_.next_id();
  proposal.order_id = order_id;
  proposal.title = title;
  proposal.proposer = proposer;
  proposal.status = domain::ProposalStatus::Pending;
  proposal.created_at = ms_to_unix_seconds(clock_.now_ms());

  {
    std::lock_guard lock(mutex_);
    proposals_[proposal.id] = proposal;
    by_order_[order_id] = proposal.id;
  }

  std::cout << "[Governance] Proposal " << proposal.id << " '" << title
            << "' raised by " << proposer << "\n";
  return proposal;
}

// ---- simulateApproval ----

domain::GovernanceProposal SimulatedGovernance::simulateApproval(
    domain::OrderId order_id) {
  std::lock_guard lock(mutex_);
  auto it = by_order_.find(order_id);
  if (it == by_order_.end()) {
    throw ProposalNotFound("no proposal raised for order " +
                           std::to_string(order_id));
  }
  domain::GovernanceProposal& proposal = proposals_.at(it->second);
  proposal.status = domain::ProposalStatus::Approved;

  std::cout << "[Governance] Proposal " << proposal.id
            << " approved (simulated) for order " << order_id << "\n";
  return proposal;
}

// ---- Lookups ----

domain::GovernanceProposal SimulatedGovernance::getProposal(
    domain::ProposalId proposal_id) const {
  std::lock_guard lock(mutex_);
  auto it = proposals_.find(proposal_id);
  if (it == proposals_.end()) {
    throw ProposalNotFound("proposal " + std::to_string(proposal_id) +
                           " not found");
  }
  return it->second;
}

std::optional<domain::GovernanceProposal> SimulatedGovernance::proposalForOrder(
    domain::OrderId order_id) const {
  std::lock_guard lock(mutex_);
  auto it = by_order_.find(order_id);
  if (it == by_order_.end()) {
    return std::nullopt;
  }
  return proposals_.at(it->second);
}

}  // namespace trustflow
