#pragma once

#include "trustflow/concurrent/id_generator.hpp"
#include "trustflow/governance/i_governance.hpp"
#include "trustflow/time/i_time_provider.hpp"

#include <map>
#include <mutex>

namespace trustflow {

// -----------------------------------------------------------------------------
// SimulatedGovernance
// -----------------------------------------------------------------------------
// In-memory IGovernance that approves every proposal as soon as it is
// asked to. Proposal ids start at kFirstProposalId.
//
// Raising a second proposal for the same order replaces the order's
// current proposal; the earlier one stays retrievable by id.
// -----------------------------------------------------------------------------
class SimulatedGovernance final : public IGovernance {
 public:
  static constexpr domain::ProposalId kFirstProposalId = 1753926014868ULL;

  explicit SimulatedGovernance(const ITimeProvider& clock,
                               domain::ProposalId first_id = kFirstProposalId);

  domain::GovernanceProposal propose(domain::OrderId order_id,
                                     const std::string& title,
                                     const std::string& proposer) override;

  domain::GovernanceProposal simulateApproval(
      domain::OrderId order_id) override;

  domain::GovernanceProposal getProposal(
      domain::ProposalId proposal_id) const override;

  std::optional<domain::GovernanceProposal> proposalForOrder(
      domain::OrderId order_id) const override;

 private:
  const ITimeProvider& clock_;
  IdGenerator ids_;

  mutable std::mutex mutex_;
  std::map<domain::ProposalId, domain::GovernanceProposal> proposals_;
  std::map<domain::OrderId, domain::ProposalId> by_order_;
};

}  // namespace trustflow
