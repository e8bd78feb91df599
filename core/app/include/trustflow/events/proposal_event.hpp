#pragma once

#include "trustflow/domain/governance_proposal.hpp"
#include "trustflow/events/event_types.hpp"

namespace trustflow {

// Published when a governance proposal is raised or decided.
struct ProposalEvent {
  domain::GovernanceProposal proposal;
  Timestamp timestamp{};
  SequenceId sequence_id{0};
};

}  // namespace trustflow
