#pragma once

#include "trustflow/domain/order.hpp"

#include <cstdint>
#include <string>

namespace trustflow {
namespace domain {

using ProposalId = std::uint64_t;

enum class ProposalStatus {
  Pending,
  Approved,
  Rejected,
};

inline const char* toString(ProposalStatus status) {
  switch (status) {
    case ProposalStatus::Pending:  return "pending";
    case ProposalStatus::Approved: return "approved";
    case ProposalStatus::Rejected: return "rejected";
  }
  return "unknown";
}

// A governance decision request gating one order's on-chain submission.
struct GovernanceProposal {
  ProposalId id{};
  OrderId order_id{};
  std::string title;
  std::string proposer;
  ProposalStatus status{ProposalStatus::Pending};
  UnixSeconds created_at{0};
};

}  // namespace domain
}  // namespace trustflow
