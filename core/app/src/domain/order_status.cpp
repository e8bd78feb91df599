#include "trustflow/domain/order_status.hpp"

namespace trustflow {
namespace domain {

// -----------------------------------------------------------------------------
// isLegalTransition: the edge table
// -----------------------------------------------------------------------------
bool isLegalTransition(OrderStatus current, OrderStatus next) {
  using S = OrderStatus;

  switch (current) {
    case S::Created:
      return next == S::ApprovalPending ||
             next == S::Canceled;

    case S::ApprovalPending:
      return next == S::Approved ||
             next == S::Created ||
             next == S::Canceled;

    case S::Approved:
      return next == S::GovernancePending ||
             next == S::Canceled;

    case S::GovernancePending:
      return next == S::GovernanceApproved ||
             next == S::Canceled;

    case S::GovernanceApproved:
      return next == S::OnchainSubmitted ||
             next == S::Canceled;

    case S::OnchainSubmitted:
      return next == S::Executed ||
             next == S::FailedOnchain ||
             next == S::Canceled;

    case S::Executed:
    case S::FailedOnchain:
    case S::Canceled:
      return false;
  }

  return false;
}

bool isTerminal(OrderStatus status) {
  using S = OrderStatus;
  return status == S::Executed ||
         status == S::FailedOnchain ||
         status == S::Canceled;
}

const char* toString(OrderStatus status) {
  using S = OrderStatus;
  switch (status) {
    case S::Created:            return "CREATED";
    case S::ApprovalPending:    return "APPROVAL_PENDING";
    case S::Approved:           return "APPROVED";
    case S::GovernancePending:  return "GOVERNANCE_PENDING";
    case S::GovernanceApproved: return "GOVERNANCE_APPROVED";
    case S::OnchainSubmitted:   return "ONCHAIN_SUBMITTED";
    case S::Executed:           return "EXECUTED";
    case S::FailedOnchain:      return "FAILED_ONCHAIN";
    case S::Canceled:           return "CANCELED";
  }
  return "UNKNOWN";
}

std::optional<OrderStatus> orderStatusFromString(const std::string& text) {
  static const OrderStatus kAll[] = {
      OrderStatus::Created,           OrderStatus::ApprovalPending,
      OrderStatus::Approved,          OrderStatus::GovernancePending,
      OrderStatus::GovernanceApproved, OrderStatus::OnchainSubmitted,
      OrderStatus::Executed,          OrderStatus::FailedOnchain,
      OrderStatus::Canceled,
  };
  for (OrderStatus s : kAll) {
    if (text == toString(s)) return s;
  }
  return std::nullopt;
}

}  // namespace domain
}  // namespace trustflow
