#pragma once

#include <optional>
#include <string>

namespace trustflow {
namespace domain {

// -----------------------------------------------------------------------------
// OrderStatus — limit-order workflow state machine
// -----------------------------------------------------------------------------
//
// @brief  Every state an order can occupy between creation and a terminal
//         outcome.
//
// @details
// Legal edges (any other move is rejected with InvalidTransition):
//
//   Created ──> ApprovalPending ──> Approved ──> GovernancePending
//      ▲               │                                 │
//      └───────────────┘ (approval failed)               ▼
//                                              GovernanceApproved
//                                                        │
//                                                        ▼
//                               Executed <── OnchainSubmitted ──> FailedOnchain
//
//   Every non-terminal state ──> Canceled
//
// Terminal states: Executed, FailedOnchain, Canceled.
//
// The wire spelling (toString) is the upper-case snake form used in IPC
// replies and telemetry, e.g. "GOVERNANCE_APPROVED".
//
// Thread model:
//   Plain enum; free to copy and compare from any thread.
// -----------------------------------------------------------------------------
enum class OrderStatus {
  Created,             // Recorded; no approval on chain yet
  ApprovalPending,     // ERC-20 approval transaction in flight
  Approved,            // Allowance granted to the order contract
  GovernancePending,   // Proposal raised, awaiting decision
  GovernanceApproved,  // Proposal approved; ready for submission
  OnchainSubmitted,    // Order transaction in flight
  Executed,            // Order transaction confirmed — terminal
  FailedOnchain,       // Submission failed or reverted — terminal
  Canceled,            // Canceled by request — terminal
};

// True if the state machine has an edge current -> next.
bool isLegalTransition(OrderStatus current, OrderStatus next);

bool isTerminal(OrderStatus status);

const char* toString(OrderStatus status);

// Inverse of toString; std::nullopt for unknown spellings.
std::optional<OrderStatus> orderStatusFromString(const std::string& text);

}  // namespace domain
}  // namespace trustflow
