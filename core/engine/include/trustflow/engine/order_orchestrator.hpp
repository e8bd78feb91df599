#pragma once

#include "trustflow/advisory/i_rule_checker.hpp"
#include "trustflow/advisory/i_source_generator.hpp"
#include "trustflow/chain/i_chain_client.hpp"
#include "trustflow/domain/governance_proposal.hpp"
#include "trustflow/domain/order.hpp"
#include "trustflow/domain/results.hpp"
#include "trustflow/domain/token_registry.hpp"
#include "trustflow/eventbus/event_bus.hpp"
#include "trustflow/governance/i_governance.hpp"
#include "trustflow/store/order_store.hpp"
#include "trustflow/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace trustflow {

struct OrchestratorOptions {
  std::int64_t approval_timeout_ms{180000};
  std::int64_t submission_timeout_ms{300000};
  std::uint64_t submission_gas_limit{500000};
};

// -----------------------------------------------------------------------------
// OrderOrchestrator — limit-order workflow driver
// -----------------------------------------------------------------------------
//
// @brief  Moves orders through creation, token approval, governance
//         pre-approval, on-chain submission and cancellation, recording
//         every step in the OrderStore and announcing it on the EventBus.
//
// @details
// Workflow (see domain/order_status.hpp for the full edge table):
//
//   createLimitOrder       -> Created, then an immediate approval attempt:
//                             ApprovalPending -> Approved on success,
//                             ApprovalPending -> Created on any failure
//                             (error kept in Order::last_error)
//   retryApproval          -> same approval attempt, from Created only
//   initiateGovernance...  -> GovernancePending -> GovernanceApproved
//   submitAndExecute       -> OnchainSubmitted -> Executed | FailedOnchain
//   cancel                 -> Canceled from any non-terminal state
//
// Error policy:
//   - Unknown ids raise OrderNotFound; requests with no edge from the
//     order's current state raise InvalidTransition. Both are caller
//     errors and leave the order untouched.
//   - Chain failures during approval and submission (InsufficientFunds,
//     BroadcastError, ConfirmationTimeout, OnchainExecutionFailed, ...)
//     are outcomes: they are captured in the returned result record and
//     on the order, never raised.
//
// Contract degradation:
//   When the chain client has no usable contract address, approval is
//   skipped (order stays Created with a last_error note) and submission
//   fails with ContractUnavailable, ending in FailedOnchain.
//
// Concurrency:
//   Every status change goes through OrderStore::transition, which checks
//   the edge atomically. Two concurrent submitAndExecute calls on the same
//   order: one proceeds, the other gets InvalidTransition. No orchestrator
//   lock is held across chain calls.
//
// Ownership:
//   Holds references to collaborators owned by ServiceContext (or by the
//   test fixture). All of them must outlive the orchestrator.
// -----------------------------------------------------------------------------
class OrderOrchestrator {
 public:
  OrderOrchestrator(chain::IChainClient& chain, IGovernance& governance,
                    ISourceGenerator& source_generator,
                    IRuleChecker& rule_checker, OrderStore& store,
                    EventBus& bus, const ITimeProvider& clock,
                    domain::TokenRegistry tokens,
                    OrchestratorOptions options = {});

  OrderOrchestrator(const OrderOrchestrator&) = delete;
  OrderOrchestrator& operator=(const OrderOrchestrator&) = delete;

  // -------------------------------------------------------------------------
  // createLimitOrder(prompt, from_token, to_token, amount, price)
  // -------------------------------------------------------------------------
  //
  // @brief  Records a new order and attempts its ERC-20 approval.
  //
  // @param  from_token / to_token  Registered symbol ("WETH") or address.
  // @param  amount                 Human units of from_token, > 0.
  // @param  price                  to_token per from_token, > 0.
  //
  // @return Snapshot of the order after the approval attempt: Approved
  //         with approval_tx_hash set, Created with last_error set, or
  //         Canceled when a cancel arrived first.
  //
  // @throws InvalidOrderRequest  for a non-positive or non-finite
  //                              amount/price.
  //
  // Side-effects: blocks for up to approval_timeout_ms waiting for the
  //               approval receipt.
  // -------------------------------------------------------------------------
  domain::Order createLimitOrder(const std::string& prompt,
                                 const std::string& from_token,
                                 const std::string& to_token, double amount,
                                 double price);

  // Re-runs the approval attempt for an order left in Created.
  domain::ApprovalResult retryApproval(domain::OrderId order_id);

  // -------------------------------------------------------------------------
  // initiateGovernanceApproval(order_id)
  // -------------------------------------------------------------------------
  //
  // @brief  Raises a proposal for an Approved order and asks governance to
  //         decide it.
  //
  // @details
  // The order moves to GovernancePending before the proposal is raised, so
  // of several concurrent callers exactly one raises a proposal and the
  // rest get InvalidTransition. A failing propose() leaves the order
  // GovernancePending with last_error set; cancel() is the way out.
  //
  // @return The proposal as last reported by governance. The order is
  //         GovernanceApproved when the proposal status is Approved, and
  //         stays GovernancePending otherwise.
  //
  // @throws OrderNotFound, InvalidTransition (order not Approved).
  // -------------------------------------------------------------------------
  domain::GovernanceProposal initiateGovernanceApproval(
      domain::OrderId order_id);

  // -------------------------------------------------------------------------
  // submitAndExecute(order_id)
  // -------------------------------------------------------------------------
  //
  // @brief  Sends submitLimitOrder for a GovernanceApproved order and waits
  //         for its receipt.
  //
  // @details
  // amount is scaled by the from-token's decimals, price by 1e18; the maker
  // is the order's wallet. Gas budget submission_gas_limit, wait bounded
  // by submission_timeout_ms.
  //
  // @return ExecutionResult with status Executed (tx hash and block set)
  //         or FailedOnchain (error set; tx hash set if the transaction
  //         was broadcast).
  //
  // @throws OrderNotFound, InvalidTransition (order not GovernanceApproved).
  // -------------------------------------------------------------------------
  domain::ExecutionResult submitAndExecute(domain::OrderId order_id);

  // -------------------------------------------------------------------------
  // cancel(order_id)
  // -------------------------------------------------------------------------
  //
  // @brief  Marks a non-terminal order Canceled and stamps canceled_at.
  //
  // @details
  // An order in OnchainSubmitted can be canceled locally; a transaction
  // already broadcast is not recalled, and its eventual outcome is no
  // longer recorded (the submission call reports it in its result).
  //
  // @throws OrderNotFound, InvalidTransition (order already terminal).
  // -------------------------------------------------------------------------
  domain::CancellationResult cancel(domain::OrderId order_id);

  std::vector<domain::Order> listOrders() const;
  domain::Order getOrder(domain::OrderId order_id) const;

  // Runs the rule checker on the order's source text and stores the
  // findings on the order.
  domain::AuditReport auditOrder(domain::OrderId order_id);

  domain::GovernanceProposal getProposal(
      domain::ProposalId proposal_id) const;

 private:
  domain::ApprovalResult runApproval(const domain::Order& order);

  // Final approval transition; tolerates a concurrent cancel.
  domain::ApprovalResult finishApproval(domain::ApprovalResult result,
                                        domain::OrderStatus next,
                                        const OrderStore::Mutator& mutator,
                                        const char* reason);

  domain::ExecutionResult finishExecution(domain::ExecutionResult result,
                                          domain::OrderStatus next,
                                          const OrderStore::Mutator& mutator,
                                          const char* reason);

  void publishOrderUpdate(const StatusChange& change,
                          const std::string& reason);
  void publishTransaction(domain::OrderId order_id, const std::string& label,
                          TransactionEvent::Stage stage,
                          const std::string& tx_hash,
                          std::optional<std::uint64_t> nonce,
                          std::optional<std::uint64_t> block_number,
                          const std::string& error);
  void publishProposal(const domain::GovernanceProposal& proposal);

  Timestamp now() const;
  SequenceId nextSequence();

  chain::IChainClient& chain_;
  IGovernance& governance_;
  ISourceGenerator& source_generator_;
  IRuleChecker& rule_checker_;
  OrderStore& store_;
  EventBus& bus_;
  const ITimeProvider& clock_;
  domain::TokenRegistry tokens_;
  OrchestratorOptions options_;

  std::atomic<SequenceId> sequence_{0};
};

}  // namespace trustflow
