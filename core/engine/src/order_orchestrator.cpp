#include "trustflow/engine/order_orchestrator.hpp"
#include "trustflow/chain/contract_abis.hpp"
#include "trustflow/chain/quantity.hpp"
#include "trustflow/errors.hpp"
#include "trustflow/time/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <cmath>
#include <iostream>
#include <sstream>
#include <utility>

namespace trustflow {

namespace {

// "<Type>: <message>" for the taxonomy, the bare message otherwise.
std::string describe(const std::exception& e) {
  if (const auto* typed = dynamic_cast<const Error*>(&e)) {
    return std::string(typed->typeName()) + ": " + typed->what();
  }
  return e.what();
}

bool isPositiveFinite(double v) { return std::isfinite(v) && v > 0.0; }

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
OrderOrchestrator::OrderOrchestrator(
    chain::IChainClient& chain, IGovernance& governance,
    ISourceGenerator& source_generator, IRuleChecker& rule_checker,
    OrderStore& store, EventBus& bus, const ITimeProvider& clock,
    domain::TokenRegistry tokens, OrchestratorOptions options)
    : chain_(chain),
      governance_(governance),
      source_generator_(source_generator),
      rule_checker_(rule_checker),
      store_(store),
      bus_(bus),
      clock_(clock),
      tokens_(std::move(tokens)),
      options_(options) {}

// -----------------------------------------------------------------------------
// createLimitOrder()
// -----------------------------------------------------------------------------
domain::Order OrderOrchestrator::createLimitOrder(const std::string& prompt,
                                                  const std::string& from_token,
                                                  const std::string& to_token,
                                                  double amount, double price) {
  if (!isPositiveFinite(amount)) {
    throw InvalidOrderRequest("amount must be a positive number");
  }
  if (!isPositiveFinite(price)) {
    throw InvalidOrderRequest("price must be a positive number");
  }
  domain::TokenInfo from = tokens_.resolve(from_token);
  domain::TokenInfo to = tokens_.resolve(to_token);

  domain::Order draft;
  draft.prompt = prompt;
  draft.from_token = from_token;
  draft.to_token = to_token;
  draft.from_token_address = from.address;
  draft.to_token_address = to.address;
  draft.amount = amount;
  draft.price = price;
  draft.wallet = chain_.address();
  draft.source_text = source_generator_.generate(prompt);
  draft.created_at = ms_to_unix_seconds(clock_.now_ms());

  domain::Order order = store_.insert(std::move(draft));
  std::cout << "[OrderOrchestrator] Order " << order.id << " created: "
            << amount << " " << from_token << " -> " << to_token << " @ "
            << price << "\n";
  publishOrderUpdate(StatusChange{domain::OrderStatus::Created, order},
                     "created");

  runApproval(order);
  return store_.get(order.id);
}

// -----------------------------------------------------------------------------
// retryApproval()
// -----------------------------------------------------------------------------
domain::ApprovalResult OrderOrchestrator::retryApproval(
    domain::OrderId order_id) {
  domain::Order order = store_.get(order_id);
  if (order.status != domain::OrderStatus::Created) {
    throw InvalidTransition("order " + std::to_string(order_id) + " is " +
                            domain::toString(order.status) +
                            "; approval can only be retried from CREATED");
  }
  return runApproval(order);
}

// -----------------------------------------------------------------------------
// runApproval(): CREATED -> APPROVAL_PENDING -> APPROVED | CREATED
// -----------------------------------------------------------------------------
domain::ApprovalResult OrderOrchestrator::runApproval(
    const domain::Order& order) {
  domain::ApprovalResult result;
  result.order_id = order.id;
  result.status = order.status;

  if (!chain_.hasUsableContract()) {
    const std::string note = "approval skipped: order contract address is "
                             "not configured (" + chain_.contractAddress() +
                             ")";
    std::cerr << "[OrderOrchestrator] Order " << order.id << ": " << note
              << "\n";
    domain::Order updated = store_.update(
        order.id, [&note](domain::Order& o) { o.last_error = note; });
    result.status = updated.status;
    result.error = note;
    result.skipped = true;
    return result;
  }

  StatusChange pending;
  try {
    pending = store_.transition(
        order.id, domain::OrderStatus::ApprovalPending,
        [](domain::Order& o) { o.last_error.reset(); });
  } catch (const InvalidTransition& e) {
    // Canceled (or picked up elsewhere) before approval began; nothing was
    // sent, so report the order as it now stands.
    std::cerr << "[OrderOrchestrator] Order " << order.id
              << " not approved: " << e.what() << "\n";
    result.status = store_.get(order.id).status;
    result.error = e.what();
    return result;
  }
  publishOrderUpdate(pending, "approval started");

  std::optional<chain::TransactionHandle> handle;
  try {
    unsigned decimals = tokens_.decimalsFor(order.from_token_address);
    chain::Quantity amount = chain::toBaseUnits(order.amount, decimals);

    std::cout << "[OrderOrchestrator] Approving "
              << chain::formatUnits(amount, decimals) << " "
              << order.from_token << " for " << chain_.contractAddress()
              << " (order " << order.id << ")\n";

    chain::TxIntent intent = chain_.buildApprovalTransaction(
        order.from_token_address, chain_.contractAddress(), amount);
    handle = chain_.signAndBroadcast(intent);
    publishTransaction(order.id, handle->label,
                       TransactionEvent::Stage::Broadcast, handle->tx_hash,
                       handle->nonce, std::nullopt, "");

    chain::Receipt receipt =
        chain_.awaitConfirmation(*handle, options_.approval_timeout_ms);
    publishTransaction(order.id, handle->label,
                       TransactionEvent::Stage::Confirmed, handle->tx_hash,
                       handle->nonce, receipt.block_number, "");
  } catch (const std::exception& e) {
    const std::string error = describe(e);
    std::cerr << "[OrderOrchestrator] Approval for order " << order.id
              << " failed: " << error << "\n";
    publishTransaction(order.id, "approve", TransactionEvent::Stage::Failed,
                       handle ? handle->tx_hash : "",
                       handle ? std::optional<std::uint64_t>(handle->nonce)
                              : std::nullopt,
                       std::nullopt, error);
    result.error = error;
    result.tx_hash = handle ? std::optional<std::string>(handle->tx_hash)
                            : std::nullopt;
    return finishApproval(
        std::move(result), domain::OrderStatus::Created,
        [&error](domain::Order& o) {
          o.approval_tx_hash.reset();
          o.last_error = error;
        },
        "approval failed");
  }

  const std::string tx_hash = handle->tx_hash;
  result.tx_hash = tx_hash;
  return finishApproval(
      std::move(result), domain::OrderStatus::Approved,
      [&tx_hash](domain::Order& o) { o.approval_tx_hash = tx_hash; },
      "approval confirmed");
}

domain::ApprovalResult OrderOrchestrator::finishApproval(
    domain::ApprovalResult result, domain::OrderStatus next,
    const OrderStore::Mutator& mutator, const char* reason) {
  try {
    StatusChange change = store_.transition(result.order_id, next, mutator);
    publishOrderUpdate(change, reason);
    result.status = change.order.status;
  } catch (const InvalidTransition& e) {
    // Canceled while the approval was in flight; the cancel stands.
    std::cerr << "[OrderOrchestrator] Order " << result.order_id
              << " changed during approval: " << e.what() << "\n";
    result.status = store_.get(result.order_id).status;
  }
  return result;
}

// -----------------------------------------------------------------------------
// initiateGovernanceApproval()
// -----------------------------------------------------------------------------
domain::GovernanceProposal OrderOrchestrator::initiateGovernanceApproval(
    domain::OrderId order_id) {
  // The status moves first so that only one caller ever raises a proposal
  // for the order.
  StatusChange pending;
  try {
    pending = store_.transition(order_id,
                                domain::OrderStatus::GovernancePending);
  } catch (const InvalidTransition&) {
    const domain::Order current = store_.get(order_id);
    throw InvalidTransition("order " + std::to_string(order_id) + " is " +
                            domain::toString(current.status) +
                            "; governance requires APPROVED");
  }
  const domain::Order& order = pending.order;

  std::ostringstream title;
  title << "Approve Limit Order #" << order_id << " (" << order.amount << " "
        << order.from_token << ")";

  domain::GovernanceProposal proposal;
  try {
    proposal = governance_.propose(order_id, title.str(), order.wallet);
  } catch (const std::exception& e) {
    const std::string error = describe(e);
    std::cerr << "[OrderOrchestrator] Proposal for order " << order_id
              << " failed: " << error << "\n";
    store_.update(order_id,
                  [&error](domain::Order& o) { o.last_error = error; });
    throw;
  }
  publishProposal(proposal);

  const domain::ProposalId proposal_id = proposal.id;
  domain::Order recorded = store_.update(
      order_id, [proposal_id](domain::Order& o) {
        o.governance_proposal_id = proposal_id;
      });
  publishOrderUpdate(StatusChange{pending.previous, recorded},
                     "governance proposal raised");

  domain::GovernanceProposal decided = governance_.simulateApproval(order_id);
  publishProposal(decided);

  if (decided.status != domain::ProposalStatus::Approved) {
    std::cout << "[OrderOrchestrator] Order " << order_id << " proposal "
              << decided.id << " is " << domain::toString(decided.status)
              << "\n";
    return decided;
  }

  try {
    StatusChange approved =
        store_.transition(order_id, domain::OrderStatus::GovernanceApproved);
    publishOrderUpdate(approved, "governance approved");
    std::cout << "[OrderOrchestrator] Order " << order_id
              << " governance-approved via proposal " << decided.id << "\n";
  } catch (const InvalidTransition& e) {
    // Canceled while the vote was running; the cancel stands.
    std::cerr << "[OrderOrchestrator] Order " << order_id
              << " changed during governance: " << e.what() << "\n";
  }
  return decided;
}

// -----------------------------------------------------------------------------
// submitAndExecute(): GOVERNANCE_APPROVED -> ONCHAIN_SUBMITTED -> outcome
// -----------------------------------------------------------------------------
domain::ExecutionResult OrderOrchestrator::submitAndExecute(
    domain::OrderId order_id) {
  StatusChange submitted =
      store_.transition(order_id, domain::OrderStatus::OnchainSubmitted,
                        [](domain::Order& o) { o.last_error.reset(); });
  publishOrderUpdate(submitted, "submission started");
  const domain::Order order = submitted.order;

  domain::ExecutionResult result;
  result.order_id = order_id;
  result.status = order.status;

  std::optional<chain::TransactionHandle> handle;
  chain::Receipt receipt;
  try {
    if (!chain_.hasUsableContract()) {
      throw ContractUnavailable(chain_.contractAddress());
    }

    unsigned decimals = tokens_.decimalsFor(order.from_token_address);
    chain::Quantity amount = chain::toBaseUnits(order.amount, decimals);
    chain::Quantity price = chain::toBaseUnits(order.price, 18);

    nlohmann::json args = nlohmann::json::array(
        {order.from_token_address, order.to_token_address,
         chain::toDecimalString(amount), chain::toDecimalString(price),
         order.wallet});

    std::cout << "[OrderOrchestrator] Submitting order " << order_id
              << " (sell " << order.from_token << " -> buy " << order.to_token
              << ") to " << chain_.contractAddress() << "\n";

    chain::TxIntent intent = chain_.buildGenericCallTransaction(
        chain_.contractAddress(), chain::limitOrderContractAbi(),
        "submitLimitOrder", args, 0, options_.submission_gas_limit);
    handle = chain_.signAndBroadcast(intent);

    const std::string tx_hash = handle->tx_hash;
    store_.update(order_id,
                  [&tx_hash](domain::Order& o) { o.order_tx_hash = tx_hash; });
    publishTransaction(order_id, handle->label,
                       TransactionEvent::Stage::Broadcast, handle->tx_hash,
                       handle->nonce, std::nullopt, "");

    receipt = chain_.awaitConfirmation(*handle, options_.submission_timeout_ms);
    publishTransaction(order_id, handle->label,
                       TransactionEvent::Stage::Confirmed, handle->tx_hash,
                       handle->nonce, receipt.block_number, "");
  } catch (const std::exception& e) {
    const std::string error = describe(e);
    std::cerr << "[OrderOrchestrator] Submission of order " << order_id
              << " failed: " << error << "\n";
    publishTransaction(order_id, "submitLimitOrder",
                       TransactionEvent::Stage::Failed,
                       handle ? handle->tx_hash : "",
                       handle ? std::optional<std::uint64_t>(handle->nonce)
                              : std::nullopt,
                       std::nullopt, error);
    result.error = error;
    if (handle) result.tx_hash = handle->tx_hash;
    return finishExecution(
        std::move(result), domain::OrderStatus::FailedOnchain,
        [&error](domain::Order& o) { o.last_error = error; },
        "submission failed");
  }

  result.tx_hash = handle->tx_hash;
  result.block_number = receipt.block_number;
  return finishExecution(std::move(result), domain::OrderStatus::Executed,
                         nullptr, "executed");
}

domain::ExecutionResult OrderOrchestrator::finishExecution(
    domain::ExecutionResult result, domain::OrderStatus next,
    const OrderStore::Mutator& mutator, const char* reason) {
  try {
    StatusChange change = store_.transition(result.order_id, next, mutator);
    publishOrderUpdate(change, reason);
    result.status = change.order.status;
    if (next == domain::OrderStatus::Executed) {
      std::cout << "[OrderOrchestrator] Order " << result.order_id
                << " executed. TX: " << result.tx_hash.value_or("") << "\n";
    }
  } catch (const InvalidTransition& e) {
    std::cerr << "[OrderOrchestrator] Order " << result.order_id
              << " changed during submission: " << e.what() << "\n";
    result.status = store_.get(result.order_id).status;
    if (!result.error) {
      result.error = std::string("order was ") +
                     domain::toString(result.status) +
                     " while its transaction was in flight";
    }
  }
  return result;
}

// -----------------------------------------------------------------------------
// cancel()
// -----------------------------------------------------------------------------
domain::CancellationResult OrderOrchestrator::cancel(domain::OrderId order_id) {
  const domain::UnixSeconds now_s = ms_to_unix_seconds(clock_.now_ms());
  StatusChange change = store_.transition(
      order_id, domain::OrderStatus::Canceled,
      [now_s](domain::Order& o) { o.canceled_at = now_s; });
  publishOrderUpdate(change, "canceled");

  std::cout << "[OrderOrchestrator] Order " << order_id << " canceled (was "
            << domain::toString(change.previous) << ")\n";

  domain::CancellationResult result;
  result.order_id = order_id;
  result.status = change.order.status;
  result.canceled_at = now_s;
  return result;
}

// -----------------------------------------------------------------------------
// Queries
// -----------------------------------------------------------------------------
std::vector<domain::Order> OrderOrchestrator::listOrders() const {
  return store_.list();
}

domain::Order OrderOrchestrator::getOrder(domain::OrderId order_id) const {
  return store_.get(order_id);
}

domain::GovernanceProposal OrderOrchestrator::getProposal(
    domain::ProposalId proposal_id) const {
  return governance_.getProposal(proposal_id);
}

// -----------------------------------------------------------------------------
// auditOrder()
// -----------------------------------------------------------------------------
domain::AuditReport OrderOrchestrator::auditOrder(domain::OrderId order_id) {
  domain::Order order = store_.get(order_id);
  std::vector<domain::RuleFinding> findings =
      rule_checker_.check(order.source_text);

  domain::Order updated = store_.update(
      order_id, [&findings](domain::Order& o) { o.rule_findings = findings; });
  publishOrderUpdate(StatusChange{updated.status, updated}, "audited");

  domain::AuditReport report;
  report.order_id = order_id;
  report.source_text = updated.source_text;
  report.findings = std::move(findings);
  return report;
}

// -----------------------------------------------------------------------------
// Event publication
// -----------------------------------------------------------------------------
void OrderOrchestrator::publishOrderUpdate(const StatusChange& change,
                                           const std::string& reason) {
  OrderUpdateEvent event;
  event.order = change.order;
  event.previous_status = change.previous;
  event.reason = reason;
  event.timestamp = now();
  event.sequence_id = nextSequence();
  bus_.publish(event);
}

void OrderOrchestrator::publishTransaction(
    domain::OrderId order_id, const std::string& label,
    TransactionEvent::Stage stage, const std::string& tx_hash,
    std::optional<std::uint64_t> nonce,
    std::optional<std::uint64_t> block_number, const std::string& error) {
  TransactionEvent event;
  event.order_id = order_id;
  event.label = label;
  event.stage = stage;
  event.tx_hash = tx_hash;
  event.nonce = nonce;
  event.block_number = block_number;
  event.error = error;
  event.timestamp = now();
  event.sequence_id = nextSequence();
  bus_.publish(event);
}

void OrderOrchestrator::publishProposal(
    const domain::GovernanceProposal& proposal) {
  ProposalEvent event;
  event.proposal = proposal;
  event.timestamp = now();
  event.sequence_id = nextSequence();
  bus_.publish(event);
}

Timestamp OrderOrchestrator::now() const {
  return ms_to_timestamp(clock_.now_ms());
}

SequenceId OrderOrchestrator::nextSequence() {
  return sequence_.fetch_add(1, std::memory_order_relaxed) + 1;
}

}  // namespace trustflow
