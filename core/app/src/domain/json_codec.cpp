#include "trustflow/domain/json_codec.hpp"

#include <utility>

namespace trustflow {
namespace domain {

namespace {

template <typename T>
nlohmann::json optionalJson(const std::optional<T>& value) {
  if (!value.has_value()) return nullptr;
  return *value;
}

}  // namespace

nlohmann::json toJson(const RuleFinding& finding) {
  return {{"severity", finding.severity}, {"message", finding.message}};
}

// -----------------------------------------------------------------------------
// toJson(Order)
// -----------------------------------------------------------------------------
nlohmann::json toJson(const Order& order) {
  nlohmann::json j;
  j["id"] = order.id;
  j["prompt"] = order.prompt;
  j["from_token"] = order.from_token;
  j["to_token"] = order.to_token;
  j["from_token_address"] = order.from_token_address;
  j["to_token_address"] = order.to_token_address;
  j["amount"] = order.amount;
  j["price"] = order.price;
  j["wallet"] = order.wallet;
  j["source_text"] = order.source_text;
  j["status"] = toString(order.status);
  j["created_at"] = order.created_at;
  j["canceled_at"] = optionalJson(order.canceled_at);
  j["approval_tx_hash"] = optionalJson(order.approval_tx_hash);
  j["governance_proposal_id"] = optionalJson(order.governance_proposal_id);
  j["order_tx_hash"] = optionalJson(order.order_tx_hash);
  j["last_error"] = optionalJson(order.last_error);

  nlohmann::json findings = nlohmann::json::array();
  for (const auto& f : order.rule_findings) {
    findings.push_back(toJson(f));
  }
  j["rule_findings"] = std::move(findings);
  return j;
}

nlohmann::json toJson(const GovernanceProposal& proposal) {
  nlohmann::json j;
  j["id"] = proposal.id;
  j["order_id"] = proposal.order_id;
  j["title"] = proposal.title;
  j["proposer"] = proposal.proposer;
  j["status"] = toString(proposal.status);
  j["created_at"] = proposal.created_at;
  return j;
}

nlohmann::json toJson(const ApprovalResult& result) {
  nlohmann::json j;
  j["order_id"] = result.order_id;
  j["status"] = toString(result.status);
  j["tx_hash"] = optionalJson(result.tx_hash);
  j["error"] = optionalJson(result.error);
  j["skipped"] = result.skipped;
  return j;
}

nlohmann::json toJson(const ExecutionResult& result) {
  nlohmann::json j;
  j["order_id"] = result.order_id;
  j["status"] = toString(result.status);
  j["tx_hash"] = optionalJson(result.tx_hash);
  j["block_number"] = optionalJson(result.block_number);
  j["error"] = optionalJson(result.error);
  return j;
}

nlohmann::json toJson(const CancellationResult& result) {
  nlohmann::json j;
  j["order_id"] = result.order_id;
  j["status"] = toString(result.status);
  j["canceled_at"] = result.canceled_at;
  return j;
}

nlohmann::json toJson(const AuditReport& report) {
  nlohmann::json j;
  j["order_id"] = report.order_id;
  j["source_text"] = report.source_text;
  nlohmann::json findings = nlohmann::json::array();
  for (const auto& f : report.findings) {
    findings.push_back(toJson(f));
  }
  j["findings"] = std::move(findings);
  return j;
}

}  // namespace domain
}  // namespace trustflow
