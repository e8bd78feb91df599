#pragma once

#include "trustflow/domain/governance_proposal.hpp"
#include "trustflow/domain/order.hpp"
#include "trustflow/domain/results.hpp"

#include <nlohmann/json.hpp>

namespace trustflow {
namespace domain {

// -----------------------------------------------------------------------------
// JSON views of domain records
// -----------------------------------------------------------------------------
// Used by the IPC command replies and the telemetry stream. Optional
// fields that are unset are written as null so clients see a stable key
// set. Statuses use their wire spelling (toString).
// -----------------------------------------------------------------------------
nlohmann::json toJson(const RuleFinding& finding);
nlohmann::json toJson(const Order& order);
nlohmann::json toJson(const GovernanceProposal& proposal);
nlohmann::json toJson(const ApprovalResult& result);
nlohmann::json toJson(const ExecutionResult& result);
nlohmann::json toJson(const CancellationResult& result);
nlohmann::json toJson(const AuditReport& report);

}  // namespace domain
}  // namespace trustflow
