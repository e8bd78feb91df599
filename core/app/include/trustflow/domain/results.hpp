#pragma once

#include "trustflow/domain/order.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace trustflow {
namespace domain {

// -----------------------------------------------------------------------------
// Result records
// -----------------------------------------------------------------------------
// Returned by OrderOrchestrator operations whose failures are outcomes
// rather than exceptions. status always mirrors the order's stored status
// at the moment the operation finished.
// -----------------------------------------------------------------------------

struct ApprovalResult {
  OrderId order_id{};
  OrderStatus status{OrderStatus::Created};
  std::optional<std::string> tx_hash;
  std::optional<std::string> error;
  bool skipped{false};  // No usable contract; nothing was sent
};

struct ExecutionResult {
  OrderId order_id{};
  OrderStatus status{OrderStatus::OnchainSubmitted};
  std::optional<std::string> tx_hash;
  std::optional<std::uint64_t> block_number;
  std::optional<std::string> error;
};

struct CancellationResult {
  OrderId order_id{};
  OrderStatus status{OrderStatus::Canceled};
  UnixSeconds canceled_at{0};
};

struct AuditReport {
  OrderId order_id{};
  std::string source_text;
  std::vector<RuleFinding> findings;
};

}  // namespace domain
}  // namespace trustflow
