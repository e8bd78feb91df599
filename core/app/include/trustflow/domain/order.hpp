#pragma once

#include "trustflow/domain/order_status.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace trustflow {
namespace domain {

// -----------------------------------------------------------------------------
// OrderId
// -----------------------------------------------------------------------------
// Assigned by OrderStore, starting at 1 and strictly increasing. Never
// reused; orders are never deleted.
// -----------------------------------------------------------------------------
using OrderId = std::uint64_t;

// Seconds since the Unix epoch.
using UnixSeconds = std::int64_t;

// One observation from the rule checker.
struct RuleFinding {
  std::string severity;  // "info", "warning", "critical"
  std::string message;
};

// -----------------------------------------------------------------------------
// Order
// -----------------------------------------------------------------------------
// Responsibility: The full record of one limit order: the request (tokens,
// amount, price), the identities involved, and every on-chain and
// governance artefact the workflow has produced so far.
//
// @details
// amount is in human units of from_token (0.01 WETH), price is to_token
// per from_token. Both are scaled to integers only when a transaction is
// built.
//
// The authoritative copy lives inside OrderStore and is only modified
// under its lock via transition()/update(). Everything else handles
// snapshots.
// -----------------------------------------------------------------------------
struct Order {
  OrderId id{};
  std::string prompt;
  std::string from_token;          // Symbol as requested, e.g. "WETH"
  std::string to_token;
  std::string from_token_address;  // Resolved ledger address
  std::string to_token_address;
  double amount{0.0};
  double price{0.0};
  std::string wallet;              // Maker address (the service identity)
  std::string source_text;         // Generated contract source
  OrderStatus status{OrderStatus::Created};
  UnixSeconds created_at{0};
  std::optional<UnixSeconds> canceled_at;
  std::optional<std::string> approval_tx_hash;
  std::optional<std::uint64_t> governance_proposal_id;
  std::optional<std::string> order_tx_hash;
  std::vector<RuleFinding> rule_findings;
  std::optional<std::string> last_error;
};

}  // namespace domain
}  // namespace trustflow
