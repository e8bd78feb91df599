#pragma once

#include "trustflow/domain/order.hpp"
#include "trustflow/events/event_types.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace trustflow {

// One step of an on-chain transaction tied to an order.
struct TransactionEvent {
  enum class Stage { Broadcast, Confirmed, Failed };

  domain::OrderId order_id{};
  std::string label;    // "approve", "submitLimitOrder"
  Stage stage{Stage::Broadcast};
  std::string tx_hash;  // Empty when the transaction never left the client
  std::optional<std::uint64_t> nonce;
  std::optional<std::uint64_t> block_number;
  std::string error;
  Timestamp timestamp{};
  SequenceId sequence_id{0};
};

inline const char* toString(TransactionEvent::Stage stage) {
  switch (stage) {
    case TransactionEvent::Stage::Broadcast: return "broadcast";
    case TransactionEvent::Stage::Confirmed: return "confirmed";
    case TransactionEvent::Stage::Failed:    return "failed";
  }
  return "unknown";
}

}  // namespace trustflow
