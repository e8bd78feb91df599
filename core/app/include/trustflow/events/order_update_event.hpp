#pragma once

#include "trustflow/domain/order.hpp"
#include "trustflow/domain/order_status.hpp"
#include "trustflow/events/event_types.hpp"

#include <string>

namespace trustflow {

// Published by OrderOrchestrator after every status change and after
// metadata updates that keep the status (audit findings).
struct OrderUpdateEvent {
  domain::Order order;  // Snapshot after the change
  domain::OrderStatus previous_status{domain::OrderStatus::Created};
  std::string reason;   // Short cause, e.g. "approval confirmed"
  Timestamp timestamp{};
  SequenceId sequence_id{0};
};

}  // namespace trustflow
