#pragma once

#include "trustflow/events/order_update_event.hpp"
#include "trustflow/events/proposal_event.hpp"
#include "trustflow/events/transaction_event.hpp"

#include <variant>

namespace trustflow {

// Closed set of events carried by the EventBus. Adding an alternative
// means teaching IpcServer::formatTelemetry about it.
using Event = std::variant<
    OrderUpdateEvent,
    TransactionEvent,
    ProposalEvent>;

}  // namespace trustflow
