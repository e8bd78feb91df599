#pragma once

#include "trustflow/concurrent/id_generator.hpp"
#include "trustflow/domain/order.hpp"

#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <vector>

namespace trustflow {

// Result of a successful OrderStore::transition().
struct StatusChange {
  domain::OrderStatus previous{domain::OrderStatus::Created};
  domain::Order order;  // Snapshot after the change
};

// -----------------------------------------------------------------------------
// OrderStore — in-memory order registry and state-machine gate
// -----------------------------------------------------------------------------
//
// @brief  Owns the authoritative copy of every order and is the only place
//         an order's status changes.
//
// @details
// Ids are assigned on insert(), starting at 1 and strictly increasing, so
// list() (ordered by id) is also insertion order. Orders are never
// removed.
//
// transition(id, next, mutator) checks the edge current -> next against
// domain::isLegalTransition while holding the store lock, applies the
// mutator to a working copy, sets the status and commits. The check and
// the commit are one atomic step: two threads racing to take the same
// edge cannot both succeed; the loser gets InvalidTransition.
//
// The mutator runs under the store lock. It must be short and must not
// call back into the store.
//
// Errors:
//   get / transition / update   OrderNotFound for unknown ids
//   transition                  InvalidTransition for illegal edges
//   update                      InvalidTransition if the mutator touched
//                               the status
//
// Thread-safety: All methods are safe to call concurrently. Every read
//                returns a copy.
// -----------------------------------------------------------------------------
class OrderStore {
 public:
  using Mutator = std::function<void(domain::Order&)>;

  OrderStore() = default;

  OrderStore(const OrderStore&) = delete;
  OrderStore& operator=(const OrderStore&) = delete;

  // Assigns the id and records the order in the Created state.
  domain::Order insert(domain::Order draft);

  domain::Order get(domain::OrderId id) const;
  std::optional<domain::Order> find(domain::OrderId id) const;

  StatusChange transition(domain::OrderId id, domain::OrderStatus next,
                          const Mutator& mutator = nullptr);

  // Metadata change that keeps the current status.
  domain::Order update(domain::OrderId id, const Mutator& mutator);

  std::vector<domain::Order> list() const;

  std::size_t size() const;

 private:
  mutable std::mutex mutex_;
  IdGenerator ids_{1};
  std::map<domain::OrderId, domain::Order> orders_;
};

}  // namespace trustflow
