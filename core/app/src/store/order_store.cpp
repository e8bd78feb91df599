#include "trustflow/store/order_store.hpp"
#include "trustflow/errors.hpp"

#include <string>
#include <utility>

namespace trustflow {

// -----------------------------------------------------------------------------
// insert(draft)
// -----------------------------------------------------------------------------
domain::Order OrderStore::insert(domain::Order draft) {
  std::lock_guard lock(mutex_);
  draft.id = ids_.next_id();
  draft.status = domain::OrderStatus::Created;
  orders_.emplace(draft.id, draft);
  return draft;
}

// -----------------------------------------------------------------------------
// Lookups
// -----------------------------------------------------------------------------
domain::Order OrderStore::get(domain::OrderId id) const {
  std::lock_guard lock(mutex_);
  auto it = orders_.find(id);
  if (it == orders_.end()) {
    throw OrderNotFound(id);
  }
  return it->second;
}

std::optional<domain::Order> OrderStore::find(domain::OrderId id) const {
  std::lock_guard lock(mutex_);
  auto it = orders_.find(id);
  if (it == orders_.end()) {
    return std::nullopt;
  }
  return it->second;
}

// -----------------------------------------------------------------------------
// transition(id, next, mutator): check edge and commit atomically
// -----------------------------------------------------------------------------
StatusChange OrderStore::transition(domain::OrderId id,
                                    domain::OrderStatus next,
                                    const Mutator& mutator) {
  std::lock_guard lock(mutex_);
  auto it = orders_.find(id);
  if (it == orders_.end()) {
    throw OrderNotFound(id);
  }

  const domain::OrderStatus previous = it->second.status;
  if (!domain::isLegalTransition(previous, next)) {
    throw InvalidTransition("order " + std::to_string(id) + " cannot move from " +
                            domain::toString(previous) + " to " +
                            domain::toString(next));
  }

  // Work on a copy so a throwing mutator leaves the stored order intact.
  domain::Order working = it->second;
  if (mutator) {
    mutator(working);
  }
  working.id = id;
  working.status = next;
  it->second = working;

  return StatusChange{previous, std::move(working)};
}

// -----------------------------------------------------------------------------
// update(id, mutator): metadata only
// -----------------------------------------------------------------------------
domain::Order OrderStore::update(domain::OrderId id, const Mutator& mutator) {
  std::lock_guard lock(mutex_);
  auto it = orders_.find(id);
  if (it == orders_.end()) {
    throw OrderNotFound(id);
  }

  domain::Order working = it->second;
  mutator(working);
  if (working.status != it->second.status) {
    throw InvalidTransition("order " + std::to_string(id) +
                            ": status changes must go through transition()");
  }
  working.id = id;
  it->second = working;
  return working;
}

std::vector<domain::Order> OrderStore::list() const {
  std::lock_guard lock(mutex_);
  std::vector<domain::Order> out;
  out.reserve(orders_.size());
  for (const auto& entry : orders_) {
    out.push_back(entry.second);
  }
  return out;
}

std::size_t OrderStore::size() const {
  std::lock_guard lock(mutex_);
  return orders_.size();
}

}  // namespace trustflow
