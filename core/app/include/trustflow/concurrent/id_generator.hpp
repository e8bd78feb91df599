#pragma once

#include <atomic>
#include <cstdint>

namespace trustflow {

// -----------------------------------------------------------------------------
// IdGenerator — thread-safe, monotonically increasing id source
// -----------------------------------------------------------------------------
//
// @brief  Hands out unique ids from an atomic counter, starting at a
//         configurable first value.
//
// @details
// OrderStore starts at 1 (0 stays free as an "unset" value). The simulated
// governance collaborator starts its proposal ids at a large epoch-style
// value so they cannot be confused with order ids in logs.
//
// Owned as a value member by the component that issues the ids; never a
// global. Non-copyable and non-movable, since two copies would issue
// duplicates.
//
// Thread model:
//   next_id() may be called concurrently from any thread.
// -----------------------------------------------------------------------------
class IdGenerator {
 public:
  explicit IdGenerator(std::uint64_t first = 1) : next_id_(first) {}

  IdGenerator(const IdGenerator&) = delete;
  IdGenerator& operator=(const IdGenerator&) = delete;
  IdGenerator(IdGenerator&&) = delete;
  IdGenerator& operator=(IdGenerator&&) = delete;

  std::uint64_t next_id() {
    return next_id_.fetch_add(1, std::memory_order_relaxed);
  }

  // Value the next call to next_id() will return.
  std::uint64_t peek() const {
    return next_id_.load(std::memory_order_relaxed);
  }

 private:
  std::atomic<std::uint64_t> next_id_;
};

}  // namespace trustflow
