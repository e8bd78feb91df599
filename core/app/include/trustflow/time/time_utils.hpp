#pragma once

#include "trustflow/events/event_types.hpp"

#include <chrono>
#include <cstdint>

namespace trustflow {

inline Timestamp ms_to_timestamp(std::int64_t ms) {
  return Timestamp{std::chrono::milliseconds{ms}};
}

inline std::int64_t timestamp_to_ms(Timestamp tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

// Order and proposal records carry whole seconds.
inline std::int64_t ms_to_unix_seconds(std::int64_t ms) { return ms / 1000; }

}  // namespace trustflow
