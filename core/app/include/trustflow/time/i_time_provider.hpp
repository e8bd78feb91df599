#pragma once

#include <cstdint>

namespace trustflow {

// -----------------------------------------------------------------------------
// ITimeProvider — wall-clock abstraction
// -----------------------------------------------------------------------------
//
// @brief  Source of "now" for every timestamp the service records
//         (created_at, canceled_at, proposal times, event timestamps).
//
// @details
// Production wires LiveTimeProvider. Tests wire SimulationTimeProvider so
// recorded timestamps are exact and assertions do not race the clock.
//
// Confirmation timeouts are NOT measured through this interface; they use
// std::chrono::steady_clock inside ChainClient so a wall-clock jump can
// neither shorten nor extend a wait.
//
// Thread-safety: Implementations must be safe to call from any thread.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // Milliseconds since the Unix epoch.
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace trustflow
