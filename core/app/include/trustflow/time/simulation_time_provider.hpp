#pragma once

#include "trustflow/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace trustflow {

// Manually driven clock for tests. Starts at `start_ms` and only moves
// when told to.
class SimulationTimeProvider final : public ITimeProvider {
 public:
  explicit SimulationTimeProvider(std::int64_t start_ms = 0)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  void set_time(std::int64_t time_ms);
  void advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_;
};

}  // namespace trustflow
