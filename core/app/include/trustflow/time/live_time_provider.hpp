#pragma once

#include "trustflow/time/i_time_provider.hpp"

namespace trustflow {

// System clock.
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace trustflow
