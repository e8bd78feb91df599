#pragma once

#include "trustflow/advisory/i_source_generator.hpp"
#include "trustflow/time/i_time_provider.hpp"

namespace trustflow {

// Emits a fixed Solidity skeleton named after the current time, with the
// prompt embedded as a comment.
class PlaceholderSourceGenerator final : public ISourceGenerator {
 public:
  explicit PlaceholderSourceGenerator(const ITimeProvider& clock)
      : clock_(clock) {}

  std::string generate(const std::string& prompt) override;

 private:
  const ITimeProvider& clock_;
};

}  // namespace trustflow
