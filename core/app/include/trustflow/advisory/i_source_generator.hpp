#pragma once

#include <string>

namespace trustflow {

// -----------------------------------------------------------------------------
// ISourceGenerator — prompt to contract source text
// -----------------------------------------------------------------------------
// Produces the contract source recorded on an order. The text is
// advisory: it is stored and audited but never compiled or deployed by
// this service. PlaceholderSourceGenerator is the default.
// -----------------------------------------------------------------------------
class ISourceGenerator {
 public:
  virtual ~ISourceGenerator() = default;

  virtual std::string generate(const std::string& prompt) = 0;
};

}  // namespace trustflow
