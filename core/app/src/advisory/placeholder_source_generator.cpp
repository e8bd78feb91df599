#include "trustflow/advisory/placeholder_source_generator.hpp"
#include "trustflow/time/time_utils.hpp"

#include <sstream>

namespace trustflow {

std::string PlaceholderSourceGenerator::generate(const std::string& prompt) {
  // Keep the prompt on one comment line.
  std::string flattened = prompt;
  for (char& c : flattened) {
    if (c == '\n' || c == '\r') c = ' ';
  }

  std::ostringstream out;
  out << "pragma solidity ^0.8.0;\n\n"
      << "contract LimitOrderContract_" << ms_to_unix_seconds(clock_.now_ms())
      << " {\n"
      << "    // Prompt-based generation: " << flattened << "\n"
      << "    // ... (placeholder Solidity code)\n"
      << "    function execute() public { /* ... */ }\n"
      << "    function cancel() public { /* ... */ }\n"
      << "}\n";
  return out.str();
}

}  // namespace trustflow
