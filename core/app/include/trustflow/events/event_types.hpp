#pragma once

#include <chrono>
#include <cstdint>

namespace trustflow {

using Timestamp = std::chrono::system_clock::time_point;

// Monotonic per-publisher counter; lets subscribers detect gaps and order
// events that share a timestamp.
using SequenceId = std::uint64_t;

}  // namespace trustflow
