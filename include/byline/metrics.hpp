#pragma once
#include <cstdint>

namespace bl {

// Counters kept by a Pipeline, updated on every pull.
struct PipelineStats {
  std::uint64_t records_in = 0;      // records cut by the scanner (== NR)
  std::uint64_t records_out = 0;     // records that made it through the chain
  std::uint64_t records_omitted = 0;
  std::uint64_t bytes_in = 0;        // record bytes, separators included
  std::uint64_t bytes_out = 0;       // bytes emitted by the chain
};

// MiB per second; 0 for a non-positive interval.
double throughput_mb_s(std::uint64_t bytes, double wall_ms) noexcept;

// Items per second; 0 for a non-positive interval.
double rate_per_sec(std::uint64_t count, double wall_ms) noexcept;

}
