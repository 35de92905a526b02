#include "byline/metrics.hpp"

namespace bl {

double throughput_mb_s(std::uint64_t bytes, double wall_ms) noexcept {
  return (wall_ms > 0.0) ? (bytes / (1024.0 * 1024.0)) / (wall_ms / 1000.0) : 0.0;
}

double rate_per_sec(std::uint64_t count, double wall_ms) noexcept {
  return (wall_ms > 0.0) ? count / (wall_ms / 1000.0) : 0.0;
}

}
