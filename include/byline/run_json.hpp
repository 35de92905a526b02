#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace bl {

struct RunJsonPayload {
  // Counters
  std::uint64_t records_in = 0;
  std::uint64_t records_out = 0;
  std::uint64_t records_omitted = 0;
  std::uint64_t bytes_in = 0;
  std::uint64_t bytes_out = 0;

  // Timing
  double wall_time_ms = 0.0;
  double throughput_mb_s = 0.0;
  double records_per_sec = 0.0;

  // Run setup
  std::vector<std::string> inputs;
  char rs = '\n';
  std::string fs;
  std::vector<std::string> filters;   // e.g. "grep:foo", "upper"

  // "ok" or "error: ..."
  std::string status = "ok";
};

class RunJsonWriter {
public:
  // Serialize payload to a compact JSON object.
  static std::string to_json(const RunJsonPayload& p);
};

}
