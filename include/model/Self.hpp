#pragma once
#include <cstdint>

namespace netdiag::model {

// Resource usage of the running diag process.
struct SelfMetrics {
  double memory_mb{};
  double cpu_percent{};
  uint32_t thread_count{};
  double uptime_seconds{};
};

} // namespace netdiag::model
