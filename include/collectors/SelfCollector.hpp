#pragma once
#include "model/Self.hpp"
#include <string>

namespace netdiag::collectors {

// Resource usage of the current process from /proc/self and /proc/uptime.
class SelfCollector {
public:
  explicit SelfCollector(long clock_ticks = 0); // 0: sysconf(_SC_CLK_TCK)
  bool sample(netdiag::model::SelfMetrics& out) const;
private:
  long hz_;
  static bool parse_stat_line(const std::string& content, uint64_t& utime, uint64_t& stime, uint64_t& starttime);
};

// timedelta-style rendering: "H:MM:SS", or "N day(s), H:MM:SS".
[[nodiscard]] std::string format_uptime(double seconds);

} // namespace netdiag::collectors
