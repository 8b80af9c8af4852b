#include "collectors/SelfCollector.hpp"
#include "util/Procfs.hpp"

#include <unistd.h>

#include <charconv>
#include <cstdio>
#include <sstream>
#include <string_view>

namespace netdiag::collectors {

static inline uint64_t parse_u64(std::string_view s) {
  uint64_t v = 0;
  while (!s.empty() && (s.back() < '0' || s.back() > '9')) s.remove_suffix(1);
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
  std::from_chars(s.data(), s.data() + s.size(), v);
  return v;
}

SelfCollector::SelfCollector(long clock_ticks) : hz_(clock_ticks) {
  if (hz_ <= 0) hz_ = ::sysconf(_SC_CLK_TCK);
  if (hz_ <= 0) hz_ = 100;
}

bool SelfCollector::parse_stat_line(const std::string& content, uint64_t& utime, uint64_t& stime, uint64_t& starttime) {
  // comm may contain spaces; fields resume after the last ')'
  auto rp = content.rfind(')'); if (rp == std::string::npos || rp + 2 > content.size()) return false;
  std::istringstream ss(content.substr(rp + 2));
  std::string tmp;
  for (int i = 0; i < 11; i++) ss >> tmp; // state .. cmajflt
  ss >> utime >> stime;
  for (int i = 0; i < 6; i++) ss >> tmp;  // cutime .. itrealvalue
  ss >> starttime;
  return !ss.fail();
}

bool SelfCollector::sample(netdiag::model::SelfMetrics& out) const {
  auto status = netdiag::util::read_file_string("/proc/self/status");
  auto stat = netdiag::util::read_file_string("/proc/self/stat");
  auto uptime = netdiag::util::read_file_string("/proc/uptime");
  if (!status || !stat || !uptime) return false;

  out = {};
  size_t start = 0;
  const std::string& txt = *status;
  while (start < txt.size()) {
    size_t end = txt.find('\n', start);
    if (end == std::string::npos) end = txt.size();
    std::string_view line(txt.data() + start, end - start);
    if (line.starts_with("VmRSS:")) out.memory_mb = static_cast<double>(parse_u64(line.substr(6))) / 1024.0;
    else if (line.starts_with("Threads:")) out.thread_count = static_cast<uint32_t>(parse_u64(line.substr(8)));
    start = end + 1;
  }

  uint64_t utime = 0, stime = 0, starttime = 0;
  if (!parse_stat_line(*stat, utime, stime, starttime)) return false;
  double sys_up = 0.0;
  std::istringstream us(*uptime);
  if (!(us >> sys_up)) return false;

  const double hz = static_cast<double>(hz_);
  out.uptime_seconds = sys_up - static_cast<double>(starttime) / hz;
  if (out.uptime_seconds < 0.0) out.uptime_seconds = 0.0;
  double cpu_secs = static_cast<double>(utime + stime) / hz;
  out.cpu_percent = out.uptime_seconds > 0.0 ? 100.0 * cpu_secs / out.uptime_seconds : 0.0;
  return true;
}

std::string format_uptime(double seconds) {
  long total = seconds > 0.0 ? static_cast<long>(seconds) : 0;
  long days = total / 86400; total %= 86400;
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%ld:%02ld:%02ld", total / 3600, (total % 3600) / 60, total % 60);
  if (days == 0) return buf;
  return std::to_string(days) + (days == 1 ? " day, " : " days, ") + buf;
}

} // namespace netdiag::collectors
