#include "monitors/LatencyMonitor.hpp"
#include "net/Errors.hpp"

#include <algorithm>
#include <numeric>

#include <fmt/format.h>

namespace netdiag::monitors {

using netdiag::util::Fault;
using netdiag::util::Result;

LatencyMonitor::LatencyMonitor(netdiag::net::ITcpConnector& tcp, netdiag::util::Logger& log,
                               LatencyOptions opts, netdiag::util::Clock clock)
  : tcp_(tcp), log_(log), opts_(opts), clock_(std::move(clock)) {
  if (opts_.history == 0) opts_.history = 1;
}

Result<double> LatencyMonitor::measure(const std::string& host, int port, std::chrono::milliseconds timeout) {
  const auto start = clock_.now();
  try {
    auto sock = tcp_.connect(host, port, timeout);
    double secs = netdiag::util::seconds_between(start, clock_.now());
    sock.reset();
    return Result<double>::success(std::max(0.0, secs));
  } catch (const netdiag::net::TimeoutError& e) {
    log_.warning(fmt::format("Failed to measure latency to {}:{}: {}", host, port, e.what()));
    return Result<double>::failure(Fault::Timeout, e.what());
  } catch (const netdiag::net::ConnectError& e) {
    log_.warning(fmt::format("Failed to measure latency to {}:{}: {}", host, port, e.what()));
    return Result<double>::failure(Fault::Unreachable, e.what());
  }
}

Result<double> LatencyMonitor::track(const std::string& host, int port) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    auto now = clock_.now();
    if (last_track_ && now - *last_track_ < opts_.track_interval) {
      log_.debug(fmt::format("Latency tracking for {} skipped: interval not elapsed", host));
      return Result<double>::failure(Fault::Throttled, "track interval not elapsed");
    }
    last_track_ = now;
  }
  auto r = measure(host, port, opts_.timeout);
  if (r) record(host, r.value());
  return r;
}

void LatencyMonitor::record(const std::string& host, double seconds) {
  std::lock_guard<std::mutex> lk(mu_);
  record_locked(host, seconds);
}

void LatencyMonitor::record_locked(const std::string& host, double seconds) {
  auto& h = history_[host];
  h.push_back(seconds);
  while (h.size() > opts_.history) h.pop_front();
}

std::optional<netdiag::model::LatencyStats> LatencyMonitor::stats(const std::string& host) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = history_.find(host);
  if (it == history_.end() || it->second.empty()) return std::nullopt;
  const auto& h = it->second;
  auto [lo, hi] = std::minmax_element(h.begin(), h.end());
  double sum = std::accumulate(h.begin(), h.end(), 0.0);
  return netdiag::model::LatencyStats{*lo, *hi, sum / static_cast<double>(h.size())};
}

std::vector<double> LatencyMonitor::history(const std::string& host) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = history_.find(host);
  if (it == history_.end()) return {};
  return {it->second.begin(), it->second.end()};
}

} // namespace netdiag::monitors
