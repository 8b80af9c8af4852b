#pragma once
#include "model/Net.hpp"
#include "net/TcpConnector.hpp"
#include "util/Clock.hpp"
#include "util/Logger.hpp"
#include "util/Result.hpp"

#include <chrono>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace netdiag::monitors {

struct LatencyOptions {
  std::chrono::milliseconds track_interval{5000}; // shared by every host
  std::chrono::milliseconds timeout{1000};        // connect timeout used by track()
  size_t history = 100;                           // samples kept per host
};

class LatencyMonitor {
public:
  LatencyMonitor(netdiag::net::ITcpConnector& tcp, netdiag::util::Logger& log,
                 LatencyOptions opts = {}, netdiag::util::Clock clock = {});

  // Seconds from connect start until the connection is established.
  // Timeout and refusal come back as Fault::Timeout / Fault::Unreachable.
  netdiag::util::Result<double> measure(const std::string& host, int port = 80,
                                        std::chrono::milliseconds timeout = std::chrono::milliseconds(1000));

  // Rate-limited measure() that records successes into the host's history.
  // One timestamp is shared by every host: tracking A can throttle B.
  netdiag::util::Result<double> track(const std::string& host, int port = 80);

  // Appends a sample directly, evicting the oldest past the cap.
  void record(const std::string& host, double seconds);

  std::optional<netdiag::model::LatencyStats> stats(const std::string& host) const;
  std::vector<double> history(const std::string& host) const;

private:
  void record_locked(const std::string& host, double seconds);

  netdiag::net::ITcpConnector& tcp_;
  netdiag::util::Logger& log_;
  LatencyOptions opts_;
  netdiag::util::Clock clock_;

  mutable std::mutex mu_;
  std::map<std::string, std::deque<double>> history_;
  std::optional<std::chrono::steady_clock::time_point> last_track_;
};

} // namespace netdiag::monitors
