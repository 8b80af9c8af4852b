#pragma once
#include "collectors/ISocketSource.hpp"
#include "model/Net.hpp"
#include "util/Clock.hpp"
#include "util/Logger.hpp"

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace netdiag::monitors {

// Serves grouped connection views from a snapshot that is re-enumerated at
// most once per interval. Between refreshes callers see the stale snapshot.
class ConnectionMonitor {
public:
  ConnectionMonitor(netdiag::collectors::ISocketSource& source, netdiag::util::Logger& log,
                    std::chrono::milliseconds interval = std::chrono::milliseconds(1000),
                    netdiag::util::Clock clock = {});

  // Throws whatever the socket source throws.
  void refresh();

  std::map<std::string, size_t> summary();
  std::vector<netdiag::model::ConnectionRecord> by_status(const std::string& status);

private:
  void refresh_locked();

  netdiag::collectors::ISocketSource& source_;
  netdiag::util::Logger& log_;
  std::chrono::milliseconds interval_;
  netdiag::util::Clock clock_;

  std::mutex mu_;
  netdiag::model::ConnectionGroups groups_;
  std::optional<std::chrono::steady_clock::time_point> last_refresh_;
};

} // namespace netdiag::monitors
