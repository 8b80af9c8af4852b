#include "monitors/ConnectionMonitor.hpp"

#include <fmt/format.h>

namespace netdiag::monitors {

ConnectionMonitor::ConnectionMonitor(netdiag::collectors::ISocketSource& source, netdiag::util::Logger& log,
                                     std::chrono::milliseconds interval, netdiag::util::Clock clock)
  : source_(source), log_(log), interval_(interval), clock_(std::move(clock)) {}

void ConnectionMonitor::refresh() {
  std::lock_guard<std::mutex> lk(mu_);
  refresh_locked();
}

void ConnectionMonitor::refresh_locked() {
  auto now = clock_.now();
  if (last_refresh_ && now - *last_refresh_ < interval_) return;

  netdiag::model::ConnectionGroups groups;
  auto entries = source_.enumerate();
  for (auto& e : entries) {
    groups[e.status].push_back(netdiag::model::ConnectionRecord{
        std::move(e.local), std::move(e.remote), e.status, e.pid});
  }
  log_.debug(fmt::format("Refreshed {} connections from {} into {} groups",
                         entries.size(), source_.name(), groups.size()));
  groups_.swap(groups);
  last_refresh_ = now;
}

std::map<std::string, size_t> ConnectionMonitor::summary() {
  std::lock_guard<std::mutex> lk(mu_);
  refresh_locked();
  std::map<std::string, size_t> out;
  for (const auto& [status, recs] : groups_) out[status] = recs.size();
  return out;
}

std::vector<netdiag::model::ConnectionRecord> ConnectionMonitor::by_status(const std::string& status) {
  std::lock_guard<std::mutex> lk(mu_);
  refresh_locked();
  auto it = groups_.find(status);
  if (it == groups_.end()) return {};
  return it->second;
}

} // namespace netdiag::monitors
