#include "monitors/DnsMonitor.hpp"
#include "net/Errors.hpp"

#include <fmt/format.h>

namespace netdiag::monitors {

using Addresses = std::vector<std::string>;
using netdiag::util::Fault;
using netdiag::util::Result;

DnsMonitor::DnsMonitor(netdiag::net::IResolver& resolver, netdiag::util::Logger& log,
                       std::chrono::seconds ttl, netdiag::util::Clock clock)
  : resolver_(resolver), log_(log), clock_(std::move(clock)), cache_(ttl) {}

// The lock is held across the lookup so concurrent misses for one name
// resolve it once.
Result<Addresses> DnsMonitor::resolve(const std::string& hostname) {
  std::lock_guard<std::mutex> lk(mu_);
  if (const auto* hit = cache_.find_fresh(hostname, clock_.now())) {
    log_.debug(fmt::format("DNS cache hit for {}", hostname));
    return Result<Addresses>::success(hit->value);
  }
  try {
    auto addrs = resolver_.resolve(hostname);
    cache_.put(hostname, addrs, clock_.now());
    return Result<Addresses>::success(std::move(addrs));
  } catch (const netdiag::net::ResolveError& e) {
    log_.error(fmt::format("DNS resolution failed for {}: {}", hostname, e.what()));
    return Result<Addresses>::failure(Fault::Unresolved, e.what());
  }
}

CacheStats DnsMonitor::cache_stats() const {
  std::lock_guard<std::mutex> lk(mu_);
  return cache_.stats(clock_.now());
}

} // namespace netdiag::monitors
