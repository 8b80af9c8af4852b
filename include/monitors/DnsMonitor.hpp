#pragma once
#include "monitors/TtlCache.hpp"
#include "net/Resolver.hpp"
#include "util/Clock.hpp"
#include "util/Logger.hpp"
#include "util/Result.hpp"

#include <chrono>
#include <mutex>
#include <string>
#include <vector>

namespace netdiag::monitors {

// Hostname -> IPv4 addresses, served from cache while fresh. Failures are
// never cached.
class DnsMonitor {
public:
  DnsMonitor(netdiag::net::IResolver& resolver, netdiag::util::Logger& log,
             std::chrono::seconds ttl = std::chrono::seconds(300),
             netdiag::util::Clock clock = {});

  netdiag::util::Result<std::vector<std::string>> resolve(const std::string& hostname);
  CacheStats cache_stats() const;

private:
  netdiag::net::IResolver& resolver_;
  netdiag::util::Logger& log_;
  netdiag::util::Clock clock_;

  mutable std::mutex mu_;
  TtlCache<std::string, std::vector<std::string>> cache_;
};

} // namespace netdiag::monitors
