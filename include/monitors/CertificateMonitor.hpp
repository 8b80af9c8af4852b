#pragma once
#include "model/Cert.hpp"
#include "monitors/TtlCache.hpp"
#include "net/CertFetcher.hpp"
#include "net/X509Cert.hpp"
#include "util/Clock.hpp"
#include "util/Logger.hpp"
#include "util/Result.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

namespace netdiag::monitors {

struct CertificateOptions {
  std::chrono::seconds ttl{3600};
  std::chrono::milliseconds timeout{10000}; // connect + handshake
};

// Caches parsed peer certificates per host:port. days_until_expiry is
// recomputed against the wall clock on every check, hits included.
class CertificateMonitor {
public:
  CertificateMonitor(netdiag::net::ICertFetcher& fetcher, netdiag::util::Logger& log,
                     CertificateOptions opts = {}, netdiag::util::Clock clock = {});

  netdiag::util::Result<netdiag::model::CertificateInfo> check(const std::string& hostname, int port = 443);
  CacheStats cache_stats() const;

private:
  netdiag::net::ICertFetcher& fetcher_;
  netdiag::util::Logger& log_;
  CertificateOptions opts_;
  netdiag::util::Clock clock_;

  mutable std::mutex mu_;
  TtlCache<std::string, std::shared_ptr<const netdiag::net::X509Cert>> cache_;
};

} // namespace netdiag::monitors
