#include "monitors/CertificateMonitor.hpp"
#include "net/Errors.hpp"

#include <fmt/format.h>

namespace netdiag::monitors {

using Info = netdiag::model::CertificateInfo;
using netdiag::util::Fault;
using netdiag::util::Result;

CertificateMonitor::CertificateMonitor(netdiag::net::ICertFetcher& fetcher, netdiag::util::Logger& log,
                                       CertificateOptions opts, netdiag::util::Clock clock)
  : fetcher_(fetcher), log_(log), opts_(opts), clock_(std::move(clock)), cache_(opts.ttl) {}

Result<Info> CertificateMonitor::check(const std::string& hostname, int port) {
  const auto key = hostname + ":" + std::to_string(port);
  std::lock_guard<std::mutex> lk(mu_);
  if (const auto* hit = cache_.find_fresh(key, clock_.now())) {
    log_.debug(fmt::format("Certificate cache hit for {}", key));
    return Result<Info>::success(hit->value->describe(clock_.wall()));
  }

  auto fail = [&](Fault f, const std::exception& e) {
    log_.error(fmt::format("Error checking SSL certificate for {}: {}", key, e.what()));
    return Result<Info>::failure(f, e.what());
  };
  try {
    auto der = fetcher_.fetch(hostname, port, opts_.timeout);
    auto cert = std::make_shared<const netdiag::net::X509Cert>(netdiag::net::X509Cert::from_der(der));
    cache_.put(key, cert, clock_.now());
    return Result<Info>::success(cert->describe(clock_.wall()));
  } catch (const netdiag::net::TimeoutError& e) {
    return fail(Fault::Timeout, e);
  } catch (const netdiag::net::ConnectError& e) {
    return fail(Fault::Unreachable, e);
  } catch (const netdiag::net::TlsError& e) {
    return fail(Fault::Handshake, e);
  } catch (const netdiag::net::CertParseError& e) {
    return fail(Fault::BadCertificate, e);
  }
}

CacheStats CertificateMonitor::cache_stats() const {
  std::lock_guard<std::mutex> lk(mu_);
  return cache_.stats(clock_.now());
}

} // namespace netdiag::monitors
