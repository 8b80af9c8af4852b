#include "app/Cli.hpp"
#include "app/Commands.hpp"
#include "app/Config.hpp"
#include "app/Render.hpp"
#include "collectors/NetCollector.hpp"
#include "collectors/SelfCollector.hpp"
#include "collectors/SocketCollector.hpp"
#include "monitors/CertificateMonitor.hpp"
#include "monitors/ConnectionMonitor.hpp"
#include "monitors/DnsMonitor.hpp"
#include "monitors/LatencyMonitor.hpp"
#include "net/CertFetcher.hpp"
#include "net/Resolver.hpp"
#include "net/TcpConnector.hpp"
#include "util/DebugRegistry.hpp"
#include "util/Logger.hpp"

#include <csignal>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <unistd.h>

// Best-effort write that satisfies warn_unused_result without escalating
// errors. Called from the signal handler, so it must stay async-signal-safe.
static inline void best_effort_write(int fd, const char* buf, size_t len) {
  if (len == 0) return;
  if (::write(fd, buf, len) < 0) { /* ignore */ }
}

static void on_sigint(int) {
  static const char msg[] = "\nOperation cancelled by user\n";
  best_effort_write(STDERR_FILENO, msg, sizeof(msg) - 1);
  ::_exit(130);
}

int main(int argc, char** argv) {
  std::signal(SIGINT, on_sigint);
  // A peer closing mid-handshake must surface as EPIPE, not kill the process
  std::signal(SIGPIPE, SIG_IGN);

  netdiag::app::CliOptions opts;
  try {
    opts = netdiag::app::parse_args(std::vector<std::string>(argv + 1, argv + argc));
  } catch (const netdiag::app::UsageError& e) {
    std::cerr << netdiag::app::usage_text() << "diag: error: " << e.what() << "\n";
    return 2;
  }

  try {
    auto cfg = netdiag::app::load_config(netdiag::app::config_file_path(opts.config_path));
    if (opts.log_level) cfg.log.level = *opts.log_level;
    if (opts.log_dir) cfg.log.dir = *opts.log_dir;
    if (opts.max_logs) cfg.log.max_runs = *opts.max_logs;

    netdiag::util::LogSettings ls;
    ls.level = netdiag::util::log_level_from_string(cfg.log.level, netdiag::util::LogLevel::Error);
    ls.dir = cfg.log.dir;
    ls.max_runs = cfg.log.max_runs;
    auto log = netdiag::util::make_logger(ls);

    netdiag::collectors::NetCollector interfaces;
    netdiag::collectors::SocketCollector sockets;
    netdiag::collectors::SelfCollector self;
    netdiag::net::TcpConnector tcp;
    netdiag::net::SystemResolver resolver;
    netdiag::net::TlsCertFetcher fetcher(tcp, cfg.tls.verify);

    netdiag::monitors::ConnectionMonitor connections(sockets, *log,
        std::chrono::milliseconds(cfg.connections.interval_ms));
    netdiag::monitors::LatencyOptions lat;
    lat.track_interval = std::chrono::milliseconds(cfg.latency.track_interval_ms);
    lat.timeout = std::chrono::milliseconds(cfg.latency.timeout_ms);
    lat.history = static_cast<size_t>(cfg.latency.history);
    netdiag::monitors::LatencyMonitor latency(tcp, *log, lat);
    netdiag::monitors::DnsMonitor dns(resolver, *log, std::chrono::seconds(cfg.dns.ttl_s));
    netdiag::monitors::CertificateOptions cert;
    cert.ttl = std::chrono::seconds(cfg.tls.ttl_s);
    cert.timeout = std::chrono::milliseconds(cfg.tls.timeout_ms);
    netdiag::monitors::CertificateMonitor certs(fetcher, *log, cert);

    netdiag::app::Services svc{interfaces, sockets, self, connections, latency, dns, certs,
                               std::chrono::milliseconds(cfg.latency.timeout_ms)};
    auto& exit_dumps = log->debug_functions();
    exit_dumps.add("self_metrics", [&self]() -> std::string {
      netdiag::model::SelfMetrics m;
      if (!self.sample(m)) return {};
      return netdiag::app::self_metrics_json(m).dump(2);
    });
    exit_dumps.add("cache_stats", [&dns, &certs]() -> std::string {
      nlohmann::json j = {{"dns", netdiag::app::cache_stats_json(dns.cache_stats())},
                          {"ssl", netdiag::app::cache_stats_json(certs.cache_stats())}};
      return j.dump(2);
    });

    int rc = netdiag::app::run_command(opts, svc, *log, std::cout, std::cerr);
    std::cout.flush();
    exit_dumps.run();
    return rc;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
