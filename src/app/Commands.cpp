#include "app/Commands.hpp"
#include "app/Render.hpp"
#include "util/Traced.hpp"

#include <stdexcept>

#include <fmt/format.h>

namespace netdiag::app {

using nlohmann::json;

static int cmd_metrics(const CliOptions& o, Services& svc, std::ostream& out) {
  netdiag::model::SelfMetrics m;
  if (!svc.self.sample(m)) throw std::runtime_error("cannot read /proc/self");
  if (o.json) { out << self_metrics_json(m).dump(2) << "\n"; return 0; }
  out << "\nSystem Metrics:\n"
      << fmt::format("  memory_usage: {:.2f} MB\n", m.memory_mb)
      << fmt::format("  cpu_percent: {:.1f}\n", m.cpu_percent)
      << "  thread_count: " << m.thread_count << "\n"
      << fmt::format("  uptime: {:.2f}s\n", m.uptime_seconds)
      << "  uptime_friendly: " << netdiag::collectors::format_uptime(m.uptime_seconds) << "\n";
  return 0;
}

static int cmd_net_metrics(const CliOptions& o, Services& svc, std::ostream& out) {
  netdiag::model::InterfaceTable ifaces;
  if (!svc.interfaces.sample(ifaces)) throw std::runtime_error("cannot read /proc/net/dev");
  auto socks = svc.sockets.enumerate();
  if (o.json) {
    json conns = json::array();
    for (const auto& s : socks) conns.push_back(socket_json(s));
    out << json{{"interfaces", interfaces_json(ifaces)}, {"connections", conns}}.dump(2) << "\n";
    return 0;
  }
  out << "Network Interfaces:\n";
  print_interfaces(out, ifaces);
  out << "\nActive Connections:\n";
  for (const auto& s : socks) print_socket(out, s);
  return 0;
}

static int cmd_connections(const CliOptions& o, Services& svc, std::ostream& out) {
  if (o.status) {
    auto recs = svc.connections.by_status(*o.status);
    if (o.json) {
      json arr = json::array();
      for (const auto& r : recs) {
        auto j = connection_json(r);
        j.erase("status");
        arr.push_back(std::move(j));
      }
      out << arr.dump(2) << "\n";
      return 0;
    }
    out << "\nConnections with status '" << *o.status << "':\n";
    for (const auto& r : recs) print_connection(out, r);
    return 0;
  }
  auto summary = svc.connections.summary();
  if (o.json) {
    json j = json::object();
    for (const auto& [status, n] : summary) j[status] = n;
    out << j.dump(2) << "\n";
    return 0;
  }
  out << "\nConnection Summary:\n";
  for (const auto& [status, n] : summary) out << "  " << status << ": " << n << "\n";
  return 0;
}

static int cmd_latency(const CliOptions& o, Services& svc, std::ostream& out, std::ostream& err) {
  std::vector<double> runs;
  for (int i = 0; i < o.count; ++i) {
    auto r = svc.latency.measure(o.target, o.port, svc.connect_timeout);
    if (!r) {
      err << "Failed to measure latency to " << o.target << "\n";
      return 1;
    }
    runs.push_back(r.value());
    svc.latency.record(o.target, r.value());
  }
  auto st = svc.latency.stats(o.target);
  if (!st) throw std::logic_error("latency history empty after successful measurements");
  if (o.json) {
    json j{
      {"host", o.target},
      {"port", o.port},
      {"measurements", runs},
      {"stats", {{"min", st->min}, {"max", st->max}, {"avg", st->avg}}},
    };
    out << j.dump(2) << "\n";
    return 0;
  }
  out << "\nLatency to " << o.target << ":\n"
      << fmt::format("  Min: {:.3f}s\n", st->min)
      << fmt::format("  Max: {:.3f}s\n", st->max)
      << fmt::format("  Avg: {:.3f}s\n", st->avg)
      << "\nMeasurements:\n";
  for (size_t i = 0; i < runs.size(); ++i) out << fmt::format("  {}: {:.3f}s\n", i + 1, runs[i]);
  return 0;
}

static int cmd_dns(const CliOptions& o, Services& svc, std::ostream& out, std::ostream& err) {
  auto r = svc.dns.resolve(o.target);
  if (!r) {
    err << "Failed to resolve " << o.target << "\n";
    return 1;
  }
  auto stats = svc.dns.cache_stats();
  if (o.json) {
    json j{
      {"hostname", o.target},
      {"ip_addresses", r.value()},
      {"cache_stats", cache_stats_json(stats)},
    };
    out << j.dump(2) << "\n";
    return 0;
  }
  out << "\nDNS Resolution for " << o.target << ":\nIP Addresses:\n";
  for (const auto& ip : r.value()) out << "  " << ip << "\n";
  print_cache_stats(out, stats);
  return 0;
}

static int cmd_ssl(const CliOptions& o, Services& svc, std::ostream& out, std::ostream& err) {
  auto r = svc.certs.check(o.target, o.port);
  if (!r) {
    err << "Failed to check certificate for " << o.target << "\n";
    return 1;
  }
  auto stats = svc.certs.cache_stats();
  if (o.json) {
    json j{
      {"hostname", o.target},
      {"port", o.port},
      {"certificate", certificate_json(r.value())},
      {"cache_stats", cache_stats_json(stats)},
    };
    out << j.dump(2) << "\n";
    return 0;
  }
  out << "\nSSL Certificate for " << o.target << ":\n";
  print_certificate(out, r.value());
  print_cache_stats(out, stats);
  return 0;
}

static const char* command_name(Command c) {
  switch (c) {
    case Command::Metrics:        return "metrics";
    case Command::NetMetrics:     return "network.metrics";
    case Command::NetConnections: return "network.connections";
    case Command::NetLatency:     return "network.latency";
    case Command::NetDns:         return "network.dns";
    case Command::NetSsl:         return "network.ssl";
    default:                      return "help";
  }
}

int run_command(const CliOptions& o, Services& svc, netdiag::util::Logger& log,
                std::ostream& out, std::ostream& err) {
  if (o.help || o.command == Command::None) { out << usage_text(); return 0; }
  if (o.command == Command::NetworkNone) { out << network_usage_text(); return 0; }

  auto dispatch = [&]() -> int {
    switch (o.command) {
      case Command::Metrics:        return cmd_metrics(o, svc, out);
      case Command::NetMetrics:     return cmd_net_metrics(o, svc, out);
      case Command::NetConnections: return cmd_connections(o, svc, out);
      case Command::NetLatency:     return cmd_latency(o, svc, out, err);
      case Command::NetDns:         return cmd_dns(o, svc, out, err);
      case Command::NetSsl:         return cmd_ssl(o, svc, out, err);
      default:                      return 0;
    }
  };
  const char* name = command_name(o.command);
  return netdiag::util::log_call(log, name, [&] { return netdiag::util::log_timing(log, name, dispatch); });
}

} // namespace netdiag::app
