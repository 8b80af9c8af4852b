#include "app/Cli.hpp"

#include <cerrno>
#include <climits>
#include <cstdlib>

namespace netdiag::app {

const char* usage_text() {
  return
    "Usage: diag [--config FILE] [--log-level LEVEL] [--log-dir DIR] [--max-logs N] COMMAND\n"
    "\n"
    "Commands:\n"
    "  metrics [--json]                                    Show process metrics\n"
    "  network metrics [--json]                            Interface counters and sockets\n"
    "  network connections [--status S] [--json]           Connection summary or filter\n"
    "  network latency HOST [--port P] [--count N] [--json]  TCP connect latency (port 80, 5 runs)\n"
    "  network dns HOSTNAME [--json]                       Resolve and show cache stats\n"
    "  network ssl HOSTNAME [--port P] [--json]            TLS certificate (port 443)\n"
    "\n"
    "Options:\n"
    "  --config FILE      Config file (default: $XDG_CONFIG_HOME/netdiag/config.toml)\n"
    "  --log-level LEVEL  debug|info|warning|error|critical (default: error)\n"
    "  --log-dir DIR      Write a per-run debug.log under DIR\n"
    "  --max-logs N       Keep at most N run directories under the log dir\n"
    "  -h, --help         Show this help\n";
}

const char* network_usage_text() {
  return
    "Usage: diag network {metrics,connections,latency,dns,ssl} ...\n"
    "\n"
    "  metrics       Show network interface metrics\n"
    "  connections   Show network connections\n"
    "  latency       Measure network latency\n"
    "  dns           DNS resolution and cache info\n"
    "  ssl           SSL/TLS certificate information\n";
}

static int parse_int(const std::string& flag, const std::string& v) {
  char* end = nullptr;
  errno = 0;
  long n = std::strtol(v.c_str(), &end, 10);
  if (v.empty() || *end != '\0' || errno == ERANGE || n < INT_MIN || n > INT_MAX)
    throw UsageError(flag + ": invalid int value: '" + v + "'");
  return static_cast<int>(n);
}

CliOptions parse_args(const std::vector<std::string>& args) {
  CliOptions o;
  std::vector<std::string> pos;
  bool have_port = false, have_count = false;

  for (size_t i = 0; i < args.size(); ++i) {
    std::string a = args[i];
    std::string inline_val;
    bool has_inline = false;
    if (a.rfind("--", 0) == 0) {
      auto eq = a.find('=');
      if (eq != std::string::npos) { inline_val = a.substr(eq + 1); a = a.substr(0, eq); has_inline = true; }
    }
    auto value = [&]() -> std::string {
      if (has_inline) return inline_val;
      if (i + 1 >= args.size()) throw UsageError(a + ": expected one argument");
      return args[++i];
    };

    if (a == "-h" || a == "--help") { o.help = true; }
    else if (a == "--json") { o.json = true; }
    else if (a == "--config") { o.config_path = value(); }
    else if (a == "--log-level") { o.log_level = value(); }
    else if (a == "--log-dir") { o.log_dir = value(); }
    else if (a == "--max-logs") { o.max_logs = parse_int(a, value()); }
    else if (a == "--status") { o.status = value(); }
    else if (a == "--port") { o.port = parse_int(a, value()); have_port = true; }
    else if (a == "--count") { o.count = parse_int(a, value()); have_count = true; }
    else if (a.size() > 1 && a[0] == '-') { throw UsageError("unrecognized arguments: " + a); }
    else pos.push_back(a);
  }

  if (pos.empty()) return o;

  size_t want = 1;
  if (pos[0] == "metrics") {
    o.command = Command::Metrics;
  } else if (pos[0] == "network") {
    if (pos.size() < 2) { o.command = Command::NetworkNone; want = 1; }
    else {
      const auto& sub = pos[1];
      want = 2;
      if (sub == "metrics") o.command = Command::NetMetrics;
      else if (sub == "connections") o.command = Command::NetConnections;
      else if (sub == "latency" || sub == "dns" || sub == "ssl") {
        o.command = sub == "latency" ? Command::NetLatency : sub == "dns" ? Command::NetDns : Command::NetSsl;
        if (pos.size() < 3) throw UsageError("network " + sub + ": the following arguments are required: " +
                                             (sub == "latency" ? "host" : "hostname"));
        o.target = pos[2];
        want = 3;
      } else {
        throw UsageError("network: invalid choice: '" + sub + "'");
      }
    }
  } else {
    throw UsageError("invalid choice: '" + pos[0] + "' (choose from 'metrics', 'network')");
  }
  if (pos.size() > want) throw UsageError("unrecognized arguments: " + pos[want]);

  if (o.status && o.command != Command::NetConnections) throw UsageError("unrecognized arguments: --status");
  if (have_port && o.command != Command::NetLatency && o.command != Command::NetSsl)
    throw UsageError("unrecognized arguments: --port");
  if (have_count && o.command != Command::NetLatency) throw UsageError("unrecognized arguments: --count");

  if (!have_port) o.port = o.command == Command::NetSsl ? 443 : 80;
  if (o.port < 1 || o.port > 65535) throw UsageError("--port: must be between 1 and 65535");
  if (o.count < 1) throw UsageError("--count: must be at least 1");
  return o;
}

} // namespace netdiag::app
