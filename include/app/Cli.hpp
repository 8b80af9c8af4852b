#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace netdiag::app {

enum class Command {
  None,            // no command given: print help
  NetworkNone,     // "network" without a subcommand: print network help
  Metrics,
  NetMetrics,
  NetConnections,
  NetLatency,
  NetDns,
  NetSsl,
};

struct CliOptions {
  Command command{Command::None};
  bool help{false};
  bool json{false};

  // global
  std::string config_path;
  std::optional<std::string> log_level;
  std::optional<std::string> log_dir;
  std::optional<int> max_logs;

  // per command
  std::string target;                 // HOST / HOSTNAME
  std::optional<std::string> status;  // connections --status
  int port{0};                        // 80 for latency, 443 for ssl
  int count{5};                       // latency --count
};

// Bad command line; main prints the message and usage, exit 2.
struct UsageError : public std::runtime_error { using std::runtime_error::runtime_error; };

// args excludes argv[0]. Throws UsageError.
CliOptions parse_args(const std::vector<std::string>& args);

const char* usage_text();
const char* network_usage_text();

} // namespace netdiag::app
