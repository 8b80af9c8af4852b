#pragma once
#include "app/Cli.hpp"
#include "collectors/ISocketSource.hpp"
#include "collectors/NetCollector.hpp"
#include "collectors/SelfCollector.hpp"
#include "monitors/CertificateMonitor.hpp"
#include "monitors/ConnectionMonitor.hpp"
#include "monitors/DnsMonitor.hpp"
#include "monitors/LatencyMonitor.hpp"
#include "util/Logger.hpp"

#include <chrono>
#include <ostream>

namespace netdiag::app {

// Everything a command may touch. main() wires the real implementations;
// tests wire fakes.
struct Services {
  netdiag::collectors::NetCollector& interfaces;
  netdiag::collectors::ISocketSource& sockets;
  netdiag::collectors::SelfCollector& self;
  netdiag::monitors::ConnectionMonitor& connections;
  netdiag::monitors::LatencyMonitor& latency;
  netdiag::monitors::DnsMonitor& dns;
  netdiag::monitors::CertificateMonitor& certs;
  std::chrono::milliseconds connect_timeout{1000};
};

// Runs the parsed command, writing results to out and failures to err.
// Returns the process exit code. Exceptions other than the expected
// monitor absences propagate.
int run_command(const CliOptions& opts, Services& svc, netdiag::util::Logger& log,
                std::ostream& out, std::ostream& err);

} // namespace netdiag::app
