#include "app/Render.hpp"
#include "collectors/SelfCollector.hpp"
#include "net/X509Cert.hpp"

#include <sys/socket.h>

#include <fmt/format.h>

namespace netdiag::app {

using nlohmann::json;

nlohmann::json interfaces_json(const netdiag::model::InterfaceTable& t) {
  json j = json::object();
  for (const auto& [name, s] : t) {
    j[name] = {
      {"bytes_sent", s.bytes_sent},
      {"bytes_recv", s.bytes_recv},
      {"packets_sent", s.packets_sent},
      {"packets_recv", s.packets_recv},
      {"errin", s.errors_in},
      {"errout", s.errors_out},
      {"dropin", s.drops_in},
      {"dropout", s.drops_out},
    };
  }
  return j;
}

nlohmann::json endpoint_json(const std::optional<netdiag::model::Endpoint>& ep) {
  if (!ep) return json::array();
  return json::array({ep->ip, ep->port});
}

static json pid_json(const std::optional<int32_t>& pid) {
  return pid ? json(*pid) : json(nullptr);
}

nlohmann::json socket_json(const netdiag::model::SocketEntry& s) {
  return json{
    {"fd", s.fd},
    {"family", s.family},
    {"type", s.type},
    {"local_addr", endpoint_json(s.local)},
    {"remote_addr", endpoint_json(s.remote)},
    {"status", s.status},
    {"pid", pid_json(s.pid)},
  };
}

nlohmann::json connection_json(const netdiag::model::ConnectionRecord& c) {
  return json{
    {"local", endpoint_json(c.local)},
    {"remote", endpoint_json(c.remote)},
    {"status", c.status},
    {"pid", pid_json(c.pid)},
  };
}

nlohmann::json certificate_json(const netdiag::model::CertificateInfo& c) {
  return json{
    {"subject", {{"common_name", c.subject.common_name}, {"organization", c.subject.organization}}},
    {"issuer", {{"common_name", c.issuer.common_name}, {"organization", c.issuer.organization}}},
    {"not_before", netdiag::net::format_utc_iso(c.not_before)},
    {"not_after", netdiag::net::format_utc_iso(c.not_after)},
    {"days_until_expiry", c.days_until_expiry},
    {"serial_number", c.serial_number},
    {"version", c.version},
  };
}

nlohmann::json cache_stats_json(const netdiag::monitors::CacheStats& s) {
  return json{{"size", s.size}, {"entries", s.entries}};
}

nlohmann::json self_metrics_json(const netdiag::model::SelfMetrics& m) {
  return json{
    {"memory_usage", m.memory_mb},
    {"cpu_percent", m.cpu_percent},
    {"thread_count", m.thread_count},
    {"uptime", m.uptime_seconds},
    {"uptime_friendly", netdiag::collectors::format_uptime(m.uptime_seconds)},
  };
}

std::string family_name(int family) {
  switch (family) {
    case AF_INET:  return "AF_INET";
    case AF_INET6: return "AF_INET6";
    default:       return std::to_string(family);
  }
}

std::string socktype_name(int type) {
  switch (type) {
    case SOCK_STREAM: return "SOCK_STREAM";
    case SOCK_DGRAM:  return "SOCK_DGRAM";
    default:          return std::to_string(type);
  }
}

std::string endpoint_text(const std::optional<netdiag::model::Endpoint>& ep) {
  if (!ep) return "-";
  if (ep->ip.find(':') != std::string::npos) return fmt::format("[{}]:{}", ep->ip, ep->port);
  return fmt::format("{}:{}", ep->ip, ep->port);
}

static std::string pid_text(const std::optional<int32_t>& pid) {
  return pid ? std::to_string(*pid) : "-";
}

void print_interfaces(std::ostream& out, const netdiag::model::InterfaceTable& t) {
  for (const auto& [name, s] : t) {
    out << "\n" << name << ":\n"
        << "  bytes_sent: "   << s.bytes_sent   << "\n"
        << "  bytes_recv: "   << s.bytes_recv   << "\n"
        << "  packets_sent: " << s.packets_sent << "\n"
        << "  packets_recv: " << s.packets_recv << "\n"
        << "  errin: "        << s.errors_in    << "\n"
        << "  errout: "       << s.errors_out   << "\n"
        << "  dropin: "       << s.drops_in     << "\n"
        << "  dropout: "      << s.drops_out    << "\n";
  }
}

void print_socket(std::ostream& out, const netdiag::model::SocketEntry& s) {
  out << fmt::format("  fd={} family={} type={} local={} remote={} status={} pid={}\n",
                     s.fd, family_name(s.family), socktype_name(s.type),
                     endpoint_text(s.local), endpoint_text(s.remote), s.status, pid_text(s.pid));
}

void print_connection(std::ostream& out, const netdiag::model::ConnectionRecord& c) {
  out << fmt::format("  local={} remote={} pid={}\n",
                     endpoint_text(c.local), endpoint_text(c.remote), pid_text(c.pid));
}

void print_certificate(std::ostream& out, const netdiag::model::CertificateInfo& c) {
  out << "\nSubject:\n"
      << "  common_name: "  << c.subject.common_name  << "\n"
      << "  organization: " << c.subject.organization << "\n"
      << "\nIssuer:\n"
      << "  common_name: "  << c.issuer.common_name  << "\n"
      << "  organization: " << c.issuer.organization << "\n"
      << "\nValidity:\n"
      << "  Not Before: " << netdiag::net::format_utc_iso(c.not_before) << "\n"
      << "  Not After: "  << netdiag::net::format_utc_iso(c.not_after)  << "\n"
      << "  Days Until Expiry: " << c.days_until_expiry << "\n"
      << "  Serial Number: " << c.serial_number << "\n"
      << "  Version: " << c.version << "\n";
}

void print_cache_stats(std::ostream& out, const netdiag::monitors::CacheStats& s) {
  out << "\nCache Statistics:\n"
      << "  size: " << s.size << "\n"
      << "  entries: " << s.entries << "\n";
}

} // namespace netdiag::app
