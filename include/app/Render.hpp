#pragma once
#include "model/Cert.hpp"
#include "model/Net.hpp"
#include "model/Self.hpp"
#include "monitors/TtlCache.hpp"

#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace netdiag::app {

// JSON documents printed by --json. Keys follow the psutil-style names the
// tool has always emitted (errin, dropout, local_addr, ...).
nlohmann::json interfaces_json(const netdiag::model::InterfaceTable& t);
nlohmann::json socket_json(const netdiag::model::SocketEntry& s);
nlohmann::json connection_json(const netdiag::model::ConnectionRecord& c);
nlohmann::json endpoint_json(const std::optional<netdiag::model::Endpoint>& ep);
nlohmann::json certificate_json(const netdiag::model::CertificateInfo& c);
nlohmann::json cache_stats_json(const netdiag::monitors::CacheStats& s);
nlohmann::json self_metrics_json(const netdiag::model::SelfMetrics& m);

// Labeled text renderings.
std::string family_name(int family);
std::string socktype_name(int type);
std::string endpoint_text(const std::optional<netdiag::model::Endpoint>& ep);
void print_interfaces(std::ostream& out, const netdiag::model::InterfaceTable& t);
void print_socket(std::ostream& out, const netdiag::model::SocketEntry& s);
void print_connection(std::ostream& out, const netdiag::model::ConnectionRecord& c);
void print_certificate(std::ostream& out, const netdiag::model::CertificateInfo& c);
void print_cache_stats(std::ostream& out, const netdiag::monitors::CacheStats& s);

} // namespace netdiag::app
