#include "app/Config.hpp"
#include "util/TomlReader.hpp"

#include <algorithm>
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace netdiag::app {

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  if (n.rfind("NETDIAG_", 0) == 0) {
    alt = std::string("netdiag_") + n.substr(8);
  } else if (n.rfind("netdiag_", 0) == 0) {
    alt = std::string("NETDIAG_") + n.substr(8);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

int getenv_int(const char* name, int defv) {
  const char* v = getenv_compat(name);
  if (!v || !*v) return defv;
  try { return std::stoi(v); } catch (const std::exception&) { return defv; }
}

static bool env_flag(const char* name, bool defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  if (v[0]=='0'||v[0]=='f'||v[0]=='F'||v[0]=='n'||v[0]=='N') return false;
  return true;
}

std::string config_file_path(const std::string& explicit_path) {
  if (!explicit_path.empty()) return explicit_path;
  if (const char* p = getenv_compat("NETDIAG_CONFIG")) return p;
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/netdiag/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/netdiag/config.toml";
  return {};
}

// Resolve an int from TOML -> env -> compiled default
static int resolve_int(const netdiag::util::TomlReader& toml, bool have_toml,
                       const char* section, const char* key,
                       const char* env_name, int def) {
  if (have_toml && toml.has(section, key))
    return static_cast<int>(toml.get_int(section, key, def));
  if (env_name)
    return getenv_int(env_name, def);
  return def;
}

// Resolve a bool from TOML -> env -> compiled default
static bool resolve_bool(const netdiag::util::TomlReader& toml, bool have_toml,
                         const char* section, const char* key,
                         const char* env_name, bool def) {
  if (have_toml && toml.has(section, key))
    return toml.get_bool(section, key, def);
  if (env_name)
    return env_flag(env_name, def);
  return def;
}

// Resolve a string from TOML -> env -> compiled default
static std::string resolve_string(const netdiag::util::TomlReader& toml, bool have_toml,
                                  const char* section, const char* key,
                                  const char* env_name, const std::string& def) {
  if (have_toml && toml.has(section, key))
    return toml.get_string(section, key, def);
  if (env_name) {
    const char* v = getenv_compat(env_name);
    if (v && *v) return std::string(v);
  }
  return def;
}

DiagConfig load_config(const std::string& path) {
  DiagConfig c{};
  const DiagConfig d{};
  netdiag::util::TomlReader toml;
  bool have_toml = !path.empty() && toml.load(path);

  // --- [log] ---
  c.log.level    = resolve_string(toml, have_toml, "log", "level",    "NETDIAG_LOG_LEVEL", d.log.level);
  c.log.dir      = resolve_string(toml, have_toml, "log", "dir",      "NETDIAG_LOG_DIR",   d.log.dir);
  c.log.max_runs = resolve_int(toml, have_toml,    "log", "max_runs", "NETDIAG_MAX_LOGS",  d.log.max_runs);

  // --- [connections] ---
  c.connections.interval_ms = resolve_int(toml, have_toml, "connections", "interval_ms", "NETDIAG_CONN_INTERVAL_MS", d.connections.interval_ms);

  // --- [latency] ---
  c.latency.track_interval_ms = resolve_int(toml, have_toml, "latency", "track_interval_ms", "NETDIAG_TRACK_INTERVAL_MS",  d.latency.track_interval_ms);
  c.latency.timeout_ms        = resolve_int(toml, have_toml, "latency", "timeout_ms",        "NETDIAG_CONNECT_TIMEOUT_MS", d.latency.timeout_ms);
  c.latency.history           = resolve_int(toml, have_toml, "latency", "history",           "NETDIAG_LATENCY_HISTORY",    d.latency.history);

  // --- [dns] ---
  c.dns.ttl_s = resolve_int(toml, have_toml, "dns", "ttl_s", "NETDIAG_DNS_TTL_S", d.dns.ttl_s);

  // --- [tls] ---
  c.tls.ttl_s      = resolve_int(toml, have_toml,  "tls", "ttl_s",      "NETDIAG_TLS_TTL_S",      d.tls.ttl_s);
  c.tls.timeout_ms = resolve_int(toml, have_toml,  "tls", "timeout_ms", "NETDIAG_TLS_TIMEOUT_MS", d.tls.timeout_ms);
  c.tls.verify     = resolve_bool(toml, have_toml, "tls", "verify",     "NETDIAG_TLS_VERIFY",     d.tls.verify);

  // Negative durations make no sense; fall back rather than fail
  if (c.connections.interval_ms < 0) c.connections.interval_ms = d.connections.interval_ms;
  if (c.latency.track_interval_ms < 0) c.latency.track_interval_ms = d.latency.track_interval_ms;
  if (c.latency.timeout_ms <= 0) c.latency.timeout_ms = d.latency.timeout_ms;
  c.latency.history = std::max(1, c.latency.history);
  if (c.dns.ttl_s < 0) c.dns.ttl_s = d.dns.ttl_s;
  if (c.tls.ttl_s < 0) c.tls.ttl_s = d.tls.ttl_s;
  if (c.tls.timeout_ms <= 0) c.tls.timeout_ms = d.tls.timeout_ms;
  return c;
}

} // namespace netdiag::app
