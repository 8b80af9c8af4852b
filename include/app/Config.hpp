#pragma once
#include <string>

namespace netdiag::app {

struct DiagConfig {
  struct {
    std::string level{"error"};
    std::string dir{};   // empty: console only
    int max_runs{-1};    // < 1 keeps every run directory
  } log;
  struct {
    int interval_ms{1000};
  } connections;
  struct {
    int track_interval_ms{5000};
    int timeout_ms{1000};
    int history{100};
  } latency;
  struct {
    int ttl_s{300};
  } dns;
  struct {
    int ttl_s{3600};
    int timeout_ms{10000};
    bool verify{true};
  } tls;
};

// Environment variable helpers. NETDIAG_X and netdiag_X are interchangeable.
const char* getenv_compat(const char* name);
int getenv_int(const char* name, int defv);

// explicit_path, else $NETDIAG_CONFIG, else the XDG location. Empty if none.
std::string config_file_path(const std::string& explicit_path = {});

// TOML -> env -> compiled default. A missing file only means no TOML layer.
DiagConfig load_config(const std::string& path);

} // namespace netdiag::app
