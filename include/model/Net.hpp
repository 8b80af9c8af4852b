#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace netdiag::model {

// Counters reported by /proc/net/dev for one interface.
struct InterfaceStats {
  uint64_t bytes_sent{};
  uint64_t bytes_recv{};
  uint64_t packets_sent{};
  uint64_t packets_recv{};
  uint64_t errors_in{};
  uint64_t errors_out{};
  uint64_t drops_in{};
  uint64_t drops_out{};
};

using InterfaceTable = std::map<std::string, InterfaceStats>;

struct Endpoint {
  std::string ip;
  uint16_t port{};
  bool operator==(const Endpoint&) const = default;
};

// One socket as enumerated from /proc/net/*.
struct SocketEntry {
  int fd{-1};                       // -1 when the owner could not be identified
  int family{};                     // AF_INET / AF_INET6
  int type{};                       // SOCK_STREAM / SOCK_DGRAM
  Endpoint local{};
  std::optional<Endpoint> remote{}; // absent for listeners and unconnected UDP
  std::string status;               // ESTABLISHED, LISTEN, ... / NONE for UDP
  std::optional<int32_t> pid{};
  uint64_t inode{};
};

struct ConnectionRecord {
  Endpoint local{};
  std::optional<Endpoint> remote{};
  std::string status;
  std::optional<int32_t> pid{};
};

using ConnectionGroups = std::map<std::string, std::vector<ConnectionRecord>>;

struct LatencyStats {
  double min{};
  double max{};
  double avg{};
};

} // namespace netdiag::model
