#include "collectors/SocketCollector.hpp"
#include "util/Procfs.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <cstdlib>
#include <cstring>
#include <sstream>
#include <stdexcept>

namespace netdiag::collectors {

const char* SocketCollector::tcp_state_name(unsigned state) {
  switch (state) {
    case 0x01: return "ESTABLISHED";
    case 0x02: return "SYN_SENT";
    case 0x03: return "SYN_RECV";
    case 0x04: return "FIN_WAIT1";
    case 0x05: return "FIN_WAIT2";
    case 0x06: return "TIME_WAIT";
    case 0x07: return "CLOSE";
    case 0x08: return "CLOSE_WAIT";
    case 0x09: return "LAST_ACK";
    case 0x0A: return "LISTEN";
    case 0x0B: return "CLOSING";
    case 0x0C: return "SYN_RECV"; // NEW_SYN_RECV
    default:   return "NONE";
  }
}

// "0100007F:0CEA" -> {127.0.0.1, 3306}. Address words are printed in host
// byte order by the kernel, so reading them back natively restores the bytes.
static bool decode_endpoint(const std::string& field, int family, netdiag::model::Endpoint& out) {
  auto colon = field.find(':');
  if (colon == std::string::npos) return false;
  std::string hex = field.substr(0, colon);
  out.port = static_cast<uint16_t>(std::strtoul(field.c_str() + colon + 1, nullptr, 16));
  char buf[INET6_ADDRSTRLEN] = {0};
  if (family == AF_INET) {
    if (hex.size() != 8) return false;
    in_addr a{};
    a.s_addr = static_cast<uint32_t>(std::strtoul(hex.c_str(), nullptr, 16));
    if (!::inet_ntop(AF_INET, &a, buf, sizeof(buf))) return false;
  } else {
    if (hex.size() != 32) return false;
    in6_addr a{};
    for (int i = 0; i < 4; ++i) {
      uint32_t word = static_cast<uint32_t>(std::strtoul(hex.substr(static_cast<size_t>(i) * 8, 8).c_str(), nullptr, 16));
      std::memcpy(a.s6_addr + i * 4, &word, sizeof(word));
    }
    if (!::inet_ntop(AF_INET6, &a, buf, sizeof(buf))) return false;
  }
  out.ip = buf;
  return true;
}

void SocketCollector::parse_table(const std::string& txt, int family, int type,
                                  std::vector<netdiag::model::SocketEntry>& out) {
  std::istringstream ss(txt);
  std::string line;
  std::getline(ss, line); // header
  while (std::getline(ss, line)) {
    std::istringstream ls(line);
    std::string sl, local, remote, st, queues, timer, retrans, uid, timeout, inode;
    if (!(ls >> sl >> local >> remote >> st >> queues >> timer >> retrans >> uid >> timeout >> inode)) continue;
    netdiag::model::SocketEntry e;
    e.family = family; e.type = type;
    if (!decode_endpoint(local, family, e.local)) continue;
    netdiag::model::Endpoint rem;
    if (decode_endpoint(remote, family, rem) && rem.port != 0) e.remote = rem;
    e.status = (type == SOCK_STREAM) ? tcp_state_name(static_cast<unsigned>(std::strtoul(st.c_str(), nullptr, 16))) : "NONE";
    e.inode = std::strtoull(inode.c_str(), nullptr, 10);
    out.push_back(std::move(e));
  }
}

std::unordered_map<uint64_t, SocketCollector::Owner> SocketCollector::map_inodes() {
  std::unordered_map<uint64_t, Owner> owners;
  for (const auto& pid_name : netdiag::util::list_dir("/proc")) {
    if (!netdiag::util::is_all_digits(pid_name)) continue;
    auto fd_dir = "/proc/" + pid_name + "/fd";
    // Unreadable fd directories (other users' processes) are skipped
    for (const auto& fd_name : netdiag::util::list_dir(fd_dir)) {
      auto link = netdiag::util::read_symlink(fd_dir + "/" + fd_name);
      if (!link || link->rfind("socket:[", 0) != 0) continue;
      uint64_t inode = std::strtoull(link->c_str() + 8, nullptr, 10);
      owners.emplace(inode, Owner{static_cast<int32_t>(std::strtol(pid_name.c_str(), nullptr, 10)),
                                  static_cast<int>(std::strtol(fd_name.c_str(), nullptr, 10))});
    }
  }
  return owners;
}

std::vector<netdiag::model::SocketEntry> SocketCollector::enumerate() {
  struct Table { const char* path; int family; int type; bool required; };
  static constexpr Table tables[] = {
    {"/proc/net/tcp",  AF_INET,  SOCK_STREAM, true},
    {"/proc/net/tcp6", AF_INET6, SOCK_STREAM, false},
    {"/proc/net/udp",  AF_INET,  SOCK_DGRAM,  false},
    {"/proc/net/udp6", AF_INET6, SOCK_DGRAM,  false},
  };
  std::vector<netdiag::model::SocketEntry> out;
  for (const auto& t : tables) {
    auto txt = netdiag::util::read_file_string(t.path);
    if (!txt) {
      if (t.required) throw std::runtime_error(std::string("cannot read ") + t.path);
      continue;
    }
    parse_table(*txt, t.family, t.type, out);
  }
  if (out.empty()) return out;
  auto owners = map_inodes();
  for (auto& e : out) {
    if (e.inode == 0) continue;
    auto it = owners.find(e.inode);
    if (it == owners.end()) continue;
    e.pid = it->second.pid;
    e.fd = it->second.fd;
  }
  return out;
}

} // namespace netdiag::collectors
