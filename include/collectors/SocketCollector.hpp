#pragma once
#include "collectors/ISocketSource.hpp"
#include <string>
#include <unordered_map>

namespace netdiag::collectors {

// Socket table from /proc/net/{tcp,tcp6,udp,udp6}, joined with the
// /proc/<pid>/fd links to attribute each socket to its owning process.
class SocketCollector : public ISocketSource {
public:
  std::vector<netdiag::model::SocketEntry> enumerate() override;
  const char* name() const override { return "procfs socket table"; }

  struct Owner { int32_t pid; int fd; };

  // Exposed for tests: parse one /proc/net table body.
  static void parse_table(const std::string& txt, int family, int type,
                          std::vector<netdiag::model::SocketEntry>& out);
  static const char* tcp_state_name(unsigned state);

private:
  static std::unordered_map<uint64_t, Owner> map_inodes();
};

} // namespace netdiag::collectors
