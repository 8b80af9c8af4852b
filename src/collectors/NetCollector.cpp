#include "collectors/NetCollector.hpp"
#include "util/Procfs.hpp"

#include <array>
#include <sstream>

namespace netdiag::collectors {

bool NetCollector::sample(netdiag::model::InterfaceTable& out) const {
  auto txt_opt = netdiag::util::read_file_string("/proc/net/dev");
  if (!txt_opt) return false;
  out.clear();
  std::istringstream ss(*txt_opt);
  std::string line; int line_no = 0;
  while (std::getline(ss, line)) {
    ++line_no; if (line_no <= 2) continue; // headers
    // format: iface: 8 rx counters then 8 tx counters
    auto colon = line.find(':'); if (colon == std::string::npos) continue;
    std::string name = line.substr(0, colon);
    while (!name.empty() && name.front() == ' ') name.erase(name.begin());
    if (name.empty()) continue;
    std::istringstream ns(line.substr(colon + 1));
    std::array<uint64_t, 16> f{}; size_t n = 0;
    while (n < f.size() && (ns >> f[n])) ++n;
    netdiag::model::InterfaceStats st{};
    // A truncated line (driver without full counter support) reports zeros
    // for this interface only.
    if (n == f.size()) {
      st.bytes_recv = f[0]; st.packets_recv = f[1]; st.errors_in = f[2];  st.drops_in = f[3];
      st.bytes_sent = f[8]; st.packets_sent = f[9]; st.errors_out = f[10]; st.drops_out = f[11];
    }
    out[name] = st;
  }
  return true;
}

} // namespace netdiag::collectors
