#pragma once
#include "model/Net.hpp"

namespace netdiag::collectors {

// Interface counters from /proc/net/dev. Stateless: every call re-reads.
class NetCollector {
public:
  // Returns false only when /proc/net/dev cannot be read.
  bool sample(netdiag::model::InterfaceTable& out) const;
};

} // namespace netdiag::collectors
