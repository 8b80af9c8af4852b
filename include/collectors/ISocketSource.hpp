#pragma once
#include "model/Net.hpp"
#include <vector>

namespace netdiag::collectors {

// Source of the host's socket table so the connection monitor can be fed
// from procfs or from a test fixture.
class ISocketSource {
public:
  virtual ~ISocketSource() = default;

  // Full enumeration. Throws std::runtime_error when the table is unavailable.
  [[nodiscard]] virtual std::vector<netdiag::model::SocketEntry> enumerate() = 0;

  [[nodiscard]] virtual const char* name() const = 0;
};

} // namespace netdiag::collectors
