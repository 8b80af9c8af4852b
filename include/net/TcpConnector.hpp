#pragma once
#include "net/Socket.hpp"
#include <chrono>
#include <string>

namespace netdiag::net {

// Opens TCP connections. Implementations throw TimeoutError when the
// deadline passes and ConnectError for every other failure (including
// names that do not resolve).
class ITcpConnector {
public:
  virtual ~ITcpConnector() = default;
  [[nodiscard]] virtual Socket connect(const std::string& host, int port,
                                       std::chrono::milliseconds timeout) = 0;
};

// Non-blocking connect + poll against each resolved address in turn,
// sharing one overall deadline.
class TcpConnector final : public ITcpConnector {
public:
  Socket connect(const std::string& host, int port, std::chrono::milliseconds timeout) override;
};

} // namespace netdiag::net
