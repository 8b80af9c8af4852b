#include "net/TcpConnector.hpp"
#include "net/Errors.hpp"

#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>

#include <cerrno>
#include <cstring>
#include <memory>

namespace netdiag::net {

using clock = std::chrono::steady_clock;

namespace {
struct AddrInfoDeleter { void operator()(addrinfo* p) const { if (p) ::freeaddrinfo(p); } };
using AddrInfoPtr = std::unique_ptr<addrinfo, AddrInfoDeleter>;
}

static AddrInfoPtr lookup(const std::string& host, int port) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags = AI_ADDRCONFIG;
  addrinfo* res = nullptr;
  auto port_str = std::to_string(port);
  int rc = ::getaddrinfo(host.c_str(), port_str.c_str(), &hints, &res);
  if (rc != 0) throw ConnectError(host + ": " + ::gai_strerror(rc));
  return AddrInfoPtr(res);
}

// Waits for a non-blocking connect to finish. Returns 0 when connected,
// an errno value on failure, or -1 when the deadline passed.
static int await_connect(int fd, clock::time_point deadline) {
  for (;;) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now());
    if (left.count() <= 0) return -1;
    pollfd pfd{.fd = fd, .events = POLLOUT, .revents = 0};
    int rv = ::poll(&pfd, 1, static_cast<int>(left.count()));
    if (rv == 0) return -1;
    if (rv < 0) { if (errno == EINTR) continue; return errno; }
    int err = 0; socklen_t len = sizeof(err);
    if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) < 0) return errno;
    return err;
  }
}

Socket TcpConnector::connect(const std::string& host, int port, std::chrono::milliseconds timeout) {
  const auto deadline = clock::now() + timeout;
  auto addrs = lookup(host, port);
  std::string last_error = "no usable address";
  bool timed_out = false;
  for (addrinfo* ai = addrs.get(); ai; ai = ai->ai_next) {
    if (clock::now() >= deadline) { timed_out = true; break; }
    Socket sock(::socket(ai->ai_family, ai->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC, ai->ai_protocol));
    if (!sock.valid()) { last_error = std::strerror(errno); continue; }
    if (::connect(sock.fd(), ai->ai_addr, ai->ai_addrlen) == 0) return sock;
    if (errno != EINPROGRESS) { last_error = std::strerror(errno); continue; }
    int rc = await_connect(sock.fd(), deadline);
    if (rc == 0) return sock;
    if (rc < 0) { timed_out = true; break; }
    last_error = std::strerror(rc);
  }
  if (timed_out)
    throw TimeoutError(host + ":" + std::to_string(port) + ": timed out");
  throw ConnectError(host + ":" + std::to_string(port) + ": " + last_error);
}

} // namespace netdiag::net
