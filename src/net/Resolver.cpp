#include "net/Resolver.hpp"
#include "net/Errors.hpp"

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <algorithm>

namespace netdiag::net {

std::vector<std::string> SystemResolver::resolve(const std::string& hostname) {
  addrinfo hints{};
  hints.ai_family = AF_INET;
  addrinfo* res = nullptr;
  int rc = ::getaddrinfo(hostname.c_str(), nullptr, &hints, &res);
  if (rc != 0) throw ResolveError(::gai_strerror(rc));
  std::vector<std::string> out;
  for (addrinfo* ai = res; ai; ai = ai->ai_next) {
    char buf[INET_ADDRSTRLEN] = {0};
    auto* sin = reinterpret_cast<sockaddr_in*>(ai->ai_addr);
    if (!::inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf))) continue;
    // getaddrinfo repeats each address once per socket type
    if (std::find(out.begin(), out.end(), buf) == out.end()) out.emplace_back(buf);
  }
  ::freeaddrinfo(res);
  if (out.empty()) throw ResolveError("no IPv4 addresses for " + hostname);
  return out;
}

} // namespace netdiag::net
