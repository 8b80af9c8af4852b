#pragma once
#include <string>
#include <vector>

namespace netdiag::net {

class IResolver {
public:
  virtual ~IResolver() = default;
  // IPv4 addresses for hostname in resolver order. Throws ResolveError.
  [[nodiscard]] virtual std::vector<std::string> resolve(const std::string& hostname) = 0;
};

// Blocking getaddrinfo(); duplicates across socket types are collapsed.
class SystemResolver final : public IResolver {
public:
  std::vector<std::string> resolve(const std::string& hostname) override;
};

} // namespace netdiag::net
