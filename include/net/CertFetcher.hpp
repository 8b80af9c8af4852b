#pragma once
#include "net/TcpConnector.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

struct ssl_ctx_st;

namespace netdiag::net {

// Retrieves the leaf certificate a TLS server presents, DER encoded.
// Throws TimeoutError, ConnectError or TlsError.
class ICertFetcher {
public:
  virtual ~ICertFetcher() = default;
  [[nodiscard]] virtual std::vector<unsigned char> fetch(const std::string& host, int port,
                                                         std::chrono::milliseconds timeout) = 0;
};

class TlsCertFetcher final : public ICertFetcher {
public:
  TlsCertFetcher(ITcpConnector& tcp, bool verify);
  ~TlsCertFetcher() override;
  TlsCertFetcher(const TlsCertFetcher&) = delete;
  TlsCertFetcher& operator=(const TlsCertFetcher&) = delete;

  std::vector<unsigned char> fetch(const std::string& host, int port,
                                   std::chrono::milliseconds timeout) override;

private:
  struct CtxFree { void operator()(ssl_ctx_st* p) const; };
  ssl_ctx_st* context();

  ITcpConnector& tcp_;
  bool verify_;
  std::unique_ptr<ssl_ctx_st, CtxFree> ctx_;
};

} // namespace netdiag::net
