#include "net/CertFetcher.hpp"
#include "net/Errors.hpp"

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>

#include <cerrno>
#include <cstring>

namespace netdiag::net {

using clock = std::chrono::steady_clock;

namespace {
struct SslFree { void operator()(SSL* p) const { SSL_free(p); } };
struct X509Free { void operator()(X509* p) const { X509_free(p); } };
}

void TlsCertFetcher::CtxFree::operator()(ssl_ctx_st* p) const { SSL_CTX_free(p); }

static std::string openssl_error(const char* what) {
  unsigned long code = ERR_get_error();
  ERR_clear_error();
  if (code == 0) return what;
  char buf[256];
  ERR_error_string_n(code, buf, sizeof(buf));
  return std::string(what) + ": " + buf;
}

TlsCertFetcher::TlsCertFetcher(ITcpConnector& tcp, bool verify) : tcp_(tcp), verify_(verify) {}

TlsCertFetcher::~TlsCertFetcher() = default;

// Built on first use so a broken OpenSSL setup surfaces as a per-check failure.
ssl_ctx_st* TlsCertFetcher::context() {
  if (ctx_) return ctx_.get();
  SSL_CTX* ctx = SSL_CTX_new(TLS_client_method());
  if (!ctx) throw TlsError(openssl_error("SSL_CTX_new failed"));
  ctx_.reset(ctx);
  SSL_CTX_set_min_proto_version(ctx, TLS1_2_VERSION);
  if (verify_) {
    if (SSL_CTX_set_default_verify_paths(ctx) != 1) throw TlsError(openssl_error("cannot load trust store"));
    SSL_CTX_set_verify(ctx, SSL_VERIFY_PEER, nullptr);
  } else {
    SSL_CTX_set_verify(ctx, SSL_VERIFY_NONE, nullptr);
  }
  return ctx;
}

// SNI carries host names only.
static bool is_ip_literal(const std::string& host) {
  unsigned char buf[sizeof(in6_addr)];
  return ::inet_pton(AF_INET, host.c_str(), buf) == 1 || ::inet_pton(AF_INET6, host.c_str(), buf) == 1;
}

static void make_nonblocking(int fd) {
  int flags = ::fcntl(fd, F_GETFL, 0);
  if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0)
    throw TlsError(std::string("cannot make socket non-blocking: ") + std::strerror(errno));
}

// Waits until fd is ready for events. Returns false once the deadline passes.
static bool await_ready(int fd, short events, clock::time_point deadline) {
  for (;;) {
    auto left = deadline - clock::now();
    if (left <= clock::duration::zero()) return false;
    auto ms = std::chrono::ceil<std::chrono::milliseconds>(left);
    pollfd pfd{.fd = fd, .events = events, .revents = 0};
    int rv = ::poll(&pfd, 1, static_cast<int>(ms.count()));
    if (rv > 0) return true;
    if (rv < 0 && errno != EINTR) throw TlsError(std::string("poll failed: ") + std::strerror(errno));
  }
}

std::vector<unsigned char> TlsCertFetcher::fetch(const std::string& host, int port,
                                                 std::chrono::milliseconds timeout) {
  const auto deadline = clock::now() + timeout;
  const std::string where = host + ":" + std::to_string(port);
  SSL_CTX* ctx = context();
  Socket sock = tcp_.connect(host, port, timeout);
  make_nonblocking(sock.fd());

  std::unique_ptr<SSL, SslFree> ssl(SSL_new(ctx));
  if (!ssl) throw TlsError(openssl_error("SSL_new failed"));
  if (SSL_set_fd(ssl.get(), sock.fd()) != 1) throw TlsError(openssl_error("SSL_set_fd failed"));
  if (!is_ip_literal(host) && SSL_set_tlsext_host_name(ssl.get(), host.c_str()) != 1)
    throw TlsError(openssl_error("cannot set server name"));
  if (verify_ && SSL_set1_host(ssl.get(), host.c_str()) != 1)
    throw TlsError(openssl_error("cannot set expected host name"));

  // The connect and the whole handshake share one deadline
  for (;;) {
    ERR_clear_error();
    errno = 0;
    int rc = SSL_connect(ssl.get());
    if (rc == 1) break;
    int err = SSL_get_error(ssl.get(), rc);
    short events = 0;
    if (err == SSL_ERROR_WANT_READ) events = POLLIN;
    else if (err == SSL_ERROR_WANT_WRITE) events = POLLOUT;
    if (events != 0) {
      if (!await_ready(sock.fd(), events, deadline)) {
        ERR_clear_error();
        throw TimeoutError(where + ": TLS handshake timed out");
      }
      continue;
    }
    long vr = SSL_get_verify_result(ssl.get());
    if (verify_ && vr != X509_V_OK) {
      ERR_clear_error();
      throw TlsError(where + ": certificate verify failed: " + X509_verify_cert_error_string(vr));
    }
    if (err == SSL_ERROR_SYSCALL && errno != 0) {
      ERR_clear_error();
      throw TlsError(where + ": TLS handshake failed: " + std::strerror(errno));
    }
    throw TlsError(openssl_error((where + ": TLS handshake failed").c_str()));
  }

  std::unique_ptr<X509, X509Free> peer(SSL_get1_peer_certificate(ssl.get()));
  if (!peer) {
    SSL_shutdown(ssl.get());
    ERR_clear_error();
    throw TlsError(where + ": server presented no certificate");
  }
  int len = i2d_X509(peer.get(), nullptr);
  if (len <= 0) throw TlsError(openssl_error("cannot encode peer certificate"));
  std::vector<unsigned char> der(static_cast<size_t>(len));
  unsigned char* p = der.data();
  i2d_X509(peer.get(), &p);
  // Best-effort close_notify; the socket is non-blocking so this never waits
  SSL_shutdown(ssl.get());
  ERR_clear_error();
  return der;
}

} // namespace netdiag::net
