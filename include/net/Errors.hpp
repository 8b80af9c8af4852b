#pragma once
#include <stdexcept>
#include <string>

namespace netdiag::net {

// Base of every transport failure the monitors know how to absorb.
struct NetError : public std::runtime_error { using std::runtime_error::runtime_error; };

struct TimeoutError : public NetError { using NetError::NetError; };
struct ConnectError : public NetError { using NetError::NetError; };
struct ResolveError : public NetError { using NetError::NetError; };
struct TlsError : public NetError { using NetError::NetError; };
struct CertParseError : public NetError { using NetError::NetError; };

} // namespace netdiag::net
