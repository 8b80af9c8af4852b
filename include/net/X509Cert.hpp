#pragma once
#include "model/Cert.hpp"
#include <chrono>
#include <string>
#include <vector>

namespace netdiag::net {

// Immutable, parsed view of a DER certificate. Only the expiry distance
// depends on the moment of the read; everything else is fixed at parse time.
class X509Cert {
public:
  // Throws CertParseError when der is not a well-formed X.509 certificate.
  static X509Cert from_der(const std::vector<unsigned char>& der);

  [[nodiscard]] netdiag::model::CertificateInfo describe(std::chrono::system_clock::time_point now) const;

  [[nodiscard]] std::chrono::system_clock::time_point not_after() const { return fields_.not_after; }

private:
  explicit X509Cert(netdiag::model::CertificateInfo fields) : fields_(std::move(fields)) {}
  netdiag::model::CertificateInfo fields_;
};

// Whole days from now until not_after, rounded toward negative infinity.
[[nodiscard]] long days_until(std::chrono::system_clock::time_point not_after,
                              std::chrono::system_clock::time_point now);

// "2025-01-31T12:00:00+00:00"
[[nodiscard]] std::string format_utc_iso(std::chrono::system_clock::time_point tp);

} // namespace netdiag::net
