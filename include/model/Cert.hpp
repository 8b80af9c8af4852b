#pragma once
#include <chrono>
#include <string>

namespace netdiag::model {

inline constexpr const char* kUnknownAttr = "Unknown";

struct NameInfo {
  std::string common_name{kUnknownAttr};
  std::string organization{kUnknownAttr};
};

struct CertificateInfo {
  NameInfo subject{};
  NameInfo issuer{};
  std::chrono::system_clock::time_point not_before{};
  std::chrono::system_clock::time_point not_after{};
  long days_until_expiry{};   // relative to the moment of the read
  std::string serial_number;  // decimal
  std::string version;        // "v1" | "v2" | "v3"
};

} // namespace netdiag::model
