#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace netdiag::util {

// Why an operation produced no value.
enum class Fault {
  None,           // success
  Throttled,      // skipped by a rate limiter, nothing attempted
  Timeout,        // attempted, deadline expired
  Unreachable,    // attempted, connection refused/failed
  Unresolved,     // attempted, name resolution failed
  Handshake,      // attempted, TLS negotiation failed
  BadCertificate  // attempted, peer certificate could not be parsed
};

[[nodiscard]] constexpr const char* fault_name(Fault f) {
  switch (f) {
    case Fault::None:           return "none";
    case Fault::Throttled:      return "throttled";
    case Fault::Timeout:        return "timeout";
    case Fault::Unreachable:    return "unreachable";
    case Fault::Unresolved:     return "unresolved";
    case Fault::Handshake:      return "handshake";
    case Fault::BadCertificate: return "bad-certificate";
  }
  return "unknown";
}

// Value or tagged absence returned across the monitor boundary.
template <typename T>
class Result {
public:
  static Result success(T v) { Result r; r.value_ = std::move(v); return r; }
  static Result failure(Fault f, std::string reason) {
    Result r; r.fault_ = f; r.reason_ = std::move(reason); return r;
  }

  [[nodiscard]] bool ok() const noexcept { return value_.has_value(); }
  explicit operator bool() const noexcept { return ok(); }

  [[nodiscard]] const T& value() const {
    if (!value_) throw std::logic_error(std::string("Result has no value: ") + fault_name(fault_));
    return *value_;
  }
  const T& operator*() const { return value(); }
  const T* operator->() const { return &value(); }

  [[nodiscard]] Fault fault() const noexcept { return fault_; }
  [[nodiscard]] const std::string& reason() const noexcept { return reason_; }
  // Distinguishes "nothing was attempted" from "attempted, no data".
  [[nodiscard]] bool attempted() const noexcept { return fault_ != Fault::Throttled; }

private:
  Result() = default;
  std::optional<T> value_{};
  Fault fault_{Fault::None};
  std::string reason_{};
};

} // namespace netdiag::util
