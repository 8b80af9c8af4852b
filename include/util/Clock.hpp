#pragma once
#include <chrono>
#include <functional>

namespace netdiag::util {

// Time sources used by the monitors. Monotonic time drives TTLs and rate
// limits; wall time only drives certificate expiry arithmetic.
struct Clock {
  std::function<std::chrono::steady_clock::time_point()> now =
      []{ return std::chrono::steady_clock::now(); };
  std::function<std::chrono::system_clock::time_point()> wall =
      []{ return std::chrono::system_clock::now(); };
};

[[nodiscard]] inline double seconds_between(std::chrono::steady_clock::time_point a,
                                            std::chrono::steady_clock::time_point b) {
  return std::chrono::duration<double>(b - a).count();
}

} // namespace netdiag::util
