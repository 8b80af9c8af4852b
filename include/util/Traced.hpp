#pragma once
#include "util/Logger.hpp"

#include <chrono>
#include <cstdio>
#include <exception>
#include <functional>
#include <mutex>
#include <set>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include <fmt/format.h>

namespace netdiag::util {

// Runs fn(args...) and records the call at debug level. A failure escaping
// fn is logged at error level and rethrown unchanged.
template <typename Fn, typename... Args>
decltype(auto) log_call(Logger& log, std::string_view name, Fn&& fn, Args&&... args) {
  log.debug(fmt::format("Calling function: {}", name));
  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn, Args...>>) {
      std::forward<Fn>(fn)(std::forward<Args>(args)...);
      log.debug(fmt::format("Function {} returned", name));
    } else {
      decltype(auto) out = std::forward<Fn>(fn)(std::forward<Args>(args)...);
      log.debug(fmt::format("Function {} returned", name));
      return out;
    }
  } catch (const std::exception& e) {
    log.error(fmt::format("Function {} raised an exception: {}", name, e.what()));
    throw;
  }
}

// Runs fn(args...) and logs its wall time at info level.
template <typename Fn, typename... Args>
decltype(auto) log_timing(Logger& log, std::string_view name, Fn&& fn, Args&&... args) {
  using clock = std::chrono::steady_clock;
  auto report = [&](clock::time_point start) {
    double secs = std::chrono::duration<double>(clock::now() - start).count();
    log.info(fmt::format("Function {} took {:.2f} seconds", name, secs));
  };
  const auto start = clock::now();
  if constexpr (std::is_void_v<std::invoke_result_t<Fn, Args...>>) {
    std::forward<Fn>(fn)(std::forward<Args>(args)...);
    report(start);
  } else {
    decltype(auto) out = std::forward<Fn>(fn)(std::forward<Args>(args)...);
    report(start);
    return out;
  }
}

inline constexpr std::string_view kDeprecatedMessage = "This function is deprecated.";

// True the first time name is seen in this process.
inline bool first_deprecation_notice(std::string_view name) {
  static std::mutex mu;
  static std::set<std::string, std::less<>> seen;
  std::lock_guard<std::mutex> lk(mu);
  return seen.emplace(name).second;
}

// Runs fn(args...) after flagging name as deprecated: a one-time notice on
// stderr per name, and a warning log line on every call.
template <typename Fn, typename... Args>
decltype(auto) deprecated(Logger& log, std::string_view name, std::string_view message, Fn&& fn, Args&&... args) {
  if (first_deprecation_notice(name)) fmt::print(stderr, "warning: {}: {}\n", name, message);
  log.warning(fmt::format("DEPRECATED: {}: {}", name, message));
  return std::forward<Fn>(fn)(std::forward<Args>(args)...);
}

} // namespace netdiag::util
