#pragma once
#include "collectors/ISocketSource.hpp"
#include "net/CertFetcher.hpp"
#include "net/Errors.hpp"
#include "net/Resolver.hpp"
#include "net/TcpConnector.hpp"
#include "util/Clock.hpp"
#include "util/Logger.hpp"

#include <chrono>
#include <deque>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <sys/socket.h>
#include <unistd.h>

namespace testing {

// Time only moves when a test says so.
struct ManualClock {
  std::chrono::steady_clock::time_point t{std::chrono::steady_clock::time_point{} + std::chrono::hours(1)};
  std::chrono::system_clock::time_point w{std::chrono::system_clock::now()};

  void advance(std::chrono::steady_clock::duration d) { t += d; w += std::chrono::duration_cast<std::chrono::system_clock::duration>(d); }

  netdiag::util::Clock clock() {
    netdiag::util::Clock c;
    c.now = [this] { return t; };
    c.wall = [this] { return w; };
    return c;
  }
};

struct RecordingLogger : public netdiag::util::Logger {
  std::vector<std::pair<netdiag::util::LogLevel, std::string>> lines;
  std::vector<Where> wheres;
  void log(netdiag::util::LogLevel level, std::string_view msg, const Where& where) override {
    lines.emplace_back(level, std::string(msg));
    wheres.push_back(where);
  }
  size_t count(netdiag::util::LogLevel level) const {
    size_t n = 0;
    for (const auto& l : lines) if (l.first == level) ++n;
    return n;
  }
  bool contains(std::string_view needle) const {
    for (const auto& l : lines) if (l.second.find(needle) != std::string::npos) return true;
    return false;
  }
};

// Each scripted step either advances the clock by its delay and succeeds,
// or throws. When the script runs out every connect succeeds instantly.
class ScriptedConnector : public netdiag::net::ITcpConnector {
public:
  enum class Outcome { Connect, Timeout, Refused };
  struct Step { Outcome outcome; std::chrono::microseconds delay; };

  explicit ScriptedConnector(ManualClock& clock) : clock_(clock) {}

  void push(Outcome o, std::chrono::microseconds delay = {}) { steps_.push_back({o, delay}); }
  void push_latency(double seconds) {
    push(Outcome::Connect, std::chrono::microseconds(static_cast<long long>(seconds * 1e6 + 0.5)));
  }

  netdiag::net::Socket connect(const std::string& host, int port, std::chrono::milliseconds timeout) override {
    ++calls;
    last_host = host; last_port = port; last_timeout = timeout;
    if (steps_.empty()) return netdiag::net::Socket{};
    auto s = steps_.front(); steps_.pop_front();
    clock_.advance(s.delay);
    switch (s.outcome) {
      case Outcome::Timeout: throw netdiag::net::TimeoutError(host + ":" + std::to_string(port) + ": timed out");
      case Outcome::Refused: throw netdiag::net::ConnectError(host + ":" + std::to_string(port) + ": Connection refused");
      case Outcome::Connect: break;
    }
    return netdiag::net::Socket{};
  }

  int calls{0};
  std::string last_host;
  int last_port{0};
  std::chrono::milliseconds last_timeout{0};

private:
  ManualClock& clock_;
  std::deque<Step> steps_;
};

// Fails the test loudly when asked to resolve a name more than 'limit' times.
class CountingResolver : public netdiag::net::IResolver {
public:
  std::map<std::string, std::vector<std::string>> answers;
  std::map<std::string, int> calls;
  int limit{1};

  std::vector<std::string> resolve(const std::string& hostname) override {
    if (++calls[hostname] > limit) throw std::logic_error("resolver invoked again for " + hostname);
    auto it = answers.find(hostname);
    if (it == answers.end()) throw netdiag::net::ResolveError(hostname + ": Name or service not known");
    return it->second;
  }
};

class CountingCertFetcher : public netdiag::net::ICertFetcher {
public:
  std::map<std::string, std::vector<unsigned char>> certs;  // key "host:port"
  std::function<void(const std::string&)> fail;              // throws for the key when set
  std::map<std::string, int> calls;
  int limit{1};

  std::vector<unsigned char> fetch(const std::string& host, int port, std::chrono::milliseconds) override {
    auto key = host + ":" + std::to_string(port);
    if (++calls[key] > limit) throw std::logic_error("certificate fetched again for " + key);
    if (fail) fail(key);
    auto it = certs.find(key);
    if (it == certs.end()) throw netdiag::net::ConnectError(key + ": Connection refused");
    return it->second;
  }
};

class StaticSocketSource : public netdiag::collectors::ISocketSource {
public:
  std::vector<netdiag::model::SocketEntry> entries;
  int calls{0};
  bool broken{false};

  std::vector<netdiag::model::SocketEntry> enumerate() override {
    ++calls;
    if (broken) throw std::runtime_error("cannot read /proc/net/tcp");
    return entries;
  }
  const char* name() const override { return "static"; }
};

inline netdiag::model::SocketEntry tcp_entry(const std::string& status, uint16_t lport,
                                             std::optional<netdiag::model::Endpoint> remote = std::nullopt,
                                             std::optional<int32_t> pid = std::nullopt) {
  netdiag::model::SocketEntry e;
  e.family = AF_INET; e.type = SOCK_STREAM;
  e.local = {"127.0.0.1", lport};
  e.remote = std::move(remote);
  e.status = status;
  e.pid = pid;
  return e;
}

// Fresh fixture root under /tmp, unique per test and process.
inline std::filesystem::path make_temp_root(const std::string& tag) {
  auto root = std::filesystem::temp_directory_path() / ("netdiag_test_" + tag + "_" + std::to_string(::getpid()));
  std::error_code ec;
  std::filesystem::remove_all(root, ec);
  std::filesystem::create_directories(root, ec);
  return root;
}

} // namespace testing
