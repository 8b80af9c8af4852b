#include "minitest.hpp"
#include "fakes.hpp"
#include "monitors/LatencyMonitor.hpp"

using namespace std::chrono_literals;
using Outcome = testing::ScriptedConnector::Outcome;
using netdiag::util::Fault;

TEST(latency_measure_returns_elapsed_seconds) {
  testing::ManualClock mc;
  testing::RecordingLogger log;
  testing::ScriptedConnector tcp(mc);
  tcp.push_latency(0.042);
  netdiag::monitors::LatencyMonitor m(tcp, log, {}, mc.clock());
  auto r = m.measure("example.com", 8080, 750ms);
  ASSERT_TRUE(r.ok());
  ASSERT_NEAR(r.value(), 0.042, 1e-6);
  ASSERT_EQ(tcp.last_host, "example.com");
  ASSERT_EQ(tcp.last_port, 8080);
  ASSERT_TRUE(tcp.last_timeout == 750ms);
  // measure() alone never touches the history
  ASSERT_TRUE(m.history("example.com").empty());
}

TEST(latency_measure_failure_is_tagged_absence) {
  testing::ManualClock mc;
  testing::RecordingLogger log;
  testing::ScriptedConnector tcp(mc);
  tcp.push(Outcome::Timeout, 1s);
  tcp.push(Outcome::Refused);
  netdiag::monitors::LatencyMonitor m(tcp, log, {}, mc.clock());

  auto t = m.measure("slow.example", 80);
  ASSERT_TRUE(!t.ok());
  ASSERT_TRUE(t.fault() == Fault::Timeout);
  ASSERT_TRUE(t.attempted());

  auto u = m.measure("closed.example", 81);
  ASSERT_TRUE(!u);
  ASSERT_TRUE(u.fault() == Fault::Unreachable);
  ASSERT_EQ(log.count(netdiag::util::LogLevel::Warning), 2u);
  ASSERT_THROWS(u.value(), std::logic_error);
}

TEST(latency_history_keeps_newest_hundred_in_order) {
  testing::ManualClock mc;
  testing::RecordingLogger log;
  testing::ScriptedConnector tcp(mc);
  netdiag::monitors::LatencyMonitor m(tcp, log, {}, mc.clock());
  for (int i = 0; i < 150; ++i) m.record("h", static_cast<double>(i));
  auto h = m.history("h");
  ASSERT_EQ(h.size(), 100u);
  for (size_t i = 0; i < h.size(); ++i) ASSERT_EQ(h[i], static_cast<double>(i + 50));
}

TEST(latency_stats_over_history) {
  testing::ManualClock mc;
  testing::RecordingLogger log;
  testing::ScriptedConnector tcp(mc);
  netdiag::monitors::LatencyMonitor m(tcp, log, {}, mc.clock());
  ASSERT_TRUE(!m.stats("h").has_value());
  m.record("h", 0.1);
  m.record("h", 0.2);
  m.record("h", 0.3);
  auto s = m.stats("h");
  ASSERT_TRUE(s.has_value());
  ASSERT_NEAR(s->min, 0.1, 1e-12);
  ASSERT_NEAR(s->max, 0.3, 1e-12);
  ASSERT_NEAR(s->avg, 0.2, 1e-12);
  ASSERT_TRUE(!m.stats("other").has_value());
}

TEST(latency_track_is_throttled_by_interval) {
  testing::ManualClock mc;
  testing::RecordingLogger log;
  testing::ScriptedConnector tcp(mc);
  tcp.push_latency(0.010);
  tcp.push_latency(0.020);
  netdiag::monitors::LatencyMonitor m(tcp, log, {}, mc.clock());

  auto first = m.track("h");
  ASSERT_TRUE(first.ok());
  ASSERT_EQ(m.history("h").size(), 1u);

  mc.advance(2s);
  auto second = m.track("h");
  ASSERT_TRUE(second.fault() == Fault::Throttled);
  ASSERT_TRUE(!second.attempted());
  ASSERT_EQ(m.history("h").size(), 1u);
  ASSERT_EQ(tcp.calls, 1);

  mc.advance(3s);
  ASSERT_TRUE(m.track("h").ok());
  ASSERT_EQ(m.history("h").size(), 2u);
  ASSERT_EQ(tcp.calls, 2);
}

TEST(latency_track_throttle_is_shared_across_hosts) {
  testing::ManualClock mc;
  testing::RecordingLogger log;
  testing::ScriptedConnector tcp(mc);
  netdiag::monitors::LatencyMonitor m(tcp, log, {}, mc.clock());
  ASSERT_TRUE(m.track("a").ok());
  auto b = m.track("b");
  ASSERT_TRUE(b.fault() == Fault::Throttled);
  ASSERT_TRUE(m.history("b").empty());
  mc.advance(5s);
  ASSERT_TRUE(m.track("b").ok());
  ASSERT_EQ(m.history("b").size(), 1u);
}

TEST(latency_track_failure_records_nothing_but_consumes_interval) {
  testing::ManualClock mc;
  testing::RecordingLogger log;
  testing::ScriptedConnector tcp(mc);
  tcp.push(Outcome::Refused);
  netdiag::monitors::LatencyOptions opts;
  opts.timeout = 300ms;
  netdiag::monitors::LatencyMonitor m(tcp, log, opts, mc.clock());
  auto r = m.track("down", 443);
  ASSERT_TRUE(r.fault() == Fault::Unreachable);
  ASSERT_TRUE(tcp.last_timeout == 300ms);
  ASSERT_TRUE(m.history("down").empty());
  ASSERT_TRUE(m.track("down", 443).fault() == Fault::Throttled);
}

TEST(latency_custom_history_cap) {
  testing::ManualClock mc;
  testing::RecordingLogger log;
  testing::ScriptedConnector tcp(mc);
  netdiag::monitors::LatencyOptions opts;
  opts.history = 3;
  netdiag::monitors::LatencyMonitor m(tcp, log, opts, mc.clock());
  for (double v : {1.0, 2.0, 3.0, 4.0}) m.record("h", v);
  auto h = m.history("h");
  ASSERT_EQ(h.size(), 3u);
  ASSERT_EQ(h.front(), 2.0);
  ASSERT_EQ(h.back(), 4.0);
}
