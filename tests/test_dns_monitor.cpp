#include "minitest.hpp"
#include "fakes.hpp"
#include "monitors/DnsMonitor.hpp"

using namespace std::chrono_literals;
using netdiag::util::Fault;

TEST(dns_resolve_within_ttl_resolves_once) {
  testing::ManualClock mc;
  testing::RecordingLogger log;
  testing::CountingResolver r;
  r.answers["example.com"] = {"93.184.216.34"};
  netdiag::monitors::DnsMonitor m(r, log, 300s, mc.clock());

  auto a = m.resolve("example.com");
  mc.advance(299s);
  auto b = m.resolve("example.com");  // the fake throws if asked twice
  ASSERT_TRUE(a.ok() && b.ok());
  ASSERT_TRUE(a.value() == b.value());
  ASSERT_EQ(r.calls["example.com"], 1);
  auto st = m.cache_stats();
  ASSERT_EQ(st.size, 1u);
  ASSERT_EQ(st.entries, 1u);
}

TEST(dns_failure_is_not_cached) {
  testing::ManualClock mc;
  testing::RecordingLogger log;
  testing::CountingResolver r;
  r.limit = 5;
  r.answers["good.example"] = {"10.0.0.1", "10.0.0.2"};
  netdiag::monitors::DnsMonitor m(r, log, 300s, mc.clock());
  ASSERT_TRUE(m.resolve("good.example").ok());
  auto before = m.cache_stats().size;

  auto bad = m.resolve("nxdomain.invalid");
  ASSERT_TRUE(!bad.ok());
  ASSERT_TRUE(bad.fault() == Fault::Unresolved);
  ASSERT_EQ(m.cache_stats().size, before);
  ASSERT_EQ(log.count(netdiag::util::LogLevel::Error), 1u);

  // A later attempt goes back to the resolver
  ASSERT_TRUE(!m.resolve("nxdomain.invalid").ok());
  ASSERT_EQ(r.calls["nxdomain.invalid"], 2);
}

TEST(dns_stale_entry_is_refetched) {
  testing::ManualClock mc;
  testing::RecordingLogger log;
  testing::CountingResolver r;
  r.limit = 2;
  r.answers["example.com"] = {"192.0.2.1"};
  netdiag::monitors::DnsMonitor m(r, log, 300s, mc.clock());
  ASSERT_TRUE(m.resolve("example.com").ok());

  mc.advance(300s);
  auto st = m.cache_stats();
  ASSERT_EQ(st.size, 1u);     // stale entries still count toward size
  ASSERT_EQ(st.entries, 0u);

  r.answers["example.com"] = {"192.0.2.99"};
  auto again = m.resolve("example.com");
  ASSERT_EQ(r.calls["example.com"], 2);
  ASSERT_EQ(again.value().front(), "192.0.2.99");
  ASSERT_EQ(m.cache_stats().entries, 1u);
}

TEST(dns_unexpected_errors_propagate) {
  testing::ManualClock mc;
  testing::RecordingLogger log;
  testing::CountingResolver r;
  r.limit = 0;  // any call raises logic_error, which is not a resolution failure
  netdiag::monitors::DnsMonitor m(r, log, 300s, mc.clock());
  ASSERT_THROWS(m.resolve("example.com"), std::logic_error);
}

TEST(dns_cache_stats_counts_fresh_entries) {
  testing::ManualClock mc;
  testing::RecordingLogger log;
  testing::CountingResolver r;
  r.answers["a.example"] = {"192.0.2.1"};
  r.answers["b.example"] = {"192.0.2.2"};
  netdiag::monitors::DnsMonitor m(r, log, 300s, mc.clock());
  ASSERT_TRUE(m.resolve("a.example").ok());
  mc.advance(200s);
  ASSERT_TRUE(m.resolve("b.example").ok());
  mc.advance(150s);
  auto st = m.cache_stats();
  ASSERT_EQ(st.size, 2u);
  ASSERT_EQ(st.entries, 1u);
}
