#include "minitest.hpp"
#include "fakes.hpp"
#include "collectors/NetCollector.hpp"
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

static const char* kDevHeader =
  "Inter-|   Receive                                                |  Transmit\n"
  " face |bytes    packets errs drop fifo frame compressed multicast|bytes    packets errs drop fifo colls carrier compressed\n";

static fs::path make_root_net(const char* tag) {
  auto root = testing::make_temp_root(tag);
  fs::create_directories(root / "proc/net");
  setenv("NETDIAG_PROC_ROOT", root.c_str(), 1);
  return root;
}

TEST(net_collector_maps_rx_and_tx_counters) {
  auto root = make_root_net("net_counters");
  std::ofstream(root / "proc/net/dev") << kDevHeader <<
    "    lo: 5000 50 0 0 0 0 0 0  5000 50 0 0 0 0 0 0\n"
    "  eth0: 1000 10 1 2 0 0 0 0  2000 20 3 4 0 0 0 0\n";
  netdiag::collectors::NetCollector c;
  netdiag::model::InterfaceTable t;
  ASSERT_TRUE(c.sample(t));
  ASSERT_EQ(t.size(), 2u);
  ASSERT_TRUE(t.count("lo") == 1);
  const auto& e = t.at("eth0");
  ASSERT_EQ(e.bytes_recv, 1000u);
  ASSERT_EQ(e.packets_recv, 10u);
  ASSERT_EQ(e.errors_in, 1u);
  ASSERT_EQ(e.drops_in, 2u);
  ASSERT_EQ(e.bytes_sent, 2000u);
  ASSERT_EQ(e.packets_sent, 20u);
  ASSERT_EQ(e.errors_out, 3u);
  ASSERT_EQ(e.drops_out, 4u);
  unsetenv("NETDIAG_PROC_ROOT");
  fs::remove_all(root);
}

TEST(net_collector_truncated_line_reports_zeros) {
  auto root = make_root_net("net_truncated");
  std::ofstream(root / "proc/net/dev") << kDevHeader <<
    "  tun0: 700 7 0 0\n"
    "  eth0: 1000 10 0 0 0 0 0 0  2000 20 0 0 0 0 0 0\n";
  netdiag::collectors::NetCollector c;
  netdiag::model::InterfaceTable t;
  ASSERT_TRUE(c.sample(t));
  const auto& z = t.at("tun0");
  ASSERT_EQ(z.bytes_recv, 0u);
  ASSERT_EQ(z.packets_recv, 0u);
  ASSERT_EQ(z.bytes_sent, 0u);
  ASSERT_EQ(z.drops_out, 0u);
  ASSERT_EQ(t.at("eth0").bytes_sent, 2000u);
  unsetenv("NETDIAG_PROC_ROOT");
  fs::remove_all(root);
}

TEST(net_collector_missing_file_fails) {
  auto root = make_root_net("net_missing");
  netdiag::collectors::NetCollector c;
  netdiag::model::InterfaceTable t;
  ASSERT_TRUE(!c.sample(t));
  unsetenv("NETDIAG_PROC_ROOT");
  fs::remove_all(root);
}
