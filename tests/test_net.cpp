#include "minitest.hpp"
#include "collectors/NetCollector.hpp"
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;

static fs::path make_root_net() {
  auto root = fs::temp_directory_path() / fs::path("penenv_test_net_") / fs::path(std::to_string(::getpid()));
  fs::create_directories(root / "proc/net");
  setenv("PENENV_PROC_ROOT", root.c_str(), 1);
  return root;
}

static void write_dev(const fs::path& root, const std::string& body) {
  std::ofstream(root / "proc/net/dev") <<
    "Inter-|   Receive                                                |  Transmit\n"
    " face |bytes    packets errs drop fifo frame compressed multicast|bytes    packets errs drop fifo colls carrier compressed\n"
    << body;
}

TEST(net_collector_first_sample_has_no_rate) {
  auto root = make_root_net();
  write_dev(root, "  eth0: 1000 0 0 0 0 0 0 0  2000 0 0 0 0 0 0 0\n");
  penenv::collectors::NetCollector c; penenv::model::NetSnapshot s{};
  ASSERT_TRUE(c.sample_at(s, 10.0));
  ASSERT_EQ(s.interfaces.size(), 1u);
  ASSERT_EQ(s.interfaces[0].name, std::string("eth0"));
  ASSERT_EQ(s.total_rx_bytes, 1000u);
  ASSERT_EQ(s.total_tx_bytes, 2000u);
  ASSERT_NEAR(s.agg_rx_bps, 0.0, 1e-9);
}

TEST(net_collector_rate_over_interval) {
  auto root = make_root_net();
  write_dev(root, "  eth0: 1000 0 0 0 0 0 0 0  2000 0 0 0 0 0 0 0\n");
  penenv::collectors::NetCollector c; penenv::model::NetSnapshot s{};
  ASSERT_TRUE(c.sample_at(s, 10.0));
  write_dev(root, "  eth0: 11000 0 0 0 0 0 0 0  32000 0 0 0 0 0 0 0\n");
  ASSERT_TRUE(c.sample_at(s, 12.0));
  ASSERT_NEAR(s.agg_rx_bps, 5000.0, 1e-6);
  ASSERT_NEAR(s.agg_tx_bps, 15000.0, 1e-6);
}

TEST(net_collector_skips_loopback_and_virtual) {
  auto root = make_root_net();
  write_dev(root,
    "    lo: 999999 0 0 0 0 0 0 0  999999 0 0 0 0 0 0 0\n"
    "  eth0: 100 0 0 0 0 0 0 0  200 0 0 0 0 0 0 0\n"
    " wlan0: 300 0 0 0 0 0 0 0  400 0 0 0 0 0 0 0\n"
    "docker0: 5000 0 0 0 0 0 0 0  5000 0 0 0 0 0 0 0\n"
    "vethab12: 5000 0 0 0 0 0 0 0  5000 0 0 0 0 0 0 0\n"
    "br-1234: 5000 0 0 0 0 0 0 0  5000 0 0 0 0 0 0 0\n"
    "virbr0: 5000 0 0 0 0 0 0 0  5000 0 0 0 0 0 0 0\n");
  penenv::collectors::NetCollector c; penenv::model::NetSnapshot s{};
  ASSERT_TRUE(c.sample_at(s, 1.0));
  ASSERT_EQ(s.interfaces.size(), 2u);
  ASSERT_EQ(s.total_rx_bytes, 400u);
  ASSERT_EQ(s.total_tx_bytes, 600u);
}

TEST(net_collector_counter_reset_gives_zero_rate) {
  auto root = make_root_net();
  write_dev(root, "  eth0: 50000 0 0 0 0 0 0 0  50000 0 0 0 0 0 0 0\n");
  penenv::collectors::NetCollector c; penenv::model::NetSnapshot s{};
  ASSERT_TRUE(c.sample_at(s, 1.0));
  write_dev(root, "  eth0: 10 0 0 0 0 0 0 0  10 0 0 0 0 0 0 0\n");
  ASSERT_TRUE(c.sample_at(s, 2.0));
  ASSERT_NEAR(s.agg_rx_bps, 0.0, 1e-9);
  ASSERT_NEAR(s.agg_tx_bps, 0.0, 1e-9);
}

TEST(net_collector_ignored_interface_names) {
  using penenv::collectors::NetCollector;
  ASSERT_TRUE(NetCollector::is_ignored_interface("lo"));
  ASSERT_TRUE(NetCollector::is_ignored_interface("veth0"));
  ASSERT_TRUE(NetCollector::is_ignored_interface("virbr1"));
  ASSERT_TRUE(!NetCollector::is_ignored_interface("eth0"));
  ASSERT_TRUE(!NetCollector::is_ignored_interface("enp3s0"));
  ASSERT_TRUE(!NetCollector::is_ignored_interface("wlan0"));
}
