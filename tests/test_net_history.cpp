#include "minitest.hpp"
#include "app/NetHistory.hpp"
#include <string>

using namespace penenv::app;

TEST(net_history_starts_empty) {
  NetHistory h;
  ASSERT_TRUE(h.empty());
  ASSERT_NEAR(h.max_value(), 1.0, 1e-12);
  ASSERT_NEAR(h.latest().rx_kbps, 0.0, 1e-12);
}

TEST(net_history_drops_oldest_beyond_capacity) {
  NetHistory h;
  for (int i = 0; i < 75; ++i) h.push(i, 0);
  ASSERT_EQ(h.size(), NetHistory::kCapacity);
  ASSERT_NEAR(h.samples().front().rx_kbps, 15.0, 1e-12);
  ASSERT_NEAR(h.latest().rx_kbps, 74.0, 1e-12);
}

TEST(net_history_max_over_rx_and_tx) {
  NetHistory h;
  h.push(10, 20);
  h.push(300, 5);
  h.push(-4, 0.5);
  ASSERT_NEAR(h.max_value(), 300.0, 1e-12);
  ASSERT_NEAR(h.latest().rx_kbps, 0.0, 1e-12);
}

TEST(net_history_push_bps_converts_to_kb) {
  NetHistory h;
  h.push_bps(2048.0, 1024.0 * 1024.0);
  ASSERT_NEAR(h.latest().rx_kbps, 2.0, 1e-12);
  ASSERT_NEAR(h.latest().tx_kbps, 1024.0, 1e-12);
}

TEST(net_history_format_rate) {
  ASSERT_EQ(format_rate(0.0), std::string("0 KB/s"));
  ASSERT_EQ(format_rate(512.0), std::string("512 KB/s"));
  ASSERT_EQ(format_rate(1536.0), std::string("1.5 MB/s"));
}
