#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace penenv::model {

struct NetIf {
  std::string name;
  uint64_t rx_bytes{};
  uint64_t tx_bytes{};
};

struct NetSnapshot {
  std::vector<NetIf> interfaces;
  uint64_t total_rx_bytes{};
  uint64_t total_tx_bytes{};
  double agg_rx_bps{};
  double agg_tx_bps{};
};

} // namespace penenv::model
