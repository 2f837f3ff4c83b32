#include "app/NetHistory.hpp"

#include <algorithm>
#include <cstdio>

namespace penenv::app {

void NetHistory::push(double rx_kbps, double tx_kbps) {
  samples_.push_back(NetSample{std::max(0.0, rx_kbps), std::max(0.0, tx_kbps)});
  while (samples_.size() > kCapacity) samples_.pop_front();
}

double NetHistory::max_value() const {
  double m = 1.0;
  for (const auto& s : samples_) m = std::max({m, s.rx_kbps, s.tx_kbps});
  return m;
}

std::string format_rate(double kbps) {
  char buf[32];
  if (kbps < 1024.0) std::snprintf(buf, sizeof(buf), "%.0f KB/s", kbps);
  else std::snprintf(buf, sizeof(buf), "%.1f MB/s", kbps / 1024.0);
  return buf;
}

} // namespace penenv::app
