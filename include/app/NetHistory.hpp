#pragma once
#include <cstddef>
#include <deque>
#include <string>

namespace penenv::app {

struct NetSample {
  double rx_kbps{};
  double tx_kbps{};
};

// Rolling window of network rates for the header graph.
class NetHistory {
public:
  static constexpr std::size_t kCapacity = 60;

  void push(double rx_kbps, double tx_kbps);
  // From bytes per second as produced by the net collector
  void push_bps(double rx_bps, double tx_bps) { push(rx_bps / 1024.0, tx_bps / 1024.0); }

  const std::deque<NetSample>& samples() const { return samples_; }
  std::size_t size() const { return samples_.size(); }
  bool empty() const { return samples_.empty(); }
  NetSample latest() const { return samples_.empty() ? NetSample{} : samples_.back(); }

  // Largest rx or tx value in the window, never below 1.0.
  double max_value() const;

private:
  std::deque<NetSample> samples_;
};

// "512 KB/s" below 1024 KB/s, "1.5 MB/s" above.
std::string format_rate(double kbps);

} // namespace penenv::app
