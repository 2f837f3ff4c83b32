#pragma once
#include "model/Snapshot.hpp"

#include <string_view>

namespace penenv::collectors {

class NetCollector {
public:
  bool sample(penenv::model::NetSnapshot& out);
  // Same as sample() with an explicit timestamp in seconds.
  bool sample_at(penenv::model::NetSnapshot& out, double ts);

  // Loopback and virtual bridge/container interfaces are not counted.
  static bool is_ignored_interface(std::string_view name);
private:
  uint64_t last_rx_{};
  uint64_t last_tx_{};
  double last_ts_{};
  bool has_last_{false};
};

} // namespace penenv::collectors
