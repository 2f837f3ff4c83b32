#pragma once
#include "model/Snapshot.hpp"

namespace penenv::collectors {

class CpuCollector {
public:
  CpuCollector() = default;
  // Usage is 0 on the first successful sample.
  bool sample(penenv::model::CpuSnapshot& out);
private:
  penenv::model::CpuTimes last_total_{};
  bool has_last_{false};
};

} // namespace penenv::collectors
