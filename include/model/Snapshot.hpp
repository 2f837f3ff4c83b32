#pragma once
#include <cstdint>
#include "model/Cpu.hpp"
#include "model/Net.hpp"

namespace penenv::model {

struct Memory {
  uint64_t total_kb{};
  uint64_t used_kb{};
  double   used_pct{}; // 0..100
};

// What the header-bar monitors show. Published by the sampler thread.
struct MonitorSnapshot {
  uint64_t seq{};
  CpuSnapshot cpu;
  Memory mem;
  NetSnapshot net;
  bool cpu_ok{false};
  bool mem_ok{false};
  bool net_ok{false};
};

} // namespace penenv::model
