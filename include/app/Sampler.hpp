#pragma once
#include <chrono>
#include <stop_token>
#include <thread>
#include "app/SnapshotBuffers.hpp"
#include "collectors/CpuCollector.hpp"
#include "collectors/MemoryCollector.hpp"
#include "collectors/NetCollector.hpp"

namespace penenv::app {

// Background thread that samples CPU, memory and network once per interval
// and publishes into the given buffers.
class Sampler {
public:
  explicit Sampler(SnapshotBuffers& buffers,
                   std::chrono::milliseconds interval = std::chrono::milliseconds(1000));
  ~Sampler();
  Sampler(const Sampler&) = delete;
  Sampler& operator=(const Sampler&) = delete;

  void start();
  void stop();
  bool running() const { return thread_.joinable(); }

  // One collection pass plus publish, on the calling thread.
  void sample_once();

private:
  void run(std::stop_token st);
  SnapshotBuffers& buffers_;
  std::chrono::milliseconds interval_;
  std::jthread thread_{};
  penenv::collectors::CpuCollector cpu_{};
  penenv::collectors::MemoryCollector mem_{};
  penenv::collectors::NetCollector net_{};
};

} // namespace penenv::app
