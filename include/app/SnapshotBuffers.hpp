#pragma once
#include <cstdint>
#include <mutex>
#include "model/Snapshot.hpp"

namespace penenv::app {

// Double buffer for MonitorSnapshot. The sampler fills back() and publishes;
// readers take a copy of the front under the lock.
class SnapshotBuffers {
public:
  SnapshotBuffers() = default;
  SnapshotBuffers(const SnapshotBuffers&) = delete;
  SnapshotBuffers& operator=(const SnapshotBuffers&) = delete;

  // Writer side only; not synchronised with other writers.
  penenv::model::MonitorSnapshot& back() { return back_; }
  void publish(); // copy back to front and bump seq

  penenv::model::MonitorSnapshot front() const;
  uint64_t seq() const;

private:
  mutable std::mutex mu_;
  penenv::model::MonitorSnapshot front_{};
  penenv::model::MonitorSnapshot back_{};
};

} // namespace penenv::app
