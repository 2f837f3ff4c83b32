#include "app/SnapshotBuffers.hpp"

namespace penenv::app {

void SnapshotBuffers::publish() {
  std::lock_guard<std::mutex> lk(mu_);
  back_.seq = front_.seq + 1;
  front_ = back_;
}

penenv::model::MonitorSnapshot SnapshotBuffers::front() const {
  std::lock_guard<std::mutex> lk(mu_);
  return front_;
}

uint64_t SnapshotBuffers::seq() const {
  std::lock_guard<std::mutex> lk(mu_);
  return front_.seq;
}

} // namespace penenv::app
