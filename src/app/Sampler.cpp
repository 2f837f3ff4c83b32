#include "app/Sampler.hpp"
#include "util/Log.hpp"

#include <algorithm>

using namespace std::chrono;

namespace penenv::app {

Sampler::Sampler(SnapshotBuffers& buffers, milliseconds interval)
    : buffers_(buffers), interval_(interval) {
  if (interval_ < 50ms) interval_ = 50ms;
}

Sampler::~Sampler() { stop(); }

void Sampler::start() {
  if (thread_.joinable()) return;
  thread_ = std::jthread([this](std::stop_token st){ run(st); });
}

void Sampler::stop() {
  if (!thread_.joinable()) return;
  thread_.request_stop();
  thread_.join();
}

void Sampler::sample_once() {
  auto& s = buffers_.back();
  // A failed collector keeps its previous values; the flags tell the UI.
  s.cpu_ok = cpu_.sample(s.cpu);
  s.mem_ok = mem_.sample(s.mem);
  s.net_ok = net_.sample(s.net);
  if (!s.cpu_ok && !s.mem_ok && !s.net_ok) PENENV_LOG_DEBUG("sampler: no /proc data available");
  buffers_.publish();
}

void Sampler::run(std::stop_token st) {
  PENENV_LOG_DEBUG("sampler: started, interval %lld ms", static_cast<long long>(interval_.count()));
  while (!st.stop_requested()) {
    auto next_due = steady_clock::now() + interval_;
    sample_once();
    // sleep in short slices so stop requests are honoured promptly
    while (!st.stop_requested()) {
      auto rem = duration_cast<milliseconds>(next_due - steady_clock::now());
      if (rem.count() <= 0) break;
      std::this_thread::sleep_for(std::min<milliseconds>(rem, 50ms));
    }
  }
  PENENV_LOG_DEBUG("sampler: stopped");
}

} // namespace penenv::app
