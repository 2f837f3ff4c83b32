#include "minitest.hpp"
#include "app/Sampler.hpp"
#include "app/SnapshotBuffers.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

static fs::path make_proc_root() {
  auto root = fs::temp_directory_path() / fs::path("penenv_test_sampler_") / fs::path(std::to_string(::getpid()));
  fs::create_directories(root / "proc/net");
  std::ofstream(root / "proc/stat") << "cpu  100 0 100 800 0 0 0 0\n";
  std::ofstream(root / "proc/meminfo") << "MemTotal: 1000 kB\nMemAvailable: 250 kB\n";
  std::ofstream(root / "proc/net/dev") <<
    "Inter-|   Receive\n"
    " face |bytes\n"
    "  eth0: 4096 0 0 0 0 0 0 0  8192 0 0 0 0 0 0 0\n";
  setenv("PENENV_PROC_ROOT", root.c_str(), 1);
  return root;
}

TEST(buffers_publish_bumps_seq_and_copies) {
  penenv::app::SnapshotBuffers b;
  ASSERT_EQ(b.seq(), 0u);
  b.back().mem.total_kb = 42;
  b.publish();
  ASSERT_EQ(b.seq(), 1u);
  ASSERT_EQ(b.front().mem.total_kb, 42u);
  b.back().mem.total_kb = 7;
  ASSERT_EQ(b.front().mem.total_kb, 42u);
  b.publish();
  ASSERT_EQ(b.front().seq, 2u);
}

TEST(sampler_sample_once_publishes_all_monitors) {
  make_proc_root();
  penenv::app::SnapshotBuffers b;
  penenv::app::Sampler s(b);
  s.sample_once();
  auto snap = b.front();
  ASSERT_EQ(snap.seq, 1u);
  ASSERT_TRUE(snap.cpu_ok);
  ASSERT_TRUE(snap.mem_ok);
  ASSERT_TRUE(snap.net_ok);
  ASSERT_EQ(snap.mem.total_kb, 1000u);
  ASSERT_EQ(snap.mem.used_kb, 750u);
  ASSERT_EQ(snap.net.total_rx_bytes, 4096u);
  ASSERT_EQ(snap.net.total_tx_bytes, 8192u);
}

TEST(sampler_flags_missing_sources) {
  auto root = fs::temp_directory_path() / fs::path("penenv_test_sampler_empty_") / fs::path(std::to_string(::getpid()));
  fs::create_directories(root);
  setenv("PENENV_PROC_ROOT", root.c_str(), 1);
  penenv::app::SnapshotBuffers b;
  penenv::app::Sampler s(b);
  s.sample_once();
  auto snap = b.front();
  ASSERT_EQ(snap.seq, 1u);
  ASSERT_TRUE(!snap.cpu_ok);
  ASSERT_TRUE(!snap.mem_ok);
  ASSERT_TRUE(!snap.net_ok);
}

TEST(sampler_thread_publishes_and_stops) {
  make_proc_root();
  penenv::app::SnapshotBuffers b;
  penenv::app::Sampler s(b, 50ms);
  s.start();
  ASSERT_TRUE(s.running());
  auto deadline = std::chrono::steady_clock::now() + 2s;
  while (b.seq() < 2 && std::chrono::steady_clock::now() < deadline) std::this_thread::sleep_for(10ms);
  s.stop();
  ASSERT_TRUE(!s.running());
  ASSERT_TRUE(b.seq() >= 2);
  auto after = b.seq();
  std::this_thread::sleep_for(120ms);
  ASSERT_EQ(b.seq(), after);
}
