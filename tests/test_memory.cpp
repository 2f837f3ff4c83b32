#include "minitest.hpp"
#include "collectors/MemoryCollector.hpp"
#include <filesystem>
#include <fstream>
#include <cstdlib>
#include <unistd.h>

using namespace std;
namespace fs = std::filesystem;

static fs::path make_root() {
  auto root = fs::temp_directory_path() / fs::path("penenv_test_mem_") / fs::path(std::to_string(::getpid()));
  fs::create_directories(root / "proc");
  setenv("PENENV_PROC_ROOT", root.c_str(), 1);
  return root;
}

TEST(memory_collector_uses_mem_available) {
  auto root = make_root();
  ofstream(root / "proc/meminfo") <<
    "MemTotal:       2097152 kB\n"
    "MemFree:         524288 kB\n"
    "MemAvailable:   1048576 kB\n"
    "Buffers:         131072 kB\n"
    "Cached:          262144 kB\n";
  penenv::collectors::MemoryCollector c; penenv::model::Memory m{};
  ASSERT_TRUE(c.sample(m));
  ASSERT_EQ(m.total_kb, 2097152u);
  ASSERT_EQ(m.used_kb, 1048576u);
  ASSERT_NEAR(m.used_pct, 50.0, 1e-6);
}

TEST(memory_collector_falls_back_without_available) {
  auto root = make_root();
  ofstream(root / "proc/meminfo") <<
    "MemTotal:       1000000 kB\n"
    "MemFree:         200000 kB\n"
    "Buffers:         100000 kB\n"
    "Cached:          200000 kB\n";
  penenv::collectors::MemoryCollector c; penenv::model::Memory m{};
  ASSERT_TRUE(c.sample(m));
  ASSERT_EQ(m.used_kb, 500000u);
  ASSERT_NEAR(m.used_pct, 50.0, 1e-6);
}

TEST(memory_collector_rejects_zero_total) {
  auto root = make_root();
  ofstream(root / "proc/meminfo") << "MemFree:  1 kB\n";
  penenv::collectors::MemoryCollector c; penenv::model::Memory m{};
  ASSERT_TRUE(!c.sample(m));
}
