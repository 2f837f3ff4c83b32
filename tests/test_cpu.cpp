#include "minitest.hpp"
#include "collectors/CpuCollector.hpp"
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;

static fs::path make_root_cpu() {
  auto root = fs::temp_directory_path() / fs::path("penenv_test_cpu_") / fs::path(std::to_string(::getpid()));
  fs::create_directories(root / "proc");
  setenv("PENENV_PROC_ROOT", root.c_str(), 1);
  return root;
}

TEST(cpu_collector_first_sample_is_zero) {
  auto root = make_root_cpu();
  std::ofstream(root / "proc/stat") << "cpu  500 0 500 1000 0 0 0 0\n"
                                        "cpu0 500 0 500 1000 0 0 0 0\n";
  penenv::collectors::CpuCollector c; penenv::model::CpuSnapshot s{};
  ASSERT_TRUE(c.sample(s));
  ASSERT_NEAR(s.usage_pct, 0.0, 1e-9);
  ASSERT_EQ(s.total_times.user, 500u);
  ASSERT_EQ(s.total_times.idle, 1000u);
}

TEST(cpu_collector_delta_usage) {
  auto root = make_root_cpu();
  std::ofstream(root / "proc/stat") << "cpu  100 0 100 1000 0 0 0 0\n"
                                        "cpu0 100 0 100 1000 0 0 0 0\n";
  penenv::collectors::CpuCollector c; penenv::model::CpuSnapshot s{};
  ASSERT_TRUE(c.sample(s));
  // 100 more work ticks out of 200 total
  std::ofstream(root / "proc/stat") << "cpu  150 0 150 1100 0 0 0 0\n"
                                        "cpu0 150 0 150 1100 0 0 0 0\n";
  ASSERT_TRUE(c.sample(s));
  ASSERT_NEAR(s.usage_pct, 50.0, 1e-6);
}

TEST(cpu_collector_iowait_counts_as_idle) {
  auto root = make_root_cpu();
  std::ofstream(root / "proc/stat") << "cpu  100 0 100 1000 0 0 0 0\n";
  penenv::collectors::CpuCollector c; penenv::model::CpuSnapshot s{};
  ASSERT_TRUE(c.sample(s));
  std::ofstream(root / "proc/stat") << "cpu  125 0 125 1100 50 0 0 0\n";
  ASSERT_TRUE(c.sample(s));
  ASSERT_NEAR(s.usage_pct, 25.0, 1e-6);
}

TEST(cpu_collector_missing_aggregate_line_fails) {
  auto root = make_root_cpu();
  std::ofstream(root / "proc/stat") << "cpu0 100 0 100 1000 0 0 0 0\nintr 0\n";
  penenv::collectors::CpuCollector c; penenv::model::CpuSnapshot s{};
  ASSERT_TRUE(!c.sample(s));
}

TEST(cpu_collector_missing_file_fails) {
  auto root = make_root_cpu();
  fs::remove(root / "proc/stat");
  penenv::collectors::CpuCollector c; penenv::model::CpuSnapshot s{};
  ASSERT_TRUE(!c.sample(s));
}
