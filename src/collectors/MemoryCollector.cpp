#include "collectors/MemoryCollector.hpp"
#include "util/Procfs.hpp"

#include <charconv>
#include <string_view>

namespace penenv::collectors {

static inline uint64_t parse_u64(std::string_view s) {
  uint64_t v = 0;
  // strip unit suffix (kB) and leading blanks
  while (!s.empty() && (s.back() < '0' || s.back() > '9')) s.remove_suffix(1);
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
  std::from_chars(s.data(), s.data() + s.size(), v);
  return v;
}

bool MemoryCollector::sample(penenv::model::Memory& out) const {
  auto txt_opt = penenv::util::read_file_string("/proc/meminfo");
  if (!txt_opt) return false;

  uint64_t mem_total = 0, mem_free = 0, mem_avail = 0, buffers = 0, cached = 0;
  bool have_avail = false;
  penenv::util::for_each_line(*txt_opt, [&](std::string_view line) {
    if (line.starts_with("MemTotal:")) mem_total = parse_u64(line.substr(9));
    else if (line.starts_with("MemFree:")) mem_free = parse_u64(line.substr(8));
    else if (line.starts_with("MemAvailable:")) { mem_avail = parse_u64(line.substr(13)); have_avail = true; }
    else if (line.starts_with("Buffers:")) buffers = parse_u64(line.substr(8));
    else if (line.starts_with("Cached:")) cached = parse_u64(line.substr(7));
  });
  if (mem_total == 0) return false;

  out.total_kb = mem_total;
  if (have_avail) {
    out.used_kb = (mem_total > mem_avail) ? (mem_total - mem_avail) : 0;
  } else {
    uint64_t sum = mem_free + buffers + cached;
    out.used_kb = (mem_total > sum) ? (mem_total - sum) : 0;
  }
  out.used_pct = 100.0 * static_cast<double>(out.used_kb) / static_cast<double>(out.total_kb);
  return true;
}

} // namespace penenv::collectors
