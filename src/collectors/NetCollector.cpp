#include "collectors/NetCollector.hpp"
#include "util/Procfs.hpp"

#include <charconv>
#include <chrono>

using namespace std::chrono;

namespace penenv::collectors {

static double now_secs() {
  return duration_cast<duration<double>>(steady_clock::now().time_since_epoch()).count();
}

static std::string_view next_field(std::string_view& rest) {
  while (!rest.empty() && (rest.front() == ' ' || rest.front() == '\t')) rest.remove_prefix(1);
  size_t end = 0;
  while (end < rest.size() && rest[end] != ' ' && rest[end] != '\t') ++end;
  auto field = rest.substr(0, end);
  rest.remove_prefix(end);
  return field;
}

bool NetCollector::is_ignored_interface(std::string_view name) {
  return name == "lo" || name.starts_with("veth") || name.starts_with("docker") ||
         name.starts_with("br-") || name.starts_with("virbr");
}

bool NetCollector::sample(penenv::model::NetSnapshot& out) {
  return sample_at(out, now_secs());
}

bool NetCollector::sample_at(penenv::model::NetSnapshot& out, double ts) {
  auto txt_opt = penenv::util::read_file_string("/proc/net/dev");
  if (!txt_opt) return false;
  out.interfaces.clear();
  out.total_rx_bytes = out.total_tx_bytes = 0;
  out.agg_rx_bps = out.agg_tx_bps = 0.0;

  int line_no = 0;
  penenv::util::for_each_line(*txt_opt, [&](std::string_view line) {
    if (++line_no <= 2) return; // headers
    auto colon = line.find(':');
    if (colon == std::string_view::npos) return;
    auto name = line.substr(0, colon);
    while (!name.empty() && name.front() == ' ') name.remove_prefix(1);
    if (is_ignored_interface(name)) return;
    // rx bytes is field 1, tx bytes field 9
    auto rest = line.substr(colon + 1);
    uint64_t fields[9]{};
    for (int i = 0; i < 9; ++i) {
      auto f = next_field(rest);
      if (f.empty()) break;
      std::from_chars(f.data(), f.data() + f.size(), fields[i]);
    }
    penenv::model::NetIf nif;
    nif.name = std::string(name); nif.rx_bytes = fields[0]; nif.tx_bytes = fields[8];
    out.total_rx_bytes += nif.rx_bytes;
    out.total_tx_bytes += nif.tx_bytes;
    out.interfaces.push_back(std::move(nif));
  });

  if (has_last_) {
    double dt = ts - last_ts_;
    if (dt <= 0.0) dt = 1.0;
    // counters that went backwards (interface reset or removed) count as no traffic
    if (out.total_rx_bytes >= last_rx_) out.agg_rx_bps = static_cast<double>(out.total_rx_bytes - last_rx_) / dt;
    if (out.total_tx_bytes >= last_tx_) out.agg_tx_bps = static_cast<double>(out.total_tx_bytes - last_tx_) / dt;
  }
  last_rx_ = out.total_rx_bytes; last_tx_ = out.total_tx_bytes; last_ts_ = ts; has_last_ = true;
  return true;
}

} // namespace penenv::collectors
