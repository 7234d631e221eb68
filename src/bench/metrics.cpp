#include "smbbench/bench/metrics.hpp"

#include <vector>

#include "app/math_utils.hpp"

namespace smbbench {

std::optional<TransferMetrics> calculate_metrics(uint64_t bytes_transferred,
                                                 double seconds,
                                                 uint64_t file_count) {
  if (seconds == 0.0) {
    return std::nullopt;
  }

  const auto bytes = static_cast<double>(bytes_transferred);
  TransferMetrics m{};
  m.seconds = seconds;
  m.mb_s = (bytes / 1'000'000.0) / seconds;
  m.mib_s = (bytes / 1'048'576.0) / seconds;
  m.mbps = (bytes * 8.0) / 1'000'000.0 / seconds;
  m.files_sec = static_cast<double>(file_count) / seconds;
  return round_metrics(m);
}

TransferMetrics round_metrics(const TransferMetrics& m) {
  using app::round_to;
  TransferMetrics out{};
  out.seconds = round_to(m.seconds, 3);
  out.mbps = round_to(m.mbps, 2);
  out.mb_s = round_to(m.mb_s, 2);
  out.mib_s = round_to(m.mib_s, 2);
  out.files_sec = round_to(m.files_sec, 1);
  return out;
}

AggregateStat aggregate(std::span<const double> values) {
  return app::calc_stats(std::vector<double>(values.begin(), values.end()));
}

}  // namespace smbbench
