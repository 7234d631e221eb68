#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <utility>

#include "smbbench/core/types.hpp"

namespace smbbench {

// Report key and member for every figure in TransferMetrics, in report order.
inline constexpr std::array<std::pair<std::string_view, double TransferMetrics::*>, 5>
    kMetricFields{{
        {"seconds", &TransferMetrics::seconds},
        {"mbps", &TransferMetrics::mbps},
        {"MB_s", &TransferMetrics::mb_s},
        {"MiB_s", &TransferMetrics::mib_s},
        {"files_sec", &TransferMetrics::files_sec},
    }};

// Empty when seconds is zero.
std::optional<TransferMetrics> calculate_metrics(uint64_t bytes_transferred,
                                                 double seconds,
                                                 uint64_t file_count = 1);

// Rounds each figure to the precision calculate_metrics uses.
TransferMetrics round_metrics(const TransferMetrics& m);

AggregateStat aggregate(std::span<const double> values);

}  // namespace smbbench
