#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace smbbench {

inline constexpr uint64_t kKiB = 1024ULL;
inline constexpr uint64_t kMiB = 1024ULL * 1024ULL;

struct BenchConfig {
  std::filesystem::path target{};
  std::filesystem::path source{};
  std::string test_name{};

  uint64_t large_file_mb{1000};
  uint64_t small_file_count{500};
  uint64_t small_min_kb{10};
  uint64_t small_max_kb{100};

  bool no_generation{false};
  uint32_t runs{1};
  // 0 seeds the data generator from std::random_device.
  uint64_t seed{0};
};

// Rounded the way the report prints them: seconds to 3 places, rates to 2,
// files/sec to 1.
struct TransferMetrics {
  double seconds{};
  double mbps{};
  double mb_s{};
  double mib_s{};
  double files_sec{};
};

// An empty direction means the copy finished below timer resolution.
struct PhaseResult {
  bool ran{false};
  std::optional<TransferMetrics> upload{};
  std::optional<TransferMetrics> download{};
};

struct RunResult {
  uint32_t run{1};
  PhaseResult large_file{};
  PhaseResult small_files{};
};

struct ConfigSnapshot {
  bool no_generation{false};
  double large_file_mb{};
  uint64_t small_files_count{};
  double small_min_kb{};
  double small_max_kb{};
  double total_small_files_mb{};
};

struct Report {
  std::string test_name{};
  std::string timestamp{};
  ConfigSnapshot config{};
  std::vector<RunResult> runs{};
};

struct AggregateStat {
  double min{};
  double max{};
  double avg{};
  size_t samples{};
};

}  // namespace smbbench
