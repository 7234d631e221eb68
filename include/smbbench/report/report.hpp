#pragma once

#include <array>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <ostream>
#include <span>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "smbbench/bench/metrics.hpp"
#include "smbbench/core/expected.hpp"
#include "smbbench/core/types.hpp"

namespace smbbench {

using Json = nlohmann::ordered_json;

inline constexpr const char* kReportPrefix = "SMB_Report_";
inline constexpr const char* kAggregatePrefix = "SMB_Aggregate_";

// One AggregateStat per entry of kMetricFields.
struct MetricsAggregate {
  std::array<AggregateStat, kMetricFields.size()> fields{};
  size_t samples{};
};

struct PhaseAggregate {
  std::optional<MetricsAggregate> upload{};
  std::optional<MetricsAggregate> download{};
};

struct RunAggregate {
  PhaseAggregate large_file{};
  PhaseAggregate small_files{};
  size_t run_count{};
};

// ISO-8601 local time with microseconds, e.g. 2024-05-01T13:45:10.123456.
std::string current_timestamp_iso();

Json metrics_to_json(const std::optional<TransferMetrics>& m);
Json phase_to_json(const PhaseResult& p);
Json config_to_json(const ConfigSnapshot& c);
Json report_to_json(const Report& report);

PhaseResult phase_from_json(const Json& j);

RunAggregate aggregate_runs(std::span<const RunResult> runs);
// Averages of every aggregated figure, rounded like a single run.
PhaseResult average_phase(const PhaseAggregate& agg);
Json aggregate_to_json(const RunAggregate& agg);

std::filesystem::path report_file_name(const std::string& test_name, int64_t unix_seconds);
Expected<std::filesystem::path> save_report(const Report& report,
                                            const std::filesystem::path& report_dir,
                                            int64_t unix_seconds);
void print_summary(const Report& report, std::ostream& out);

// Reports written for test_name, oldest first.
Expected<std::vector<std::filesystem::path>> find_reports(const std::filesystem::path& report_dir,
                                                          const std::string& test_name);
// Every run a report holds: the "runs" entries of a multi-run report, or the
// single top-level result otherwise.
Expected<std::vector<RunResult>> load_report_runs(const std::filesystem::path& report_file);

struct AggregateReport {
  std::string test_name{};
  std::string timestamp{};
  std::vector<std::filesystem::path> sources{};
  RunAggregate aggregate{};
};

Expected<AggregateReport> aggregate_saved_reports(const std::filesystem::path& report_dir,
                                                  const std::string& test_name);
Expected<std::filesystem::path> save_aggregate_report(const AggregateReport& report,
                                                      const std::filesystem::path& report_dir,
                                                      int64_t unix_seconds);
void print_aggregate_summary(const AggregateReport& report, std::ostream& out);

}  // namespace smbbench
