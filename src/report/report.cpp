#include "smbbench/report/report.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <ctime>
#include <format>
#include <fstream>
#include <string_view>
#include <system_error>
#include <utility>

#include "app/math_utils.hpp"

namespace smbbench {
namespace {

using FieldValues = std::array<std::vector<double>, kMetricFields.size()>;

constexpr std::string_view kRuleHeavy =
    "===========================================================================";
constexpr std::string_view kRuleLight =
    "---------------------------------------------------------------------------";

// Whole numbers go out as integers so configured values read like the
// command line that produced them.
Json number_json(double v) {
  if (std::isfinite(v) && std::floor(v) == v && std::fabs(v) < 9.0e15) {
    return static_cast<int64_t>(v);
  }
  return v;
}

std::optional<TransferMetrics> metrics_from_json(const Json& j) {
  if (!j.is_object() || j.empty()) {
    return std::nullopt;
  }
  TransferMetrics m{};
  for (const auto& [key, member] : kMetricFields) {
    const auto it = j.find(std::string(key));
    if (it != j.end() && it->is_number()) {
      m.*member = it->get<double>();
    }
  }
  return m;
}

void collect(const std::optional<TransferMetrics>& m, FieldValues& acc) {
  if (!m) {
    return;
  }
  for (size_t i = 0; i < kMetricFields.size(); ++i) {
    acc[i].push_back((*m).*(kMetricFields[i].second));
  }
}

std::optional<MetricsAggregate> finish(const FieldValues& acc) {
  if (acc[0].empty()) {
    return std::nullopt;
  }
  MetricsAggregate out{};
  for (size_t i = 0; i < kMetricFields.size(); ++i) {
    out.fields[i] = aggregate(acc[i]);
  }
  out.samples = acc[0].size();
  return out;
}

std::optional<TransferMetrics> average_of(const std::optional<MetricsAggregate>& agg) {
  if (!agg) {
    return std::nullopt;
  }
  TransferMetrics m{};
  for (size_t i = 0; i < kMetricFields.size(); ++i) {
    m.*(kMetricFields[i].second) = agg->fields[i].avg;
  }
  return round_metrics(m);
}

Json metrics_aggregate_to_json(const std::optional<MetricsAggregate>& agg) {
  Json j = Json::object();
  if (!agg) {
    return j;
  }
  for (size_t i = 0; i < kMetricFields.size(); ++i) {
    const auto& s = agg->fields[i];
    j[std::string(kMetricFields[i].first)] = {
        {"min", s.min},
        {"max", s.max},
        {"avg", app::round_to(s.avg, 3)},
    };
  }
  return j;
}

Json phase_aggregate_to_json(const PhaseAggregate& agg) {
  Json j = Json::object();
  if (!agg.upload && !agg.download) {
    return j;
  }
  j["upload"] = metrics_aggregate_to_json(agg.upload);
  j["download"] = metrics_aggregate_to_json(agg.download);
  return j;
}

std::string large_cell(const std::optional<TransferMetrics>& m) {
  if (!m) {
    return "n/a";
  }
  return std::format("{} MB/s ({} Mbps)", m->mb_s, m->mbps);
}

std::string small_cell(const std::optional<TransferMetrics>& m) {
  if (!m) {
    return "n/a";
  }
  return std::format("{} files/s ({} MB/s)", m->files_sec, m->mb_s);
}

Expected<void> write_json_file(const std::filesystem::path& path, const Json& j) {
  std::ofstream out(path, std::ios::trunc);
  if (!out.is_open()) {
    return make_error(ErrorCode::IoError, "failed to open report path: " + path.string());
  }
  out << j.dump(4);
  out.flush();
  if (!out) {
    return make_error(ErrorCode::IoError, "failed to write report: " + path.string());
  }
  return {};
}

bool all_digits(std::string_view s) {
  return !s.empty() && std::all_of(s.begin(), s.end(), [](char c) { return c >= '0' && c <= '9'; });
}

}  // namespace

std::string current_timestamp_iso() {
  const auto now = std::chrono::system_clock::now();
  const std::time_t t = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
  ::localtime_r(&t, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
  const auto us =
      std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count() % 1'000'000;
  return std::format("{}.{:06}", buf, us);
}

Json metrics_to_json(const std::optional<TransferMetrics>& m) {
  Json j = Json::object();
  if (!m) {
    return j;
  }
  for (const auto& [key, member] : kMetricFields) {
    j[std::string(key)] = (*m).*member;
  }
  return j;
}

Json phase_to_json(const PhaseResult& p) {
  Json j = Json::object();
  if (!p.ran) {
    return j;
  }
  j["upload"] = metrics_to_json(p.upload);
  j["download"] = metrics_to_json(p.download);
  return j;
}

Json config_to_json(const ConfigSnapshot& c) {
  Json j = Json::object();
  j["mode"] = c.no_generation ? "NO-GENERATION (Real Files)" : "SYNTHETIC (Generated)";
  j["large_file_mb"] = number_json(c.large_file_mb);
  j["small_files_count"] = c.small_files_count;
  j["small_min_kb"] = number_json(c.small_min_kb);
  j["small_max_kb"] = number_json(c.small_max_kb);
  j["total_small_files_mb"] = c.total_small_files_mb;
  return j;
}

Json report_to_json(const Report& report) {
  Json j = Json::object();
  j["test_name"] = report.test_name;
  j["timestamp"] = report.timestamp;
  j["config"] = config_to_json(report.config);

  if (report.runs.empty()) {
    j["large_file"] = Json::object();
    j["small_files"] = Json::object();
    return j;
  }
  if (report.runs.size() == 1) {
    j["large_file"] = phase_to_json(report.runs.front().large_file);
    j["small_files"] = phase_to_json(report.runs.front().small_files);
    return j;
  }

  const auto agg = aggregate_runs(report.runs);
  j["large_file"] = phase_to_json(average_phase(agg.large_file));
  j["small_files"] = phase_to_json(average_phase(agg.small_files));

  Json runs = Json::array();
  for (const auto& r : report.runs) {
    runs.push_back({
        {"run", r.run},
        {"large_file", phase_to_json(r.large_file)},
        {"small_files", phase_to_json(r.small_files)},
    });
  }
  j["runs"] = std::move(runs);
  j["aggregate"] = aggregate_to_json(agg);
  return j;
}

PhaseResult phase_from_json(const Json& j) {
  PhaseResult p{};
  if (!j.is_object() || j.empty()) {
    return p;
  }
  p.ran = true;
  if (const auto it = j.find("upload"); it != j.end()) {
    p.upload = metrics_from_json(*it);
  }
  if (const auto it = j.find("download"); it != j.end()) {
    p.download = metrics_from_json(*it);
  }
  return p;
}

RunAggregate aggregate_runs(std::span<const RunResult> runs) {
  FieldValues large_up, large_down, small_up, small_down;
  for (const auto& r : runs) {
    collect(r.large_file.upload, large_up);
    collect(r.large_file.download, large_down);
    collect(r.small_files.upload, small_up);
    collect(r.small_files.download, small_down);
  }

  RunAggregate out{};
  out.run_count = runs.size();
  out.large_file.upload = finish(large_up);
  out.large_file.download = finish(large_down);
  out.small_files.upload = finish(small_up);
  out.small_files.download = finish(small_down);
  return out;
}

PhaseResult average_phase(const PhaseAggregate& agg) {
  PhaseResult p{};
  p.ran = agg.upload.has_value() || agg.download.has_value();
  p.upload = average_of(agg.upload);
  p.download = average_of(agg.download);
  return p;
}

Json aggregate_to_json(const RunAggregate& agg) {
  Json j = Json::object();
  j["large_file"] = phase_aggregate_to_json(agg.large_file);
  j["small_files"] = phase_aggregate_to_json(agg.small_files);
  return j;
}

std::filesystem::path report_file_name(const std::string& test_name, int64_t unix_seconds) {
  return std::format("{}{}_{}.json", kReportPrefix, test_name, unix_seconds);
}

Expected<std::filesystem::path> save_report(const Report& report,
                                            const std::filesystem::path& report_dir,
                                            int64_t unix_seconds) {
  const auto path = report_dir / report_file_name(report.test_name, unix_seconds);
  auto st = write_json_file(path, report_to_json(report));
  if (!st) {
    return forward_error(st.error());
  }
  return path;
}

void print_summary(const Report& report, std::ostream& out) {
  out << "\n" << kRuleHeavy << "\n";
  out << std::format("SUMMARY: {}\n", report.test_name);
  if (report.config.no_generation) {
    out << "(NO-GENERATION MODE - REAL FILES USED)\n";
  }
  if (report.runs.size() > 1) {
    out << std::format("(AVERAGE OF {} RUNS)\n", report.runs.size());
  }
  out << kRuleHeavy << "\n";
  out << std::format("{:<20} | {:<25} | {:<25}\n", "Metric", "Upload", "Download");
  out << kRuleLight << "\n";

  PhaseResult large{};
  PhaseResult small{};
  if (report.runs.size() == 1) {
    large = report.runs.front().large_file;
    small = report.runs.front().small_files;
  } else if (report.runs.size() > 1) {
    const auto agg = aggregate_runs(report.runs);
    large = average_phase(agg.large_file);
    small = average_phase(agg.small_files);
  }

  if (large.ran) {
    out << std::format("{:<20} | {:<25} | {:<25}\n", "Large File Seq", large_cell(large.upload),
                       large_cell(large.download));
  } else {
    out << std::format("{:<20} | {:<25} | {:<25}\n", "Large File Seq", "SKIPPED", "SKIPPED");
  }

  out << kRuleLight << "\n";

  if (small.ran) {
    out << std::format("{:<20} | {:<25} | {:<25}\n", "Small File Rand", small_cell(small.upload),
                       small_cell(small.download));
  } else {
    out << std::format("{:<20} | {:<25} | {:<25}\n", "Small File Rand", "SKIPPED", "SKIPPED");
  }

  out << kRuleHeavy << "\n";
}

Expected<std::vector<std::filesystem::path>> find_reports(const std::filesystem::path& report_dir,
                                                          const std::string& test_name) {
  const std::string prefix = kReportPrefix + test_name + "_";
  std::vector<std::pair<int64_t, std::filesystem::path>> found;

  std::error_code ec;
  std::filesystem::directory_iterator it(report_dir, ec);
  if (ec) {
    return make_error(ErrorCode::IoError,
                      "list directory failed: " + report_dir.string() + ": " + ec.message());
  }
  for (const auto& entry : it) {
    if (!entry.is_regular_file(ec) || entry.path().extension() != ".json") {
      continue;
    }
    const std::string stem = entry.path().stem().string();
    if (stem.rfind(prefix, 0) != 0) {
      continue;
    }
    const std::string_view ts = std::string_view(stem).substr(prefix.size());
    if (!all_digits(ts) || ts.size() > 18) {
      continue;
    }
    found.emplace_back(std::stoll(std::string(ts)), entry.path());
  }

  std::sort(found.begin(), found.end());
  std::vector<std::filesystem::path> out;
  out.reserve(found.size());
  for (auto& [ts, p] : found) {
    out.push_back(std::move(p));
  }
  return out;
}

Expected<std::vector<RunResult>> load_report_runs(const std::filesystem::path& report_file) {
  std::ifstream in(report_file);
  if (!in.is_open()) {
    return make_error(ErrorCode::IoError, "failed to open report: " + report_file.string());
  }

  Json j;
  try {
    j = Json::parse(in);
  } catch (const nlohmann::json::exception& ex) {
    return make_error(ErrorCode::InvalidArgument,
                      "report is not valid JSON: " + report_file.string() + ": " + ex.what());
  }
  if (!j.is_object()) {
    return make_error(ErrorCode::InvalidArgument, "report is not a JSON object: " + report_file.string());
  }

  std::vector<RunResult> runs;
  if (const auto it = j.find("runs"); it != j.end() && it->is_array()) {
    uint32_t idx = 0;
    for (const auto& entry : *it) {
      if (!entry.is_object()) {
        return make_error(ErrorCode::InvalidArgument,
                          "malformed runs entry in report: " + report_file.string());
      }
      RunResult r{};
      r.run = idx + 1;
      if (const auto run_it = entry.find("run"); run_it != entry.end()) {
        if (!run_it->is_number_unsigned() || run_it->get<uint64_t>() > UINT32_MAX) {
          return make_error(ErrorCode::InvalidArgument,
                            "malformed run number in report: " + report_file.string());
        }
        r.run = run_it->get<uint32_t>();
      }
      r.large_file = phase_from_json(entry.value("large_file", Json::object()));
      r.small_files = phase_from_json(entry.value("small_files", Json::object()));
      runs.push_back(std::move(r));
      ++idx;
    }
    return runs;
  }

  RunResult r{};
  r.large_file = phase_from_json(j.value("large_file", Json::object()));
  r.small_files = phase_from_json(j.value("small_files", Json::object()));
  runs.push_back(std::move(r));
  return runs;
}

Expected<AggregateReport> aggregate_saved_reports(const std::filesystem::path& report_dir,
                                                  const std::string& test_name) {
  auto files = find_reports(report_dir, test_name);
  if (!files) {
    return forward_error(files.error());
  }
  if (files->empty()) {
    return make_error(ErrorCode::NotFound,
                      std::format("no reports found for '{}' in {}", test_name, report_dir.string()));
  }

  std::vector<RunResult> all;
  for (const auto& f : *files) {
    auto runs = load_report_runs(f);
    if (!runs) {
      return forward_error(runs.error());
    }
    all.insert(all.end(), runs->begin(), runs->end());
  }

  AggregateReport out{};
  out.test_name = test_name;
  out.timestamp = current_timestamp_iso();
  out.sources = std::move(*files);
  out.aggregate = aggregate_runs(all);
  return out;
}

Expected<std::filesystem::path> save_aggregate_report(const AggregateReport& report,
                                                      const std::filesystem::path& report_dir,
                                                      int64_t unix_seconds) {
  Json sources = Json::array();
  for (const auto& s : report.sources) {
    sources.push_back(s.filename().string());
  }

  Json j = Json::object();
  j["test_name"] = report.test_name;
  j["timestamp"] = report.timestamp;
  j["source_reports"] = std::move(sources);
  j["run_count"] = report.aggregate.run_count;
  j["aggregate"] = aggregate_to_json(report.aggregate);

  const auto path =
      report_dir / std::format("{}{}_{}.json", kAggregatePrefix, report.test_name, unix_seconds);
  auto st = write_json_file(path, j);
  if (!st) {
    return forward_error(st.error());
  }
  return path;
}

void print_aggregate_summary(const AggregateReport& report, std::ostream& out) {
  out << "\n" << kRuleHeavy << "\n";
  out << std::format("AGGREGATE: {} ({} runs from {} reports)\n", report.test_name,
                     report.aggregate.run_count, report.sources.size());
  out << kRuleHeavy << "\n";
  out << std::format("{:<36} | {:>10} | {:>10} | {:>10}\n", "Metric", "Min", "Avg", "Max");
  out << kRuleLight << "\n";

  const auto rows = [&](std::string_view section, std::string_view direction,
                        const std::optional<MetricsAggregate>& agg) {
    if (!agg) {
      out << std::format("{:<36} | {:>10} | {:>10} | {:>10}\n",
                         std::format("{}.{}", section, direction), "-", "-", "-");
      return;
    }
    for (size_t i = 0; i < kMetricFields.size(); ++i) {
      const auto& s = agg->fields[i];
      out << std::format("{:<36} | {:>10.2f} | {:>10.2f} | {:>10.2f}\n",
                         std::format("{}.{}.{}", section, direction, kMetricFields[i].first), s.min,
                         s.avg, s.max);
    }
  };

  rows("large_file", "upload", report.aggregate.large_file.upload);
  rows("large_file", "download", report.aggregate.large_file.download);
  out << kRuleLight << "\n";
  rows("small_files", "upload", report.aggregate.small_files.upload);
  rows("small_files", "download", report.aggregate.small_files.download);
  out << kRuleHeavy << "\n";
}

}  // namespace smbbench
