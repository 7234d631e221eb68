#include "app/runtime_runner.hpp"

#include <chrono>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <format>
#include <iostream>
#include <string>
#include <system_error>
#include <utility>

#include <argparse/argparse.hpp>

#include "smbbench/bench/runner.hpp"
#include "smbbench/core/cancel.hpp"
#include "smbbench/report/report.hpp"

namespace {

using smbbench::BenchConfig;
using smbbench::ErrorCode;
using smbbench::Expected;
using smbbench::Report;
using smbbench::RunResult;
using smbbench::make_error;
using smbbench::forward_error;
using smbbench::app::CliOptions;
using smbbench::app::ExitCode;

int64_t unix_now() {
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

int exit_code(ExitCode c) { return static_cast<int>(c); }

bool has_help_flag(int argc, char** argv) {
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      return true;
    }
  }
  return false;
}

void print_cli_help(const std::string& exe_path) {
  const std::string exe = exe_path.empty() ? "smbbench" : exe_path;
  std::cout << "Usage:\n"
            << "  " << exe << " <target> <source> <name> [options]\n\n"
            << "Positional:\n"
            << "  target                          Mounted target path (e.g. an SMB share)\n"
            << "  source                          Local staging root\n"
            << "  name                            Test run name\n\n"
            << "Workload:\n"
            << "  --large-mb <u64>                Large file size in MiB (default: 1000)\n"
            << "  --small-count <u64>             Small file count (default: 500)\n"
            << "  --small-min-kb <u64>            Min small file size in KiB (default: 10)\n"
            << "  --small-max-kb <u64>            Max small file size in KiB (default: 100)\n"
            << "  --seed <u64>                    Data generator seed, 0 = random (default: 0)\n\n"
            << "Runs and reports:\n"
            << "  --no-gen                        Use existing local files only; never generate or delete them\n"
            << "  --runs <u32>                    Repeat both tests N times and aggregate (default: 1)\n"
            << "  --aggregate-only                Aggregate saved reports for <name>, run nothing\n\n"
            << "Help:\n"
            << "  -h, --help                      Show this help and exit\n\n"
            << "Examples:\n"
            << "  " << exe << " /mnt/share /data/bench SetupRun --large-mb 1000 --small-count 2000\n"
            << "  " << exe << " /mnt/share /data/bench TestRun_01 --no-gen --runs 3\n"
            << "  " << exe << " /mnt/share /data/bench TestRun_01 --aggregate-only\n";
}

int run_aggregate_only(const CliOptions& opts) {
  const auto& cfg = opts.bench;
  const auto layout = smbbench::make_layout(cfg);

  std::cout << std::format("Aggregating saved reports for: {}\n", cfg.test_name);
  auto agg = smbbench::aggregate_saved_reports(layout.report_dir, cfg.test_name);
  if (!agg) {
    std::cerr << std::format("[ERROR] {}\n", agg.error().what());
    return exit_code(ExitCode::RunError);
  }

  auto saved = smbbench::save_aggregate_report(*agg, layout.report_dir, unix_now());
  if (!saved) {
    std::cerr << std::format("[ERROR] {}\n", saved.error().what());
    return exit_code(ExitCode::RunError);
  }
  std::cout << std::format("\n[DONE] Aggregate report saved to: {}\n", saved->string());
  smbbench::print_aggregate_summary(*agg, std::cout);
  return exit_code(ExitCode::Ok);
}

Expected<void> check_target(const BenchConfig& cfg) {
  std::error_code ec;
  if (!std::filesystem::is_directory(cfg.target, ec)) {
    return make_error(ErrorCode::NotFound,
                      std::format("target {} is not a directory (is the share mounted?)", cfg.target.string()));
  }
  return {};
}

int run_benchmark_cli(const CliOptions& opts) {
  const auto& cfg = opts.bench;

  std::cout << std::format("Initializing SMB Bench: {}\n", cfg.test_name);
  if (cfg.no_generation) {
    std::cout << "[MODE] NO-GENERATION (Using existing files only)\n";
  }

  auto target_ok = check_target(cfg);
  if (!target_ok) {
    std::cerr << std::format("[ERROR] {}\n", target_ok.error().what());
    return exit_code(ExitCode::RunError);
  }

  auto layout = smbbench::prepare_local_dirs(cfg);
  if (!layout) {
    std::cerr << std::format("[ERROR] {}\n", layout.error().what());
    return exit_code(ExitCode::RunError);
  }

  smbbench::RemoteCleanup cleanup(layout->remote_staging);
  auto copier = smbbench::make_native_copier();
  if (!smbbench::install_interrupt_handler()) {
    std::cerr << "[WARN] Could not install SIGINT handler; Ctrl-C will skip remote cleanup.\n";
  }

  int rc = exit_code(ExitCode::Ok);
  auto report = smbbench::app::run_benchmark(cfg, *layout, *copier);
  if (report) {
    auto saved = smbbench::save_report(*report, layout->report_dir, unix_now());
    if (saved) {
      std::cout << std::format("\n[DONE] Detailed report saved to: {}\n", saved->string());
      smbbench::print_summary(*report, std::cout);
    } else {
      std::cerr << std::format("\n[!] Error during execution: {}\n", saved.error().what());
      rc = exit_code(ExitCode::RunError);
    }
  } else if (report.error().code() == ErrorCode::Cancelled) {
    std::cout << "\n[!] Test cancelled by user.\n";
    rc = exit_code(ExitCode::Cancelled);
  } else {
    std::cerr << std::format("\n[!] Error during execution: {}\n", report.error().what());
    rc = exit_code(ExitCode::RunError);
  }

  std::cout << "Cleaning up remote artifacts...\n";
  static_cast<void>(cleanup.cleanup());
  return rc;
}

}  // namespace

namespace smbbench::app {

Expected<void> validate_config(const BenchConfig& cfg) {
  if (cfg.test_name.empty()) {
    return make_error(ErrorCode::InvalidArgument, "test name must not be empty");
  }
  if (cfg.test_name.find_first_of("/\\") != std::string::npos || cfg.test_name == "." ||
      cfg.test_name == "..") {
    return make_error(ErrorCode::InvalidArgument, "test name must not contain path separators");
  }
  if (cfg.target.empty() || cfg.source.empty()) {
    return make_error(ErrorCode::InvalidArgument, "target and source paths must not be empty");
  }
  if (cfg.large_file_mb > UINT64_MAX / smbbench::kMiB) {
    return make_error(ErrorCode::InvalidArgument,
                      std::format("--large-mb ({}) is too large", cfg.large_file_mb));
  }
  if (cfg.small_max_kb > UINT64_MAX / smbbench::kKiB) {
    return make_error(ErrorCode::InvalidArgument,
                      std::format("--small-max-kb ({}) is too large", cfg.small_max_kb));
  }
  if (cfg.small_min_kb > cfg.small_max_kb) {
    return make_error(ErrorCode::InvalidArgument,
                      std::format("--small-min-kb ({}) exceeds --small-max-kb ({})", cfg.small_min_kb,
                                  cfg.small_max_kb));
  }
  if (cfg.runs == 0) {
    return make_error(ErrorCode::InvalidArgument, "--runs must be at least 1");
  }
  return {};
}

Expected<CliOptions> parse_args(int argc, const char* const argv[]) {
  CliOptions opts{};
  if (argc > 0) {
    opts.executable_path = argv[0];
  }

  argparse::ArgumentParser program("smbbench", "1.0", argparse::default_arguments::none);
  program.add_argument("target").help("Target SMB Path");
  program.add_argument("source").help("Local staging directory");
  program.add_argument("name").help("Test Run Name");
  program.add_argument("--large-mb").scan<'u', uint64_t>().default_value(uint64_t{1000});
  program.add_argument("--small-count").scan<'u', uint64_t>().default_value(uint64_t{500});
  program.add_argument("--small-min-kb").scan<'u', uint64_t>().default_value(uint64_t{10});
  program.add_argument("--small-max-kb").scan<'u', uint64_t>().default_value(uint64_t{100});
  program.add_argument("--seed").scan<'u', uint64_t>().default_value(uint64_t{0});
  program.add_argument("--runs").scan<'u', uint32_t>().default_value(uint32_t{1});
  program.add_argument("--no-gen").default_value(false).implicit_value(true);
  program.add_argument("--aggregate-only").default_value(false).implicit_value(true);

  try {
    program.parse_args(argc, argv);
  } catch (const std::exception& ex) {
    std::cerr << ex.what() << "\n";
    std::cerr << program;
    return make_error(ErrorCode::InvalidArgument, "argument parsing failed");
  }

  auto& cfg = opts.bench;
  cfg.target = program.get<std::string>("target");
  cfg.source = program.get<std::string>("source");
  cfg.test_name = program.get<std::string>("name");
  cfg.large_file_mb = program.get<uint64_t>("--large-mb");
  cfg.small_file_count = program.get<uint64_t>("--small-count");
  cfg.small_min_kb = program.get<uint64_t>("--small-min-kb");
  cfg.small_max_kb = program.get<uint64_t>("--small-max-kb");
  cfg.seed = program.get<uint64_t>("--seed");
  cfg.runs = program.get<uint32_t>("--runs");
  cfg.no_generation = program.get<bool>("--no-gen");
  opts.aggregate_only = program.get<bool>("--aggregate-only");

  auto valid = validate_config(cfg);
  if (!valid) {
    return forward_error(valid.error());
  }
  return opts;
}

Expected<Report> run_benchmark(const BenchConfig& cfg, const StagingLayout& layout, IFileCopier& copier) {
  StagingArea staging(cfg, layout);
  BenchRunner runner(layout, copier);

  Report report{};
  report.test_name = cfg.test_name;
  report.timestamp = current_timestamp_iso();

  // A missing data set in no-generation mode skips that test, any other
  // setup failure aborts the run.
  auto large = staging.setup_large_file();
  if (!large) {
    if (large.error().code() != ErrorCode::NotFound) {
      return forward_error(large.error());
    }
    std::cerr << std::format("[ERROR] {}\n", large.error().what());
  }
  if (cancel_requested()) {
    return make_error(ErrorCode::Cancelled, "cancelled by user");
  }
  auto small = staging.setup_small_files();
  if (!small) {
    if (small.error().code() != ErrorCode::NotFound) {
      return forward_error(small.error());
    }
    std::cerr << std::format("[ERROR] {}\n", small.error().what());
  }
  if (cancel_requested()) {
    return make_error(ErrorCode::Cancelled, "cancelled by user");
  }

  for (uint32_t run = 1; run <= cfg.runs; ++run) {
    if (cfg.runs > 1) {
      std::cout << std::format("\n=== Run {}/{} ===\n", run, cfg.runs);
    }
    RunResult result{};
    result.run = run;

    if (large) {
      auto phase = runner.run_large_test(*large, staging.large_size_bytes());
      if (!phase) {
        return forward_error(phase.error());
      }
      result.large_file = *phase;
    }
    if (small) {
      auto phase = runner.run_small_test(*small);
      if (!phase) {
        return forward_error(phase.error());
      }
      result.small_files = *phase;
    }
    report.runs.push_back(std::move(result));
  }

  report.config = staging.snapshot();
  return report;
}

}  // namespace smbbench::app

int run_cli_impl(int argc, char** argv) {
  if (has_help_flag(argc, argv)) {
    print_cli_help(argc > 0 ? std::string(argv[0]) : std::string("smbbench"));
    return exit_code(ExitCode::Ok);
  }

  auto opts = smbbench::app::parse_args(argc, argv);
  if (!opts) {
    std::cerr << "error: " << opts.error().what() << "\n";
    return exit_code(ExitCode::BadArguments);
  }

  if (opts->aggregate_only) {
    return run_aggregate_only(*opts);
  }
  return run_benchmark_cli(*opts);
}
