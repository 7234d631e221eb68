#include <cmath>
#include <cstdint>
#include <filesystem>
#include <format>
#include <fstream>
#include <iostream>
#include <string>

#include "smbbench/core/cancel.hpp"
#include "smbbench/core/error.hpp"
#include "smbbench/data/staging.hpp"

namespace {

const std::filesystem::path kRoot = "./smbbench_test_staging_out";

smbbench::BenchConfig base_config() {
  smbbench::BenchConfig cfg{};
  cfg.target = kRoot / "target";
  cfg.source = kRoot / "source";
  cfg.test_name = "staging";
  cfg.large_file_mb = 1;
  cfg.small_file_count = 5;
  cfg.small_min_kb = 1;
  cfg.small_max_kb = 2;
  cfg.seed = 11;
  return cfg;
}

void reset_root() {
  std::error_code ec;
  std::filesystem::remove_all(kRoot, ec);
}

void write_marker(const std::filesystem::path& p) {
  std::fstream f(p, std::ios::in | std::ios::out | std::ios::binary);
  f.seekp(0);
  f.write("MARK", 4);
}

bool has_marker(const std::filesystem::path& p) {
  std::ifstream f(p, std::ios::binary);
  char buf[4] = {};
  f.read(buf, 4);
  return std::string(buf, 4) == "MARK";
}

bool test_layout() {
  const auto cfg = base_config();
  const auto layout = smbbench::make_layout(cfg);
  if (layout.remote_staging != cfg.target / "smb_bench_target_staging") {
    std::cerr << std::format("unexpected remote staging: {}\n", layout.remote_staging.string());
    return false;
  }
  if (layout.large_file() != cfg.source / "smb_bench_staging" / "large_test_file.bin") {
    std::cerr << std::format("unexpected large file path: {}\n", layout.large_file().string());
    return false;
  }
  if (layout.report_dir != cfg.source / "smb_bench_reports") {
    std::cerr << std::format("unexpected report dir: {}\n", layout.report_dir.string());
    return false;
  }
  return true;
}

bool test_large_file_generate_reuse_regenerate() {
  reset_root();
  auto cfg = base_config();
  auto layout = smbbench::prepare_local_dirs(cfg);
  if (!layout) {
    std::cerr << std::format("prepare_local_dirs failed: {}\n", layout.error().what());
    return false;
  }
  if (!std::filesystem::is_directory(layout->local_staging) ||
      !std::filesystem::is_directory(layout->report_dir)) {
    std::cerr << std::format("local directories were not created\n");
    return false;
  }

  smbbench::StagingArea first(cfg, *layout);
  auto f = first.setup_large_file();
  if (!f || std::filesystem::file_size(*f) != smbbench::kMiB) {
    std::cerr << std::format("large file not generated at configured size\n");
    return false;
  }

  write_marker(*f);
  smbbench::StagingArea again(cfg, *layout);
  auto g = again.setup_large_file();
  if (!g || !has_marker(*g)) {
    std::cerr << std::format("matching large file should be reused\n");
    return false;
  }

  cfg.large_file_mb = 2;
  smbbench::StagingArea bigger(cfg, *layout);
  auto h = bigger.setup_large_file();
  if (!h || std::filesystem::file_size(*h) != 2 * smbbench::kMiB || has_marker(*h)) {
    std::cerr << std::format("size mismatch should regenerate the large file\n");
    return false;
  }
  if (bigger.large_size_bytes() != 2 * smbbench::kMiB) {
    std::cerr << std::format("large_size_bytes mismatch\n");
    return false;
  }
  return true;
}

bool test_large_file_no_generation() {
  reset_root();
  auto cfg = base_config();
  cfg.no_generation = true;
  cfg.large_file_mb = 1000;
  auto layout = smbbench::prepare_local_dirs(cfg);
  if (!layout) {
    return false;
  }

  smbbench::StagingArea missing(cfg, *layout);
  auto r = missing.setup_large_file();
  if (r || r.error().code() != smbbench::ErrorCode::NotFound) {
    std::cerr << std::format("no-gen with missing large file should be NotFound\n");
    return false;
  }

  {
    std::ofstream out(layout->large_file(), std::ios::binary);
    const std::string half_mib(smbbench::kMiB / 2, 'x');
    out << half_mib;
  }
  smbbench::StagingArea existing(cfg, *layout);
  auto e = existing.setup_large_file();
  if (!e) {
    std::cerr << std::format("no-gen with existing file failed: {}\n", e.error().what());
    return false;
  }
  if (existing.large_size_bytes() != smbbench::kMiB / 2) {
    std::cerr << std::format("no-gen should use the actual size\n");
    return false;
  }
  if (std::fabs(existing.snapshot().large_file_mb - 0.5) > 1e-9) {
    std::cerr << std::format("snapshot large_file_mb mismatch: {}\n", existing.snapshot().large_file_mb);
    return false;
  }
  if (std::filesystem::file_size(layout->large_file()) != smbbench::kMiB / 2) {
    std::cerr << std::format("no-gen must not touch the existing file\n");
    return false;
  }
  return true;
}

bool test_small_files_generate_reuse_regenerate() {
  reset_root();
  auto cfg = base_config();
  auto layout = smbbench::prepare_local_dirs(cfg);
  if (!layout) {
    return false;
  }

  smbbench::StagingArea area(cfg, *layout);
  auto dir = area.setup_small_files();
  if (!dir) {
    std::cerr << std::format("setup_small_files failed: {}\n", dir.error().what());
    return false;
  }
  auto files = smbbench::list_bin_files(*dir);
  if (!files || files->size() != 5) {
    std::cerr << std::format("expected 5 small files\n");
    return false;
  }
  uint64_t total = 0;
  for (const auto& p : *files) {
    const auto sz = std::filesystem::file_size(p);
    if (sz < 1024 || sz > 2048) {
      std::cerr << std::format("small file size out of range: {}\n", sz);
      return false;
    }
    total += sz;
  }
  const double expected_mb = std::round(static_cast<double>(total) / smbbench::kMiB * 100.0) / 100.0;
  if (std::fabs(area.snapshot().total_small_files_mb - expected_mb) > 1e-9) {
    std::cerr << std::format("total_small_files_mb mismatch: {}\n", area.snapshot().total_small_files_mb);
    return false;
  }

  write_marker(files->front());
  smbbench::StagingArea reuse(cfg, *layout);
  auto again = reuse.setup_small_files();
  if (!again || !has_marker(files->front())) {
    std::cerr << std::format("matching small file count should be reused\n");
    return false;
  }

  cfg.small_file_count = 3;
  smbbench::StagingArea fewer(cfg, *layout);
  auto regen = fewer.setup_small_files();
  if (!regen) {
    std::cerr << std::format("regeneration failed: {}\n", regen.error().what());
    return false;
  }
  auto regen_files = smbbench::list_bin_files(*regen);
  if (!regen_files || regen_files->size() != 3) {
    std::cerr << std::format("count mismatch should regenerate exactly 3 files\n");
    return false;
  }
  if (std::filesystem::exists(*regen / "small_4.bin")) {
    std::cerr << std::format("stale small files should be wiped on regeneration\n");
    return false;
  }
  return true;
}

bool test_small_files_no_generation() {
  reset_root();
  auto cfg = base_config();
  cfg.no_generation = true;
  auto layout = smbbench::prepare_local_dirs(cfg);
  if (!layout) {
    return false;
  }

  smbbench::StagingArea empty(cfg, *layout);
  auto r = empty.setup_small_files();
  if (r || r.error().code() != smbbench::ErrorCode::NotFound) {
    std::cerr << std::format("no-gen with no small files should be NotFound\n");
    return false;
  }

  {
    std::ofstream a(layout->small_dir() / "a.bin", std::ios::binary);
    a << std::string(2048, 'a');
    std::ofstream b(layout->small_dir() / "b.bin", std::ios::binary);
    b << std::string(5120, 'b');
    std::ofstream ignored(layout->small_dir() / "notes.txt");
    ignored << "not a data file";
  }

  smbbench::StagingArea real(cfg, *layout);
  auto dir = real.setup_small_files();
  if (!dir) {
    std::cerr << std::format("no-gen small setup failed: {}\n", dir.error().what());
    return false;
  }
  const auto& snap = real.snapshot();
  if (snap.small_files_count != 2 || std::fabs(snap.small_min_kb - 2.0) > 1e-9 ||
      std::fabs(snap.small_max_kb - 5.0) > 1e-9 || std::fabs(snap.total_small_files_mb - 0.01) > 1e-9) {
    std::cerr << std::format("no-gen snapshot mismatch: count={} min={} max={} total={}\n",
                             snap.small_files_count, snap.small_min_kb, snap.small_max_kb,
                             snap.total_small_files_mb);
    return false;
  }
  if (!snap.no_generation) {
    std::cerr << std::format("snapshot should record no-generation mode\n");
    return false;
  }
  return true;
}

bool test_setup_stops_on_cancel() {
  reset_root();
  auto cfg = base_config();
  cfg.small_file_count = 50;
  auto layout = smbbench::prepare_local_dirs(cfg);
  if (!layout) {
    return false;
  }

  smbbench::StagingArea area(cfg, *layout);
  smbbench::request_cancel();
  auto small = area.setup_small_files();
  auto large = area.setup_large_file();
  smbbench::reset_cancel();

  if (small || small.error().code() != smbbench::ErrorCode::Cancelled) {
    std::cerr << std::format("small file generation should report cancellation\n");
    return false;
  }
  auto files = smbbench::list_bin_files(layout->small_dir());
  if (!files || files->size() >= cfg.small_file_count) {
    std::cerr << std::format("cancelled generation should stop before writing every small file\n");
    return false;
  }
  if (large || large.error().code() != smbbench::ErrorCode::Cancelled) {
    std::cerr << std::format("large file generation should report cancellation\n");
    return false;
  }
  return true;
}

}  // namespace

int main() {
  int rc = 0;
  if (!test_layout()) {
    rc = 1;
  } else if (!test_large_file_generate_reuse_regenerate()) {
    rc = 1;
  } else if (!test_large_file_no_generation()) {
    rc = 1;
  } else if (!test_small_files_generate_reuse_regenerate()) {
    rc = 1;
  } else if (!test_small_files_no_generation()) {
    rc = 1;
  } else if (!test_setup_stops_on_cancel()) {
    rc = 1;
  }
  reset_root();
  return rc;
}
