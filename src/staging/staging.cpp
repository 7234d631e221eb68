#include "smbbench/data/staging.hpp"

#include <algorithm>
#include <format>
#include <iostream>
#include <system_error>
#include <utility>

#include "app/fs_utils.hpp"
#include "app/math_utils.hpp"
#include "generator/random_data_generator.hpp"
#include "smbbench/core/cancel.hpp"

namespace smbbench {

using app::bytes_to_mib;
using app::ensure_dir;
using app::file_size_of;
using app::round_to;

StagingLayout make_layout(const BenchConfig& cfg) {
  StagingLayout layout{};
  layout.local_staging = cfg.source / kLocalStagingDir;
  layout.report_dir = cfg.source / kReportDir;
  layout.remote_staging = cfg.target / (std::string(kRemoteStagingPrefix) + cfg.test_name);
  return layout;
}

Expected<StagingLayout> prepare_local_dirs(const BenchConfig& cfg) {
  auto layout = make_layout(cfg);
  auto st = ensure_dir(layout.local_staging);
  if (!st) {
    return forward_error(st.error());
  }
  auto rp = ensure_dir(layout.report_dir);
  if (!rp) {
    return forward_error(rp.error());
  }
  return layout;
}

Expected<std::vector<std::filesystem::path>> list_bin_files(const std::filesystem::path& dir) {
  std::vector<std::filesystem::path> files;
  std::error_code ec;
  std::filesystem::directory_iterator it(dir, ec);
  if (ec) {
    return make_error(ErrorCode::IoError, "list directory failed: " + dir.string() + ": " + ec.message());
  }
  for (const auto& entry : it) {
    if (entry.path().extension() == ".bin" && entry.is_regular_file(ec)) {
      files.push_back(entry.path());
    }
  }
  std::sort(files.begin(), files.end());
  return files;
}

StagingArea::StagingArea(const BenchConfig& cfg, StagingLayout layout)
    : cfg_(cfg), layout_(std::move(layout)), large_size_(cfg.large_file_mb * kMiB) {
  snapshot_.no_generation = cfg.no_generation;
  snapshot_.large_file_mb = static_cast<double>(cfg.large_file_mb);
  snapshot_.small_files_count = cfg.small_file_count;
  snapshot_.small_min_kb = static_cast<double>(cfg.small_min_kb);
  snapshot_.small_max_kb = static_cast<double>(cfg.small_max_kb);
  snapshot_.total_small_files_mb = 0.0;
}

Expected<std::filesystem::path> StagingArea::setup_large_file() {
  const auto fpath = layout_.large_file();
  std::error_code ec;
  const bool exists = std::filesystem::exists(fpath, ec);

  if (cfg_.no_generation) {
    if (!exists) {
      return make_error(ErrorCode::NotFound,
                        std::format("No-Gen Mode enabled but {} not found.", fpath.string()));
    }
    auto actual = file_size_of(fpath);
    if (!actual) {
      return forward_error(actual.error());
    }
    std::cout << std::format("[INFO] No-Gen Mode: Using existing large file ({:.2f} MB)\n",
                             bytes_to_mib(*actual));
    large_size_ = *actual;
    snapshot_.large_file_mb = round_to(bytes_to_mib(*actual), 2);
    return fpath;
  }

  if (exists) {
    auto actual = file_size_of(fpath);
    if (actual && *actual == large_size_) {
      std::cout << std::format("[INFO] Using existing large file: {}\n", fpath.string());
      return fpath;
    }
  }

  std::cout << std::format("[SETUP] Generating {:.2f} MB large file...\n", bytes_to_mib(large_size_));
  app::RandomDataGenerator gen(cfg_.seed == 0 ? 0 : cfg_.seed + generation_++);
  auto gen_st = gen.generate_file(fpath, large_size_);
  if (!gen_st) {
    return forward_error(gen_st.error());
  }
  return fpath;
}

Expected<std::filesystem::path> StagingArea::setup_small_files() {
  const auto small_dir = layout_.small_dir();
  auto mk = ensure_dir(small_dir);
  if (!mk) {
    return forward_error(mk.error());
  }

  auto existing = list_bin_files(small_dir);
  if (!existing) {
    return forward_error(existing.error());
  }

  uint64_t total_size = 0;
  uint64_t min_size = UINT64_MAX;
  uint64_t max_size = 0;
  const auto measure = [&]() -> Expected<void> {
    for (const auto& f : *existing) {
      auto sz = file_size_of(f);
      if (!sz) {
        return forward_error(sz.error());
      }
      total_size += *sz;
      min_size = std::min(min_size, *sz);
      max_size = std::max(max_size, *sz);
    }
    return {};
  };

  if (cfg_.no_generation) {
    if (existing->empty()) {
      return make_error(ErrorCode::NotFound,
                        std::format("No-Gen Mode enabled but no .bin files found in {}",
                                    small_dir.string()));
    }
    std::cout << std::format("[INFO] No-Gen Mode: Using {} existing small files.\n", existing->size());
    auto m = measure();
    if (!m) {
      return forward_error(m.error());
    }
    snapshot_.small_files_count = existing->size();
    snapshot_.small_min_kb = round_to(static_cast<double>(min_size) / kKiB, 2);
    snapshot_.small_max_kb = round_to(static_cast<double>(max_size) / kKiB, 2);
    snapshot_.total_small_files_mb = round_to(bytes_to_mib(total_size), 2);
    std::cout << std::format("       -> Total Size: {:.2f} MB\n", bytes_to_mib(total_size));
    return small_dir;
  }

  if (existing->size() == cfg_.small_file_count) {
    std::cout << std::format("[INFO] Using {} existing small files.\n", existing->size());
    auto m = measure();
    if (!m) {
      return forward_error(m.error());
    }
    snapshot_.total_small_files_mb = round_to(bytes_to_mib(total_size), 2);
    return small_dir;
  }

  const uint64_t min_bytes = cfg_.small_min_kb * kKiB;
  const uint64_t max_bytes = cfg_.small_max_kb * kKiB;
  std::cout << std::format("[SETUP] Generating {} small files ({:.1f}KB - {:.1f}KB)...\n",
                           cfg_.small_file_count, static_cast<double>(min_bytes) / kKiB,
                           static_cast<double>(max_bytes) / kKiB);

  std::error_code ec;
  std::filesystem::remove_all(small_dir, ec);
  mk = ensure_dir(small_dir);
  if (!mk) {
    return forward_error(mk.error());
  }

  app::RandomDataGenerator gen(cfg_.seed == 0 ? 0 : cfg_.seed + generation_++);
  uint64_t total_gen_size = 0;
  for (uint64_t i = 0; i < cfg_.small_file_count; ++i) {
    if (cancel_requested()) {
      return make_error(ErrorCode::Cancelled,
                        std::format("cancelled after {} of {} small files", i, cfg_.small_file_count));
    }
    const uint64_t size = gen.uniform(min_bytes, max_bytes);
    auto st = gen.generate_file(small_dir / std::format("small_{}.bin", i), size);
    if (!st) {
      return forward_error(st.error());
    }
    total_gen_size += size;
  }

  std::cout << std::format("[SETUP] Total small files size: {:.2f} MB\n", bytes_to_mib(total_gen_size));
  snapshot_.total_small_files_mb = round_to(bytes_to_mib(total_gen_size), 2);
  return small_dir;
}

}  // namespace smbbench
