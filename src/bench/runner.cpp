#include "smbbench/bench/runner.hpp"

#include <chrono>
#include <format>
#include <iostream>
#include <optional>
#include <random>
#include <system_error>
#include <utility>
#include <vector>

#include "app/fs_utils.hpp"
#include "app/math_utils.hpp"
#include "smbbench/bench/metrics.hpp"
#include "smbbench/core/cancel.hpp"

namespace smbbench {
namespace {

using Clock = std::chrono::steady_clock;
using app::ensure_dir;

Expected<void> check_cancel() {
  if (cancel_requested()) {
    return make_error(ErrorCode::Cancelled, "cancelled by user");
  }
  return {};
}

void remove_quietly(const std::filesystem::path& p) {
  std::error_code ec;
  std::filesystem::remove_all(p, ec);
  if (ec) {
    std::cerr << std::format("[WARN] Could not remove {}: {}\n", p.string(), ec.message());
  }
}

double seconds_since(Clock::time_point start) {
  return std::chrono::duration<double>(Clock::now() - start).count();
}

void print_large(const char* direction, const std::optional<TransferMetrics>& m) {
  if (!m) {
    std::cout << std::format("-> {}: completed below timer resolution\n", direction);
    return;
  }
  std::cout << std::format("-> {}: {}s | {} MB/s ({} Mbps)\n", direction, m->seconds, m->mb_s, m->mbps);
}

void print_small(const char* direction, const std::optional<TransferMetrics>& m) {
  if (!m) {
    std::cout << std::format("-> {}: completed below timer resolution\n", direction);
    return;
  }
  std::cout << std::format("-> {}: {}s | {} files/sec | {} MB/s\n", direction, m->seconds, m->files_sec,
                           m->mb_s);
}

}  // namespace

BenchRunner::BenchRunner(const StagingLayout& layout, IFileCopier& copier)
    : layout_(layout), copier_(copier) {}

Expected<PhaseResult> BenchRunner::run_large_test(const std::filesystem::path& local_file,
                                                  uint64_t size_bytes) {
  std::cout << "\n--- Starting Large File Test (Throughput) ---\n";
  const auto remote_file = layout_.remote_staging / local_file.filename();
  auto mk = ensure_dir(layout_.remote_staging);
  if (!mk) {
    return forward_error(mk.error());
  }

  PhaseResult out{};
  out.ran = true;

  std::cout << std::format("Uploading {} to {}...\n", local_file.filename().string(),
                           layout_.remote_staging.string());
  if (auto c = check_cancel(); !c) {
    return forward_error(c.error());
  }
  auto start = Clock::now();
  auto up = copier_.copy(local_file, remote_file);
  double duration = seconds_since(start);
  if (!up) {
    return forward_error(up.error());
  }
  out.upload = calculate_metrics(size_bytes, duration);
  print_large("Upload", out.upload);

  const auto local_temp = layout_.local_staging / std::format("download_temp_{}.bin", make_uuid4());
  std::cout << "Downloading back to local...\n";

  auto fl = copier_.flush();
  if (!fl) {
    return forward_error(fl.error());
  }
  if (auto c = check_cancel(); !c) {
    return forward_error(c.error());
  }

  start = Clock::now();
  auto down = copier_.copy(remote_file, local_temp);
  duration = seconds_since(start);
  if (!down) {
    remove_quietly(local_temp);
    return forward_error(down.error());
  }
  out.download = calculate_metrics(size_bytes, duration);
  print_large("Download", out.download);

  remove_quietly(local_temp);
  remove_quietly(remote_file);
  return out;
}

Expected<PhaseResult> BenchRunner::run_small_test(const std::filesystem::path& local_dir) {
  std::cout << "\n--- Starting Small File Test (Latency/Metadata) ---\n";

  auto files = list_bin_files(local_dir);
  if (!files) {
    return forward_error(files.error());
  }
  if (files->empty()) {
    std::cout << std::format("[INFO] No .bin files in {}, skipping small file test.\n", local_dir.string());
    return PhaseResult{};
  }

  uint64_t total_size = 0;
  for (const auto& f : *files) {
    auto sz = app::file_size_of(f);
    if (!sz) {
      return forward_error(sz.error());
    }
    total_size += *sz;
  }
  const uint64_t file_count = files->size();

  const auto remote_dir = layout_.remote_staging / kRemoteSmallDir;
  auto mk = ensure_dir(remote_dir);
  if (!mk) {
    return forward_error(mk.error());
  }

  PhaseResult out{};
  out.ran = true;

  std::cout << std::format("Uploading {} files ({:.2f} MB total)...\n", file_count,
                           app::bytes_to_mib(total_size));
  auto start = Clock::now();
  for (const auto& f : *files) {
    if (auto c = check_cancel(); !c) {
      return forward_error(c.error());
    }
    auto st = copier_.copy(f, remote_dir / f.filename());
    if (!st) {
      return forward_error(st.error());
    }
  }
  double duration = seconds_since(start);
  out.upload = calculate_metrics(total_size, duration, file_count);
  print_small("Upload", out.upload);

  const auto local_temp_dir = layout_.local_staging / kLocalSmallDownDir;
  mk = ensure_dir(local_temp_dir);
  if (!mk) {
    return forward_error(mk.error());
  }

  std::cout << "Downloading batch back to local...\n";
  start = Clock::now();
  for (const auto& f : *files) {
    if (auto c = check_cancel(); !c) {
      remove_quietly(local_temp_dir);
      return forward_error(c.error());
    }
    auto st = copier_.copy(remote_dir / f.filename(), local_temp_dir / f.filename());
    if (!st) {
      remove_quietly(local_temp_dir);
      return forward_error(st.error());
    }
  }
  duration = seconds_since(start);
  out.download = calculate_metrics(total_size, duration, file_count);
  print_small("Download", out.download);

  remove_quietly(local_temp_dir);
  remove_quietly(remote_dir);
  return out;
}

RemoteCleanup::RemoteCleanup(std::filesystem::path remote_staging)
    : remote_(std::move(remote_staging)) {}

RemoteCleanup::~RemoteCleanup() { static_cast<void>(cleanup()); }

bool RemoteCleanup::cleanup() noexcept {
  if (done_) {
    return true;
  }
  done_ = true;

  std::error_code ec;
  if (!std::filesystem::exists(remote_, ec)) {
    if (ec) {
      std::cerr << "[WARN] Could not fully clean remote directory: " << ec.message() << "\n";
      return false;
    }
    return true;
  }
  std::filesystem::remove_all(remote_, ec);
  if (ec) {
    std::cerr << "[WARN] Could not fully clean remote directory: " << ec.message() << "\n";
    return false;
  }
  return true;
}

std::string make_uuid4() {
  std::random_device rd;
  uint64_t s = (static_cast<uint64_t>(rd()) << 32) | rd();
  const uint64_t hi = app::splitmix64(s);
  const uint64_t lo = app::splitmix64(s);

  const auto time_low = static_cast<uint32_t>(hi >> 32);
  const auto time_mid = static_cast<uint16_t>(hi >> 16);
  const auto time_hi = static_cast<uint16_t>((hi & 0x0fffULL) | 0x4000ULL);
  const auto clock_seq = static_cast<uint16_t>(((lo >> 48) & 0x3fffULL) | 0x8000ULL);
  const uint64_t node = lo & 0xffffffffffffULL;
  return std::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}", time_low, time_mid, time_hi, clock_seq, node);
}

}  // namespace smbbench
