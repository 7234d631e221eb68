#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "smbbench/core/expected.hpp"
#include "smbbench/core/types.hpp"

namespace smbbench {

inline constexpr const char* kLocalStagingDir = "smb_bench_staging";
inline constexpr const char* kReportDir = "smb_bench_reports";
inline constexpr const char* kRemoteStagingPrefix = "smb_bench_target_";
inline constexpr const char* kLargeFileName = "large_test_file.bin";
inline constexpr const char* kSmallFilesDir = "small_files";

struct StagingLayout {
  std::filesystem::path local_staging{};
  std::filesystem::path report_dir{};
  std::filesystem::path remote_staging{};

  std::filesystem::path large_file() const { return local_staging / kLargeFileName; }
  std::filesystem::path small_dir() const { return local_staging / kSmallFilesDir; }
};

StagingLayout make_layout(const BenchConfig& cfg);

// Creates the local staging and report directories. The remote side is only
// touched by the timed phases.
Expected<StagingLayout> prepare_local_dirs(const BenchConfig& cfg);

// The *.bin files of a directory, sorted by name.
Expected<std::vector<std::filesystem::path>> list_bin_files(const std::filesystem::path& dir);

class StagingArea {
 public:
  StagingArea(const BenchConfig& cfg, StagingLayout layout);

  Expected<std::filesystem::path> setup_large_file();
  Expected<std::filesystem::path> setup_small_files();

  // Configured size, or the size found on disk in no-generation mode.
  uint64_t large_size_bytes() const { return large_size_; }
  const ConfigSnapshot& snapshot() const { return snapshot_; }
  const StagingLayout& layout() const { return layout_; }

 private:
  BenchConfig cfg_;
  StagingLayout layout_;
  ConfigSnapshot snapshot_{};
  uint64_t large_size_{0};
  uint64_t generation_{0};
};

}  // namespace smbbench
