#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "smbbench/core/expected.hpp"
#include "smbbench/core/types.hpp"
#include "smbbench/data/staging.hpp"
#include "smbbench/transfer/copier.hpp"

namespace smbbench {

inline constexpr const char* kRemoteSmallDir = "small_files_remote";
inline constexpr const char* kLocalSmallDownDir = "small_files_temp_down";

class BenchRunner {
 public:
  BenchRunner(const StagingLayout& layout, IFileCopier& copier);

  // Upload then download of one file. size_bytes is the figure the rates are
  // computed from.
  Expected<PhaseResult> run_large_test(const std::filesystem::path& local_file,
                                       uint64_t size_bytes);

  // Sequential upload then download of every *.bin in local_dir.
  Expected<PhaseResult> run_small_test(const std::filesystem::path& local_dir);

 private:
  const StagingLayout& layout_;
  IFileCopier& copier_;
};

// Removes the remote staging directory when it goes out of scope, whatever
// path the run took. Failures are reported, never thrown.
class RemoteCleanup {
 public:
  explicit RemoteCleanup(std::filesystem::path remote_staging);
  ~RemoteCleanup();

  RemoteCleanup(const RemoteCleanup&) = delete;
  RemoteCleanup& operator=(const RemoteCleanup&) = delete;

  // Returns false when something was left behind. Later calls are no-ops.
  bool cleanup() noexcept;

 private:
  std::filesystem::path remote_;
  bool done_{false};
};

std::string make_uuid4();

}  // namespace smbbench
