#pragma once

#include <filesystem>
#include <memory>
#include <string_view>

#include "smbbench/core/expected.hpp"

namespace smbbench {

struct CopierCaps {
  bool preserves_mode{false};
  bool preserves_times{false};
};

// One whole-file copy per call. Network semantics belong to whatever
// filesystem the paths live on.
class IFileCopier {
 public:
  virtual ~IFileCopier() = default;

  virtual std::string_view name() const noexcept = 0;
  virtual CopierCaps capabilities() const noexcept = 0;

  virtual Expected<void> copy(const std::filesystem::path& src,
                              const std::filesystem::path& dst) noexcept = 0;
  // Pushes dirty pages out so a following read does not come from the
  // write-back cache.
  virtual Expected<void> flush() noexcept = 0;
};

std::unique_ptr<IFileCopier> make_native_copier();

}  // namespace smbbench
