#include "app/fs_utils.hpp"

#include <string>
#include <system_error>

namespace smbbench::app {

Expected<void> ensure_dir(const std::filesystem::path& p) {
  std::error_code ec;
  std::filesystem::create_directories(p, ec);
  if (ec) {
    return make_error(ErrorCode::IoError, "create directory failed: " + p.string() + ": " + ec.message());
  }
  return {};
}

Expected<uint64_t> file_size_of(const std::filesystem::path& p) {
  std::error_code ec;
  const auto size = std::filesystem::file_size(p, ec);
  if (ec) {
    return make_error(ErrorCode::IoError, "stat failed: " + p.string() + ": " + ec.message());
  }
  return static_cast<uint64_t>(size);
}

}  // namespace smbbench::app
