#include "smbbench/transfer/copier.hpp"

#include <cerrno>
#include <cstring>
#include <string>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace smbbench {
namespace {

// Shares mounted without unix extensions refuse chmod/utimes; the copy itself
// still counts.
bool metadata_unsupported(int err) {
  return err == EPERM || err == EACCES || err == ENOTSUP || err == EOPNOTSUPP || err == EROFS;
}

class NativeCopier final : public IFileCopier {
 public:
  std::string_view name() const noexcept override { return "native"; }

  CopierCaps capabilities() const noexcept override {
    CopierCaps caps{};
    caps.preserves_mode = true;
    caps.preserves_times = true;
    return caps;
  }

  Expected<void> copy(const std::filesystem::path& src,
                      const std::filesystem::path& dst) noexcept override {
    struct stat st {};
    if (::stat(src.c_str(), &st) != 0) {
      return make_error(errno == ENOENT ? ErrorCode::NotFound : ErrorCode::IoError,
                        "stat failed: " + src.string() + ": " + std::strerror(errno));
    }

    std::error_code ec;
    std::filesystem::copy_file(src, dst, std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
      return make_error(ErrorCode::IoError,
                        "copy failed: " + src.string() + " -> " + dst.string() + ": " + ec.message());
    }

    if (::chmod(dst.c_str(), st.st_mode & 07777) != 0 && !metadata_unsupported(errno)) {
      return make_error(ErrorCode::IoError,
                        "chmod failed: " + dst.string() + ": " + std::strerror(errno));
    }

    const struct timespec times[2] = {st.st_atim, st.st_mtim};
    if (::utimensat(AT_FDCWD, dst.c_str(), times, 0) != 0 && !metadata_unsupported(errno)) {
      return make_error(ErrorCode::IoError,
                        "utimensat failed: " + dst.string() + ": " + std::strerror(errno));
    }
    return {};
  }

  Expected<void> flush() noexcept override {
    ::sync();
    return {};
  }
};

}  // namespace

std::unique_ptr<IFileCopier> make_native_copier() { return std::make_unique<NativeCopier>(); }

}  // namespace smbbench
