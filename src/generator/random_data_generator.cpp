#include "generator/random_data_generator.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <random>
#include <string>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

#include "app/math_utils.hpp"
#include "smbbench/core/cancel.hpp"

namespace smbbench::app {
namespace {

uint64_t resolve_seed(uint64_t seed) {
  if (seed != 0) {
    return seed;
  }
  std::random_device rd;
  const uint64_t hi = rd();
  const uint64_t lo = rd();
  const uint64_t s = (hi << 32) | lo;
  return s == 0 ? 1 : s;
}

Expected<void> write_all_fd(int fd, const uint8_t* data, size_t size) {
  size_t done = 0;
  while (done < size) {
    const ssize_t n = ::write(fd, data + done, size - done);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return make_error(ErrorCode::IoError, "write failed: " + std::string(std::strerror(errno)));
    }
    done += static_cast<size_t>(n);
  }
  return {};
}

Expected<int> open_file_write(const std::filesystem::path& p) {
  const int fd = ::open(p.c_str(), O_CREAT | O_TRUNC | O_WRONLY, 0644);
  if (fd < 0) {
    return make_error(ErrorCode::IoError,
                      "open for write failed: " + p.string() + ": " + std::strerror(errno));
  }
  return fd;
}

}  // namespace

RandomDataGenerator::RandomDataGenerator(uint64_t seed) : seed_(resolve_seed(seed)) {
  uint64_t s = seed_;
  state_ = splitmix64(s);
  if (state_ == 0) {
    state_ = 0x9e3779b97f4a7c15ULL;
  }
}

uint64_t RandomDataGenerator::next() { return xorshift64(state_); }

uint64_t RandomDataGenerator::uniform(uint64_t lo, uint64_t hi) {
  if (hi <= lo) {
    return lo;
  }
  const uint64_t span = hi - lo;
  if (span == UINT64_MAX) {
    return next();
  }
  return lo + next() % (span + 1);
}

void RandomDataGenerator::fill(std::span<uint8_t> out) {
  size_t i = 0;
  while (i + sizeof(uint64_t) <= out.size()) {
    const uint64_t v = next();
    std::memcpy(out.data() + i, &v, sizeof(v));
    i += sizeof(v);
  }
  if (i < out.size()) {
    const uint64_t v = next();
    std::memcpy(out.data() + i, &v, out.size() - i);
  }
}

Expected<void> RandomDataGenerator::generate_file(const std::filesystem::path& path,
                                                  uint64_t size_bytes) {
  auto fd = open_file_write(path);
  if (!fd) {
    return forward_error(fd.error());
  }

  std::vector<uint8_t> chunk(static_cast<size_t>(std::min<uint64_t>(size_bytes, kChunkSize)));
  fill(chunk);

  uint64_t written = 0;
  while (written < size_bytes) {
    if (cancel_requested()) {
      ::close(*fd);
      return make_error(ErrorCode::Cancelled, "generation cancelled: " + path.string());
    }
    const auto n = static_cast<size_t>(std::min<uint64_t>(size_bytes - written, chunk.size()));
    auto w = write_all_fd(*fd, chunk.data(), n);
    if (!w) {
      ::close(*fd);
      return forward_error(w.error());
    }
    written += n;
  }

  if (::close(*fd) != 0) {
    return make_error(ErrorCode::IoError,
                      "close failed: " + path.string() + ": " + std::strerror(errno));
  }
  return {};
}

}  // namespace smbbench::app
