#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>

#include "smbbench/core/expected.hpp"

namespace smbbench::app {

class RandomDataGenerator {
 public:
  static constexpr size_t kChunkSize = 1024 * 1024;

  // A zero seed draws one from std::random_device.
  explicit RandomDataGenerator(uint64_t seed);

  uint64_t next();
  // Inclusive on both ends.
  uint64_t uniform(uint64_t lo, uint64_t hi);
  void fill(std::span<uint8_t> out);

  // Writes exactly size_bytes, repeating one random chunk of at most
  // kChunkSize bytes. A pending cancellation stops it between chunks and
  // leaves the partial file behind.
  Expected<void> generate_file(const std::filesystem::path& path, uint64_t size_bytes);

  uint64_t seed() const { return seed_; }

 private:
  uint64_t seed_;
  uint64_t state_;
};

}  // namespace smbbench::app
