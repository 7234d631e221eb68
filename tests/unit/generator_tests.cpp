#include <cstdint>
#include <filesystem>
#include <format>
#include <iostream>
#include <vector>

#include "generator/random_data_generator.hpp"
#include "smbbench/core/cancel.hpp"

namespace {

bool test_seeded_determinism() {
  smbbench::app::RandomDataGenerator gen1(42);
  smbbench::app::RandomDataGenerator gen2(42);
  smbbench::app::RandomDataGenerator gen3(99);

  std::vector<uint8_t> a(4096);
  std::vector<uint8_t> b(4096);
  std::vector<uint8_t> c(4096);
  gen1.fill(a);
  gen2.fill(b);
  gen3.fill(c);

  if (a != b) {
    std::cerr << std::format("Determinism failed: same seed produced different output\n");
    return false;
  }
  if (a == c) {
    std::cerr << std::format("Diversity failed: different seed produced identical output\n");
    return false;
  }
  return true;
}

bool test_zero_seed_is_resolved() {
  smbbench::app::RandomDataGenerator gen(0);
  if (gen.seed() == 0) {
    std::cerr << std::format("zero seed should be replaced by a random one\n");
    return false;
  }
  return true;
}

bool test_uniform_bounds() {
  smbbench::app::RandomDataGenerator gen(7);
  bool saw_lo = false;
  bool saw_hi = false;
  for (int i = 0; i < 20000; ++i) {
    const uint64_t v = gen.uniform(10, 14);
    if (v < 10 || v > 14) {
      std::cerr << std::format("uniform out of range: {}\n", v);
      return false;
    }
    saw_lo = saw_lo || v == 10;
    saw_hi = saw_hi || v == 14;
  }
  if (!saw_lo || !saw_hi) {
    std::cerr << std::format("uniform bounds should be inclusive\n");
    return false;
  }
  if (gen.uniform(5, 5) != 5) {
    std::cerr << std::format("degenerate range should return its only value\n");
    return false;
  }
  return true;
}

bool test_generate_file_sizes() {
  const std::filesystem::path out_dir = "./smbbench_test_generator_out";
  std::error_code ec;
  std::filesystem::remove_all(out_dir, ec);
  std::filesystem::create_directories(out_dir, ec);

  smbbench::app::RandomDataGenerator gen(3);
  const std::vector<uint64_t> sizes{
      0, 1, 4097, smbbench::app::RandomDataGenerator::kChunkSize,
      smbbench::app::RandomDataGenerator::kChunkSize * 2 + 123};
  for (const auto size : sizes) {
    const auto p = out_dir / std::format("f_{}.bin", size);
    auto st = gen.generate_file(p, size);
    if (!st) {
      std::cerr << std::format("generate_file failed: {}\n", st.error().what());
      return false;
    }
    const auto actual = std::filesystem::file_size(p, ec);
    if (ec || actual != size) {
      std::cerr << std::format("size mismatch for {}: {}\n", size, actual);
      return false;
    }
  }

  auto bad = gen.generate_file(out_dir / "missing_dir" / "x.bin", 16);
  if (bad || bad.error().code() != smbbench::ErrorCode::IoError) {
    std::cerr << std::format("expected io error for unwritable path\n");
    return false;
  }

  std::filesystem::remove_all(out_dir, ec);
  return true;
}

bool test_generate_file_stops_on_cancel() {
  const std::filesystem::path out_dir = "./smbbench_test_generator_cancel";
  std::error_code ec;
  std::filesystem::remove_all(out_dir, ec);
  std::filesystem::create_directories(out_dir, ec);

  smbbench::app::RandomDataGenerator gen(5);
  const auto p = out_dir / "big.bin";
  const uint64_t size = smbbench::app::RandomDataGenerator::kChunkSize * 4;

  smbbench::request_cancel();
  auto st = gen.generate_file(p, size);
  smbbench::reset_cancel();

  bool ok = true;
  if (st || st.error().code() != smbbench::ErrorCode::Cancelled) {
    std::cerr << std::format("pending cancellation should stop generation\n");
    ok = false;
  } else if (std::filesystem::file_size(p, ec) >= size) {
    std::cerr << std::format("cancelled generation should not write the full size\n");
    ok = false;
  }

  std::filesystem::remove_all(out_dir, ec);
  return ok;
}

}  // namespace

int main() {
  if (!test_seeded_determinism()) {
    return 1;
  }
  if (!test_zero_seed_is_resolved()) {
    return 1;
  }
  if (!test_uniform_bounds()) {
    return 1;
  }
  if (!test_generate_file_sizes()) {
    return 1;
  }
  if (!test_generate_file_stops_on_cancel()) {
    return 1;
  }
  return 0;
}
