#include "app/math_utils.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace smbbench::app {

double round_to(double v, int decimals) {
  const double scale = std::pow(10.0, decimals);
  return std::round(v * scale) / scale;
}

AggregateStat calc_stats(std::vector<double> values) {
  AggregateStat out{};
  if (values.empty()) {
    return out;
  }
  const auto [lo, hi] = std::minmax_element(values.begin(), values.end());
  out.min = *lo;
  out.max = *hi;
  const double sum = std::accumulate(values.begin(), values.end(), 0.0);
  out.avg = sum / static_cast<double>(values.size());
  out.samples = values.size();
  return out;
}

double bytes_to_mib(uint64_t bytes) {
  return static_cast<double>(bytes) / static_cast<double>(kMiB);
}

uint64_t xorshift64(uint64_t& s) {
  s ^= s << 13;
  s ^= s >> 7;
  s ^= s << 17;
  return s;
}

uint64_t splitmix64(uint64_t& s) {
  uint64_t z = (s += 0x9e3779b97f4a7c15ULL);
  z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
  z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
  return z ^ (z >> 31);
}

}  // namespace smbbench::app
