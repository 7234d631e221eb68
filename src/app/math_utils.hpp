#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "smbbench/core/types.hpp"

namespace smbbench::app {

double round_to(double v, int decimals);
AggregateStat calc_stats(std::vector<double> values);
double bytes_to_mib(uint64_t bytes);
uint64_t xorshift64(uint64_t& s);
uint64_t splitmix64(uint64_t& s);

}  // namespace smbbench::app
