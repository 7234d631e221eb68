#pragma once

#include <string>

#include "smbbench/core/types.hpp"

namespace smbbench::app {

enum class ExitCode : int {
  Ok = 0,
  RunError = 1,
  BadArguments = 2,
  Cancelled = 130,
};

struct CliOptions {
  BenchConfig bench{};
  bool aggregate_only{false};
  std::string executable_path;
};

}  // namespace smbbench::app
