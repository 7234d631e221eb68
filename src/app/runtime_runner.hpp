#pragma once

#include "app/config_types.hpp"
#include "smbbench/core/expected.hpp"
#include "smbbench/core/types.hpp"
#include "smbbench/data/staging.hpp"
#include "smbbench/transfer/copier.hpp"

int run_cli_impl(int argc, char** argv);

namespace smbbench::app {

Expected<CliOptions> parse_args(int argc, const char* const argv[]);
Expected<void> validate_config(const BenchConfig& cfg);

// Sets up the staging data once, then runs both timed tests cfg.runs times.
// Remote cleanup is left to the caller.
Expected<Report> run_benchmark(const BenchConfig& cfg, const StagingLayout& layout, IFileCopier& copier);

}  // namespace smbbench::app
