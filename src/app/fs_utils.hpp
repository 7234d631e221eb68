#pragma once

#include <cstdint>
#include <filesystem>

#include "smbbench/core/expected.hpp"

namespace smbbench::app {

// create_directories with the failure turned into an IoError.
Expected<void> ensure_dir(const std::filesystem::path& p);
Expected<uint64_t> file_size_of(const std::filesystem::path& p);

}  // namespace smbbench::app
