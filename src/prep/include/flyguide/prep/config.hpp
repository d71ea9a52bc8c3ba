#pragma once

#include <filesystem>

#include <spdlog/common.h>

#include "flyguide/prep/columns.hpp"
#include "flyguide/prep/writer.hpp"

namespace flyguide::prep {

struct PrepConfig {
  ColumnNames columns;
  OutputSuffixes outputs;
  spdlog::level::level_enum log_level{spdlog::level::info};
};

// Reads a JSON config. Every key is optional; absent keys keep their defaults.
// Throws ConfigError when the file cannot be parsed or a value is unusable.
PrepConfig loadPrepConfig(const std::filesystem::path& path);

}  // namespace flyguide::prep
