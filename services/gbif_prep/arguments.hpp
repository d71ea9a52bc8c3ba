#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "flyguide/prep/config.hpp"

namespace flyguide::services::gbif_prep {

struct Arguments {
  std::filesystem::path input;
  std::string output_prefix;
};

std::string usageText(std::string_view program);

// Expects exactly two positional arguments. Throws UsageError otherwise.
Arguments parseArguments(int argc, const char* const* argv);

std::optional<std::filesystem::path> configPathFromEnv(const char* env_value);
std::optional<std::filesystem::path> configPathFromEnv();

// Defaults unless FLYGUIDE_CONFIG names a config file.
prep::PrepConfig loadConfigFromEnvironment();

}  // namespace flyguide::services::gbif_prep
