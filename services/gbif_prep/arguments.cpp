#include "services/gbif_prep/arguments.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

#include <spdlog/spdlog.h>

#include "flyguide/common/errors.hpp"

namespace flyguide::services::gbif_prep {

std::string usageText(std::string_view program) {
  std::string usage = "Usage: ";
  usage.append(program).append(" GBIF_download.csv OUTPREFIX\n");
  usage.append(
      "  GBIF_download.csv : GBIF occurrence or checklist file (CSV or TSV; must contain columns "
      "'species', 'genus', 'kingdom')\n"
      "  OUTPREFIX         : prefix for generated files (OUTPREFIX_species_search.txt, "
      "OUTPREFIX_species_kingdom.tsv)\n"
      "Environment:\n"
      "  FLYGUIDE_CONFIG   : optional JSON config (log_level, columns, outputs)\n");
  return usage;
}

Arguments parseArguments(int argc, const char* const* argv) {
  if (argc != 3) {
    throw common::UsageError("expected 2 arguments, got " + std::to_string(std::max(argc - 1, 0)));
  }
  return Arguments{argv[1], argv[2]};
}

std::optional<std::filesystem::path> configPathFromEnv(const char* env_value) {
  if (!env_value) {
    return std::nullopt;
  }
  std::string_view value(env_value);
  const auto blank = std::all_of(value.begin(), value.end(), [](unsigned char ch) {
    return std::isspace(ch) != 0;
  });
  if (blank) {
    return std::nullopt;
  }
  return std::filesystem::path(value);
}

std::optional<std::filesystem::path> configPathFromEnv() {
  return configPathFromEnv(std::getenv("FLYGUIDE_CONFIG"));
}

prep::PrepConfig loadConfigFromEnvironment() {
  const auto path = configPathFromEnv();
  if (!path) {
    return {};
  }
  spdlog::debug("Loading config {}", path->string());
  return prep::loadPrepConfig(*path);
}

}  // namespace flyguide::services::gbif_prep
