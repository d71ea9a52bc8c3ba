#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <iostream>

#include "flyguide/common/errors.hpp"
#include "flyguide/prep/pipeline.hpp"
#include "services/gbif_prep/arguments.hpp"

int main(int argc, char** argv) {
  spdlog::set_default_logger(spdlog::stderr_color_mt("gbif_prep"));

  try {
    const auto arguments = flyguide::services::gbif_prep::parseArguments(argc, argv);
    const auto config = flyguide::services::gbif_prep::loadConfigFromEnvironment();
    spdlog::set_level(config.log_level);

    const auto summary = flyguide::prep::runPrep(arguments.input, arguments.output_prefix, config);
    spdlog::info(flyguide::prep::formatSummary(summary));
  } catch (const flyguide::common::UsageError&) {
    std::cerr << flyguide::services::gbif_prep::usageText(argc > 0 ? argv[0] : "gbif_prep");
    return 1;
  } catch (const flyguide::common::MissingColumnsError& ex) {
    spdlog::error("GBIF file is missing required columns (matched case-insensitively)");
    spdlog::error("  Missing: {}", flyguide::common::formatNameList(ex.missing()));
    spdlog::error("  Found: {}", flyguide::common::formatNameList(ex.found()));
    return 1;
  } catch (const std::exception& ex) {
    spdlog::error("gbif_prep failed: {}", ex.what());
    return 1;
  }
  return 0;
}
