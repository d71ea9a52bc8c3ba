#include "flyguide/prep/config.hpp"

#include <string>
#include <string_view>

#include <simdjson.h>

#include "flyguide/common/errors.hpp"

namespace flyguide::prep {
namespace {

void readName(simdjson::dom::object& section,
              std::string_view key,
              std::string& target,
              const std::filesystem::path& path) {
  auto value = section[key];
  if (value.error() == simdjson::NO_SUCH_FIELD) {
    return;
  }
  auto text = value.get_string();
  if (text.error() != simdjson::SUCCESS) {
    throw common::ConfigError("config " + path.string() + ": '" + std::string(key) + "' must be a string");
  }
  if (text.value().empty()) {
    throw common::ConfigError("config " + path.string() + ": '" + std::string(key) + "' must not be empty");
  }
  target = std::string(text.value());
}

}  // namespace

PrepConfig loadPrepConfig(const std::filesystem::path& path) {
  simdjson::dom::parser parser;
  simdjson::dom::element doc;
  if (auto error = parser.load(path.string()).get(doc); error) {
    throw common::ConfigError("Failed to load config " + path.string() + ": " + simdjson::error_message(error));
  }
  simdjson::dom::object obj;
  if (doc.get_object().get(obj) != simdjson::SUCCESS) {
    throw common::ConfigError("config " + path.string() + " must be a JSON object");
  }

  PrepConfig config;
  if (auto level = obj["log_level"].get_string(); level.error() == simdjson::SUCCESS) {
    const std::string name(level.value());
    config.log_level = spdlog::level::from_str(name);
    if (config.log_level == spdlog::level::off && name != "off") {
      throw common::ConfigError("config " + path.string() + ": unknown log_level '" + name + "'");
    }
  } else if (level.error() != simdjson::NO_SUCH_FIELD) {
    throw common::ConfigError("config " + path.string() + ": 'log_level' must be a string");
  }

  if (auto columns = obj["columns"].get_object(); columns.error() == simdjson::SUCCESS) {
    auto section = columns.value();
    readName(section, "species", config.columns.species, path);
    readName(section, "genus", config.columns.genus, path);
    readName(section, "kingdom", config.columns.kingdom, path);
  } else if (columns.error() != simdjson::NO_SUCH_FIELD) {
    throw common::ConfigError("config " + path.string() + ": 'columns' must be an object");
  }

  if (auto outputs = obj["outputs"].get_object(); outputs.error() == simdjson::SUCCESS) {
    auto section = outputs.value();
    readName(section, "search_suffix", config.outputs.search, path);
    readName(section, "kingdom_suffix", config.outputs.kingdom, path);
    if (config.outputs.search == config.outputs.kingdom) {
      throw common::ConfigError("config " + path.string() + ": output suffixes must differ");
    }
  } else if (outputs.error() != simdjson::NO_SUCH_FIELD) {
    throw common::ConfigError("config " + path.string() + ": 'outputs' must be an object");
  }
  return config;
}

}  // namespace flyguide::prep
