#include "config_loader.h"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <system_error>
#include <vector>

#include "compare_error.h"

namespace {

[[noreturn]] void throw_config_error(const std::string& source,
                                     const std::string& message) {
  ErrorContext context;
  context.source_a = source;
  throw CompareError(ErrorKind::ConfigError, source + ": " + message, context);
}

}  // namespace

ConfigLoader::ConfigLoader(const PrintLevel& print_settings)
    : print(print_settings) {}

bool ConfigLoader::merge_file(const std::string& path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return false;
  }
  std::ifstream infile(path);
  if (!infile.is_open()) {
    throw_config_error(path, "settings file exists but cannot be opened.");
  }
  nlohmann::json settings;
  try {
    settings = nlohmann::json::parse(infile);
  } catch (const nlohmann::json::parse_error& e) {
    throw_config_error(path,
                       "file exists, but contains invalid JSON. Remove the "
                       "file or fix it before running again (" +
                           std::string(e.what()) + ").");
  }
  merge_json(settings, path);
  if (print.debug) {
    std::cout << "   Loaded settings from " << path << std::endl;
  }
  return true;
}

void ConfigLoader::merge_json(const nlohmann::json& settings,
                              const std::string& source) {
  if (!settings.is_object()) {
    throw_config_error(source, "settings must be a JSON object.");
  }
  for (auto it = settings.begin(); it != settings.end(); ++it) {
    merged_[it.key()] = it.value();
    sources_[it.key()] = source;
  }
}

CompareConfig ConfigLoader::build() const {
  CompareConfig config;

  if (merged_.contains("WHITELIST_COLUMNS")) {
    const auto& whitelist = merged_.at("WHITELIST_COLUMNS");
    const auto source = sources_.at("WHITELIST_COLUMNS").get<std::string>();
    if (!whitelist.is_array()) {
      throw_config_error(source, "WHITELIST_COLUMNS must be a list of column "
                                 "names.");
    }
    for (const auto& name : whitelist) {
      if (!name.is_string()) {
        throw_config_error(source, "WHITELIST_COLUMNS entries must be "
                                   "strings, got " + name.dump() + ".");
      }
      config.whitelist_columns.insert(name.get<std::string>());
    }
    config.has_whitelist = true;
  }

  if (merged_.contains("EXPECTED_HEADER_DIFFERENCES_RAW")) {
    const auto& raw = merged_.at("EXPECTED_HEADER_DIFFERENCES_RAW");
    const auto source =
        sources_.at("EXPECTED_HEADER_DIFFERENCES_RAW").get<std::string>();
    if (!raw.is_array()) {
      throw_config_error(source, "EXPECTED_HEADER_DIFFERENCES_RAW must be a "
                                 "list of lists of column names.");
    }
    for (const auto& group : raw) {
      if (!group.is_array()) {
        throw_config_error(source, "EXPECTED_HEADER_DIFFERENCES_RAW groups "
                                   "must be lists, got " + group.dump() + ".");
      }
      std::vector<std::string> variants;
      for (const auto& name : group) {
        if (!name.is_string()) {
          throw_config_error(source, "EXPECTED_HEADER_DIFFERENCES_RAW "
                                     "entries must be strings, got " +
                                         name.dump() + ".");
        }
        variants.push_back(name.get<std::string>());
      }
      config.expected_header_differences.push_back(variants);
    }
  }
  return config;
}

CompareConfig ConfigLoader::load_for_original(const std::string& original_label,
                                              const PrintLevel& print_settings) {
  ConfigLoader loader(print_settings);
  loader.merge_file(GLOBAL_SETTINGS_FILE);
  loader.merge_file(original_label + ".json");
  return loader.build();
}
