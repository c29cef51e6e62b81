/**
 * @brief Loads comparison settings from optional JSON files
 */

#ifndef CONFIG_LOADER_H
#define CONFIG_LOADER_H

#include <string>

#include <nlohmann/json.hpp>

#include "print_level.h"
#include "table_types.h"

constexpr const char* GLOBAL_SETTINGS_FILE = "settings.json";

/**
 * @brief Merges JSON settings files into a CompareConfig
 *
 * Files are merged in the order they are added; top-level keys of a later
 * file replace those of an earlier one. Missing files are skipped.
 * Recognized keys: WHITELIST_COLUMNS, EXPECTED_HEADER_DIFFERENCES_RAW.
 */
class ConfigLoader {
 public:
  explicit ConfigLoader(const PrintLevel& print_settings = PrintLevel{});
  ~ConfigLoader() = default;

  // Returns false if the file does not exist. Throws ConfigError if it
  // exists but is not a JSON object.
  bool merge_file(const std::string& path);
  void merge_json(const nlohmann::json& settings, const std::string& source);

  // Throws ConfigError if a recognized key has the wrong shape
  CompareConfig build() const;

  const nlohmann::json& merged() const { return merged_; }

  // settings.json, then <original-file-name>.json
  static CompareConfig load_for_original(const std::string& original_label,
                                         const PrintLevel& print_settings);

 private:
  PrintLevel print;
  nlohmann::json merged_ = nlohmann::json::object();
  nlohmann::json sources_ = nlohmann::json::object();  // key -> file name
};

#endif  // CONFIG_LOADER_H
