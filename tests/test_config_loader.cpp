#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>

#include "compare_error.h"
#include "config_loader.h"

class ConfigLoaderTest : public ::testing::Test {
 protected:
  void SetUp() override { cleanup_test_files(); }
  void TearDown() override { cleanup_test_files(); }

  void createTestFile(const std::string& filename,
                      const std::string& contents) const {
    std::ofstream file(filename);
    file << contents;
    file.close();
  }

  void cleanup_test_files() const {
    std::vector<std::string> test_files = {"test_settings.json",
                                           "test_original.csv.json",
                                           "test_broken.json"};
    for (const auto& file : test_files) {
      std::remove(file.c_str());
    }
  }

  static ErrorKind build_error(const nlohmann::json& settings) {
    ConfigLoader loader;
    try {
      loader.merge_json(settings, "inline");
      loader.build();
    } catch (const CompareError& e) {
      return e.kind();
    }
    ADD_FAILURE() << "Expected ConfigError";
    return ErrorKind::EmptyTable;
  }
};

TEST_F(ConfigLoaderTest, NoFilesGivesDefaults) {
  ConfigLoader loader;
  EXPECT_FALSE(loader.merge_file("nonexistent_settings.json"));
  CompareConfig config = loader.build();
  EXPECT_FALSE(config.has_whitelist);
  EXPECT_TRUE(config.whitelist_columns.empty());
  EXPECT_TRUE(config.expected_header_differences.empty());
}

TEST_F(ConfigLoaderTest, ReadsRecognizedKeys) {
  createTestFile("test_settings.json", R"json({
    "WHITELIST_COLUMNS": ["DOI", "PMID", "PMCID", "Article title"],
    "EXPECTED_HEADER_DIFFERENCES_RAW": [["Authors", "Author(s)"]],
    "UNRELATED": 42
  })json");
  ConfigLoader loader;
  ASSERT_TRUE(loader.merge_file("test_settings.json"));
  CompareConfig config = loader.build();
  EXPECT_TRUE(config.has_whitelist);
  EXPECT_EQ(config.whitelist_columns.size(), 4u);
  EXPECT_EQ(config.whitelist_columns.count("Article title"), 1u);
  ASSERT_EQ(config.expected_header_differences.size(), 1u);
  EXPECT_EQ(config.expected_header_differences[0],
            (std::vector<std::string>{"Authors", "Author(s)"}));
}

TEST_F(ConfigLoaderTest, SecondFileOverridesFirst) {
  createTestFile("test_settings.json", R"json({
    "WHITELIST_COLUMNS": ["DOI"],
    "EXPECTED_HEADER_DIFFERENCES_RAW": [["Authors", "Author(s)"]]
  })json");
  createTestFile("test_original.csv.json", R"({
    "WHITELIST_COLUMNS": ["DOI", "PMID"]
  })");
  ConfigLoader loader;
  loader.merge_file("test_settings.json");
  loader.merge_file("test_original.csv.json");
  CompareConfig config = loader.build();
  EXPECT_EQ(config.whitelist_columns,
            (std::set<std::string>{"DOI", "PMID"}));
  // keys absent from the second file survive
  EXPECT_EQ(config.expected_header_differences.size(), 1u);
}

TEST_F(ConfigLoaderTest, InvalidJsonIsConfigError) {
  createTestFile("test_broken.json", "{\"WHITELIST_COLUMNS\": [\"DOI\",");
  ConfigLoader loader;
  try {
    loader.merge_file("test_broken.json");
    FAIL() << "Expected ConfigError";
  } catch (const CompareError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::ConfigError);
    EXPECT_EQ(e.context().source_a, "test_broken.json");
  }
}

TEST_F(ConfigLoaderTest, WrongShapesAreConfigErrors) {
  EXPECT_EQ(build_error(nlohmann::json::array()), ErrorKind::ConfigError);
  EXPECT_EQ(build_error({{"WHITELIST_COLUMNS", "DOI"}}),
            ErrorKind::ConfigError);
  EXPECT_EQ(build_error({{"WHITELIST_COLUMNS", {"DOI", 3}}}),
            ErrorKind::ConfigError);
  EXPECT_EQ(build_error({{"EXPECTED_HEADER_DIFFERENCES_RAW", {"a", "b"}}}),
            ErrorKind::ConfigError);
}

TEST_F(ConfigLoaderTest, EmptyWhitelistStillCountsAsPresent) {
  ConfigLoader loader;
  loader.merge_json({{"WHITELIST_COLUMNS", nlohmann::json::array()}},
                    "inline");
  CompareConfig config = loader.build();
  EXPECT_TRUE(config.has_whitelist);
  EXPECT_TRUE(config.whitelist_columns.empty());
}
