#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <sstream>

#include "csv_reader.h"

class CsvReaderTest : public ::testing::Test {
 protected:
  void SetUp() override { cleanup_test_files(); }
  void TearDown() override { cleanup_test_files(); }

  CsvReader reader;

  // Helper function to create test files with exact bytes
  void createTestFile(const std::string& filename,
                      const std::string& contents) const {
    std::ofstream file(filename, std::ios::binary);
    file << contents;
    file.close();
  }

  void cleanup_test_files() const {
    std::vector<std::string> test_files = {"test_reader_in.csv",
                                           "test_reader_out.csv"};
    for (const auto& file : test_files) {
      std::remove(file.c_str());
    }
  }

  static Table parse_string(const std::string& text) {
    std::istringstream is(text);
    Table table;
    EXPECT_TRUE(CsvReader::parse(is, table));
    return table;
  }
};

TEST_F(CsvReaderTest, ParsesSimpleRows) {
  Table table = parse_string("DOI,PMID\nd1,p1\nd2,p2\n");
  ASSERT_EQ(table.size(), 3u);
  EXPECT_EQ(table[0], (Row{"DOI", "PMID"}));
  EXPECT_EQ(table[2], (Row{"d2", "p2"}));
}

TEST_F(CsvReaderTest, ParsesQuotedFields) {
  Table table = parse_string(
      "title,authors\r\n\"Hello, world\",\"Smith \"\"J\"\"\"\r\n"
      "\"Two\nlines\",x\r\n");
  ASSERT_EQ(table.size(), 3u);
  EXPECT_EQ(table[1][0], "Hello, world");
  EXPECT_EQ(table[1][1], "Smith \"J\"");
  EXPECT_EQ(table[2][0], "Two\nlines");
}

TEST_F(CsvReaderTest, KeepsSurroundingSpaces) {
  Table table = parse_string("a,b\n x , y\n");
  EXPECT_EQ(table[1], (Row{" x ", " y"}));
}

TEST_F(CsvReaderTest, QuoteInsideUnquotedFieldIsLiteral) {
  Table table = parse_string("DOI,Article title\nd1,The 5\" disk\nd2,T2\n");
  ASSERT_EQ(table.size(), 3u);
  EXPECT_EQ(table[1][1], "The 5\" disk");
  EXPECT_EQ(table[2], (Row{"d2", "T2"}));
}

TEST_F(CsvReaderTest, QuoteAfterLeadingSpaceIsLiteral) {
  Table table = parse_string("a,b\nx, \"y\"\n");
  ASSERT_EQ(table.size(), 2u);
  EXPECT_EQ(table[1][1], " \"y\"");
}

TEST_F(CsvReaderTest, DropsBlankRows) {
  Table table = parse_string("a,b\n\n,\nx,\n\n");
  ASSERT_EQ(table.size(), 2u);
  EXPECT_EQ(table[1], (Row{"x", ""}));
}

TEST_F(CsvReaderTest, KeepsBlankRowsWhenAsked) {
  std::istringstream is("a,b\n,\nx,y\n");
  Table table;
  ASSERT_TRUE(CsvReader::parse(is, table, false));
  EXPECT_EQ(table.size(), 3u);
}

TEST_F(CsvReaderTest, SkipsByteOrderMark) {
  Table table = parse_string("\xEF\xBB\xBF" "DOI,PMID\nd1,p1");
  ASSERT_EQ(table.size(), 2u);
  EXPECT_EQ(table[0][0], "DOI");
  EXPECT_EQ(table[1], (Row{"d1", "p1"}));
}

TEST_F(CsvReaderTest, UnterminatedQuoteFails) {
  std::istringstream is("a,b\n\"open,x\n");
  Table table;
  EXPECT_FALSE(CsvReader::parse(is, table));
}

TEST_F(CsvReaderTest, WritesMinimalQuoting) {
  Table table = {{"Row #", "a.csv Title"},
                 {"2", "Hello, \"world\""},
                 {},
                 {"3", "two\nlines"}};
  std::ostringstream os;
  CsvReader::write(os, table);
  EXPECT_EQ(os.str(),
            "Row #,a.csv Title\r\n2,\"Hello, \"\"world\"\"\"\r\n\r\n"
            "3,\"two\nlines\"\r\n");
}

TEST_F(CsvReaderTest, SaveThenLoadFile) {
  Table table = {{"DOI", "Article title"}, {"d1", "Caf\xC3\xA9, a study"}};
  ASSERT_TRUE(reader.save_file("test_reader_out.csv", table));
  Table loaded;
  ASSERT_TRUE(reader.load_file("test_reader_out.csv", loaded));
  EXPECT_EQ(loaded, table);
}

TEST_F(CsvReaderTest, LoadsFileFromDisk) {
  createTestFile("test_reader_in.csv", "DOI,PMID\r\nd1,p1\r\n,\r\n");
  Table table;
  ASSERT_TRUE(reader.load_file("test_reader_in.csv", table));
  EXPECT_EQ(table.size(), 2u);
}

TEST_F(CsvReaderTest, MissingFileFails) {
  Table table;
  EXPECT_FALSE(reader.load_file("nonexistent_reader.csv", table));
}

TEST_F(CsvReaderTest, BaseNameDropsDirectories) {
  EXPECT_EQ(CsvReader::base_name("data/runs/a.csv"), "a.csv");
  EXPECT_EQ(CsvReader::base_name("a.csv"), "a.csv");
}
