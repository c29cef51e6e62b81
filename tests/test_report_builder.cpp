#include <gtest/gtest.h>

#include "compare_error.h"
#include "report_builder.h"

class ReportBuilderTest : public ::testing::Test {
 protected:
  SourceLabels labels{"a.csv", "b.csv", "o.csv"};
  Header header_a = {"DOI", "PMID", "PMCID", "Article title", "Authors"};
  Header header_b = {"DOI", "PMID", "PMCID", "Article title", "Author(s)"};
  Table original = {{"PMCID", "PMID", "DOI", "Article title"},
                    {"PMC1", "p1", "d1", "T1"},
                    {"PMC2", "p2", "d2", "T2"},
                    {"PMC3", "p3", "d3", "T3"}};
  IdentifierColumns o_ids{2, 1, 0, 3};  // doi, pmid, pmcid, title

  ReportBuilder builder() const {
    return ReportBuilder(labels, header_a, header_b, original, o_ids);
  }
};

TEST_F(ReportBuilderTest, NoDifferencesGivesEmptyReport) {
  DifferenceMap differences;
  EXPECT_TRUE(builder().build_differences(differences).empty());
}

TEST_F(ReportBuilderTest, GroupsByColumnWithSubHeaders) {
  DifferenceMap differences;
  differences.record(4, 3, "Smith", "Smyth");
  differences.record(3, 2, "T2", "T2 (revised)");
  differences.record(4, 1, "Doe", "Roe");

  Table report = builder().build_differences(differences);
  ASSERT_EQ(report.size(), 7u);

  EXPECT_EQ(report[0],
            (Row{"Row #", "a.csv Article title", "b.csv Article title",
                 "o.csv PMCID", "o.csv PMID", "o.csv DOI",
                 "o.csv Article title"}));
  EXPECT_EQ(report[1],
            (Row{"3", "T2", "T2 (revised)", "PMC2", "p2", "d2", "T2"}));
  EXPECT_TRUE(report[2].empty());

  // column 4 uses each side's own header name
  EXPECT_EQ(report[3][1], "a.csv Authors");
  EXPECT_EQ(report[3][2], "b.csv Author(s)");
  // rows ascend within a column
  EXPECT_EQ(report[4][0], "2");
  EXPECT_EQ(report[4][3], "PMC1");
  EXPECT_EQ(report[5][0], "4");
  EXPECT_EQ(report[5][6], "T3");
  EXPECT_TRUE(report[6].empty());
}

TEST_F(ReportBuilderTest, SuspiciousTableHasFixedHeader) {
  SuspiciousRow row;
  row.row_number = 2;
  row.pmcid_a = "PMC2";
  row.pmcid_b = "PMC9";
  row.pmid_a = "p2";
  row.pmid_b = "p9";
  row.doi_a = "d2";
  row.doi_b = "d9";
  row.title_a = "T2";
  row.title_b = "Other";

  Table report = builder().build_suspicious({row});
  ASSERT_EQ(report.size(), 2u);
  EXPECT_EQ(report[0],
            (Row{"Row #", "a.csv PMCID", "b.csv PMCID", "a.csv PMID",
                 "b.csv PMID", "a.csv DOI", "b.csv DOI", "a.csv Article title",
                 "b.csv Article title"}));
  EXPECT_EQ(report[1], (Row{"2", "PMC2", "PMC9", "p2", "p9", "d2", "d9", "T2",
                            "Other"}));
}

TEST_F(ReportBuilderTest, EmptySuspiciousListKeepsHeader) {
  Table report = builder().build_suspicious({});
  EXPECT_EQ(report.size(), 1u);
}

TEST_F(ReportBuilderTest, MissingOriginalRow) {
  DifferenceMap differences;
  differences.record(0, 5, "x", "y");
  try {
    builder().build_differences(differences);
    FAIL() << "Expected RowCountExceeded";
  } catch (const CompareError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::RowCountExceeded);
    EXPECT_EQ(e.context().row, 5u);
    EXPECT_EQ(e.context().source_a, "o.csv");
  }
}

TEST_F(ReportBuilderTest, ShortOriginalRow) {
  original[1].pop_back();
  DifferenceMap differences;
  differences.record(0, 1, "x", "y");
  try {
    builder().build_differences(differences);
    FAIL() << "Expected RowTooShort";
  } catch (const CompareError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::RowTooShort);
    EXPECT_EQ(e.context().row, 1u);
  }
}

TEST(DifferenceMapTest, IteratesInColumnThenRowOrder) {
  DifferenceMap differences;
  differences.record(5, 9, "a", "b");
  differences.record(1, 4, "c", "d");
  differences.record(5, 2, "e", "f");
  differences.record(1, 1, "g", "h");

  std::vector<std::pair<size_t, size_t>> order;
  for (const auto& column : differences) {
    for (const auto& row : column.second) {
      order.emplace_back(column.first, row.first);
    }
  }
  std::vector<std::pair<size_t, size_t>> expected = {
      {1, 1}, {1, 4}, {5, 2}, {5, 9}};
  EXPECT_EQ(order, expected);
  EXPECT_EQ(differences.total(), 4u);
  EXPECT_EQ(differences.column_count(), 2u);
  ASSERT_NE(differences.find(5, 2), nullptr);
  EXPECT_EQ(differences.find(5, 2)->value_b, "f");
  EXPECT_EQ(differences.find(5, 3), nullptr);
  EXPECT_EQ(differences.find(2, 2), nullptr);
}
