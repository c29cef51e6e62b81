#ifndef CSVCMP_H
#define CSVCMP_H

#include <cstddef>
#include <string>
#include <vector>

#include "difference_map.h"
#include "print_level.h"
#include "table_types.h"

constexpr const char* PROGRAM_NAME = "csvcmp";
constexpr const char* PROGRAM_VERSION = "1.0.0";

// Columns every compared table and the original must carry
constexpr const char* REQUIRED_COLUMNS[] = {"DOI", "PMID", "PMCID",
                                            "Article title"};
constexpr const char* PMCID_PREFIX = "pmc";

// Above this many suspicious rows the JSON dump is skipped
constexpr size_t SUSPICIOUS_DUMP_LIMIT = 50;

struct ComparisonResult {
  DifferenceMap differences;             // (column, row) -> values
  std::vector<SuspiciousRow> suspicious;  // rows skipped for review
  Table differences_report;              // rendered Differences table
  Table suspicious_report;               // header + one row per entry
  CountStats counter;
};

// Main class declaration
class TableComparator {
 public:
  explicit TableComparator(const CompareConfig& config, int debug_level = 0)
      : config(config), print(make_print_level(debug_level)) {}

  // ========================================================================
  // Friend declarations for testing
  // ========================================================================
  friend class TableComparatorTest;
  friend class TableComparatorTest_RequiredColumnsResolved_Test;

  // ========================================================================
  // Public Interface
  // ========================================================================
  // Tables are taken by value: whitelisting removes columns from the copies.
  // Throws CompareError on any structural inconsistency.
  ComparisonResult compare(Table a, Table b, const Table& original,
                           const SourceLabels& labels,
                           bool print_headers = false) const;

  void print_summary(const ComparisonResult& result,
                     const SourceLabels& labels) const;
  void print_suspicious(const ComparisonResult& result) const;

  static std::string results_filename(const SourceLabels& labels);
  static std::string suspicious_filename(const SourceLabels& labels);

 private:
  CompareConfig config;
  PrintLevel print;

  // ========================================================================
  // Validation
  // ========================================================================
  void check_not_empty(const Table& table, const std::string& label) const;
  void check_row_counts(const Table& a, const Table& b,
                        const SourceLabels& labels) const;
  static IdentifierColumns resolve_required_columns(const Header& header,
                                                    const std::string& label);
  void check_row_width(const Row& row_a, const Row& row_b, size_t row_number,
                       size_t width, const SourceLabels& labels) const;

  // ========================================================================
  // Preparation
  // ========================================================================
  void apply_whitelist(Table& a, Table& b, const SourceLabels& labels) const;
  void print_header(const Header& header, const std::string& label) const;
};

#endif  // CSVCMP_H
