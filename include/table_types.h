/**
 * @brief Data structures shared by the table reconciliation components
 */

#ifndef TABLE_TYPES_H
#define TABLE_TYPES_H

#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <vector>

// Row 0 of a Table is the header row; rows 1..N are data rows.
using Row = std::vector<std::string>;
using Table = std::vector<Row>;
using Header = std::vector<std::string>;

// Groups of interchangeable column names, as read from configuration
using SynonymGroups = std::vector<std::vector<std::string>>;
// For each name in some group: the other names it may be matched against
using SynonymMap = std::map<std::string, std::set<std::string>>;

/**
 * @brief Selects a column either by position or by header name
 *
 * Resolved to a position once, against a specific header.
 */
struct ColumnSelector {
  enum class Kind { ByPosition, ByName };

  Kind kind = Kind::ByPosition;
  size_t position = 0;  // used when kind == ByPosition
  std::string name;     // used when kind == ByName

  static ColumnSelector by_position(size_t position) {
    ColumnSelector selector;
    selector.kind = Kind::ByPosition;
    selector.position = position;
    return selector;
  }
  static ColumnSelector by_name(const std::string& name) {
    ColumnSelector selector;
    selector.kind = Kind::ByName;
    selector.name = name;
    return selector;
  }
};

// Positions of the record-identifying columns within one header
struct IdentifierColumns {
  size_t doi = 0;
  size_t pmid = 0;
  size_t pmcid = 0;
  size_t title = 0;
};

// A data row whose identifiers all disagree between the two tables
struct SuspiciousRow {
  size_t row_number = 0;  // data row index (1-based, header excluded)
  std::string pmcid_a;
  std::string pmcid_b;
  std::string pmid_a;
  std::string pmid_b;
  std::string doi_a;
  std::string doi_b;
  std::string title_a;
  std::string title_b;
};

// Display names of the three inputs (file names without directories)
struct SourceLabels {
  std::string a;
  std::string b;
  std::string original;
};

struct CompareConfig {
  bool has_whitelist = false;              // WHITELIST_COLUMNS present
  std::set<std::string> whitelist_columns;  // names to retain
  SynonymGroups expected_header_differences;
};

struct CountStats {
  size_t rows_a = 0;            // rows in A, header included
  size_t rows_b = 0;            // rows in B, header included
  size_t rows_original = 0;     // rows in Original, header included
  size_t rows_processed = 0;    // comparable rows diffed cell by cell
  size_t rows_suspicious = 0;   // rows skipped because all IDs disagree
  size_t cell_differences = 0;  // total DifferenceRecords
};

#endif  // TABLE_TYPES_H
