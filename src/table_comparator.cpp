/**
 * @file table_comparator.cpp
 * @brief Reconciles two tables derived from a shared original and collects
 * their cell-level differences.
 *
 * @details Row N of table A is always compared to row N of table B; rows are
 * never reordered or matched. The run is fail-fast: any structural
 * inconsistency (headers, row or column counts, required columns) raises a
 * CompareError before a report is produced. Cell mismatches are never fatal.
 *
 * Processing order:
 * - header rows present, row counts compatible
 * - whitelist applied to A and B
 * - required identifier columns resolved in A and the original
 * - headers of A and B reconciled under the configured synonyms
 * - each data row classified, then diffed if comparable
 * - Differences and Suspicious tables rendered
 */

#include <algorithm>
#include <iostream>
#include <string>

#include <nlohmann/json.hpp>

#include "column_filter.h"
#include "compare_error.h"
#include "csvcmp.h"
#include "difference_analyzer.h"
#include "header_reconciler.h"
#include "report_builder.h"
#include "row_classifier.h"

// ========================================================================
// Validation
// ========================================================================

void TableComparator::check_not_empty(const Table& table,
                                      const std::string& label) const {
  if (table.empty()) {
    ErrorContext context;
    context.source_a = label;
    throw CompareError(ErrorKind::EmptyTable,
                       "Sheet " + label + " has no header row.", context);
  }
}

void TableComparator::check_row_counts(const Table& a, const Table& b,
                                       const SourceLabels& labels) const {
  if (a.size() < b.size()) {
    std::cerr << "\033[1;33mWARNING:\033[0m Sheets have a different number of "
                 "rows. Comparison will only go as far as the end of sheet "
              << labels.a << ", the last " << b.size() - a.size()
              << " rows in sheet " << labels.b << " will be ignored."
              << std::endl;
  }
  if (a.size() > b.size()) {
    ErrorContext context;
    context.source_a = labels.a;
    context.source_b = labels.b;
    context.value_a = std::to_string(a.size());
    context.value_b = std::to_string(b.size());
    throw CompareError(ErrorKind::RowCountExceeded,
                       "Sheet " + labels.a + " (" + context.value_a +
                           " rows) has more rows than sheet " + labels.b +
                           " (" + context.value_b +
                           " rows), comparison can't continue. Switch the "
                           "order of the arguments if you want a partial "
                           "comparison.",
                       context);
  }
}

IdentifierColumns TableComparator::resolve_required_columns(
    const Header& header, const std::string& label) {
  size_t positions[4] = {0, 0, 0, 0};
  for (size_t i = 0; i < 4; ++i) {
    const std::string name = REQUIRED_COLUMNS[i];
    auto it = std::find(header.begin(), header.end(), name);
    if (it == header.end()) {
      ErrorContext context;
      context.column = name;
      context.source_a = label;
      throw CompareError(ErrorKind::MissingRequiredColumn,
                         "Sheet " + label + " has no '" + name +
                             "' column. We expect all sheets to have DOI, "
                             "PMID, PMCID and Article title column headers.",
                         context);
    }
    positions[i] = static_cast<size_t>(it - header.begin());
  }
  IdentifierColumns ids;
  ids.doi = positions[0];
  ids.pmid = positions[1];
  ids.pmcid = positions[2];
  ids.title = positions[3];
  return ids;
}

void TableComparator::check_row_width(const Row& row_a, const Row& row_b,
                                      size_t row_number, size_t width,
                                      const SourceLabels& labels) const {
  const Row* rows[2] = {&row_a, &row_b};
  const std::string* names[2] = {&labels.a, &labels.b};
  for (size_t i = 0; i < 2; ++i) {
    if (rows[i]->size() != width) {
      ErrorContext context;
      context.row = row_number;
      context.position = std::min(rows[i]->size(), width);
      context.source_a = *names[i];
      context.value_a = std::to_string(rows[i]->size());
      context.value_b = std::to_string(width);
      throw CompareError(rows[i]->size() < width ? ErrorKind::RowTooShort
                                                 : ErrorKind::RowTooLong,
                         "Row " + std::to_string(row_number) + " of " +
                             *names[i] + " has " + context.value_a +
                             " cells, the header has " + context.value_b +
                             ". The CSV is not rectangular.",
                         context);
    }
  }
}

// ========================================================================
// Preparation
// ========================================================================

void TableComparator::apply_whitelist(Table& a, Table& b,
                                      const SourceLabels& labels) const {
  if (!config.has_whitelist) {
    if (!print.quiet) {
      std::cout << "No column whitelist found." << std::endl;
    }
    return;
  }
  if (!print.quiet) {
    std::cout << "Whitelist found, deleting all columns not in whitelist. "
                 "Whitelist:"
              << std::endl;
    for (const auto& name : config.whitelist_columns) {
      std::cout << "   " << name << std::endl;
    }
  }
  ColumnFilter filter(print);
  filter.apply_whitelist(a, config.whitelist_columns, labels.a);
  filter.apply_whitelist(b, config.whitelist_columns, labels.b);
}

void TableComparator::print_header(const Header& header,
                                   const std::string& label) const {
  std::cout << label << " header:" << std::endl;
  std::cout << "\"";
  for (size_t i = 0; i < header.size(); ++i) {
    if (i > 0) std::cout << "\",\"";
    std::cout << header[i];
  }
  std::cout << "\"" << std::endl << std::endl;
}

// ========================================================================
// Public Interface
// ========================================================================

ComparisonResult TableComparator::compare(Table a, Table b,
                                          const Table& original,
                                          const SourceLabels& labels,
                                          bool print_headers) const {
  check_not_empty(a, labels.a);
  check_not_empty(b, labels.b);
  check_not_empty(original, labels.original);
  check_row_counts(a, b, labels);

  apply_whitelist(a, b, labels);

  const Header& header_a = a.front();
  const Header& header_b = b.front();
  const Header& header_o = original.front();

  if (print_headers) {
    print_header(header_a, labels.a);
    print_header(header_b, labels.b);
    print_header(header_o, labels.original);
  }

  const IdentifierColumns ids = resolve_required_columns(header_a, labels.a);
  const IdentifierColumns o_ids =
      resolve_required_columns(header_o, labels.original);

  ComparatorRegistry registry;
  registry.register_override(ids.pmcid,
                             ComparatorRegistry::prefix_stripping(PMCID_PREFIX));

  HeaderReconciler reconciler(config.expected_header_differences, print);
  reconciler.reconcile(header_a, header_b, labels.a, labels.b);

  ComparisonResult result;
  result.counter.rows_a = a.size();
  result.counter.rows_b = b.size();
  result.counter.rows_original = original.size();

  RowClassifier classifier(registry, ids);
  DifferenceAnalyzer analyzer(registry);
  const size_t width = header_a.size();

  for (size_t row_number = 1; row_number < a.size(); ++row_number) {
    const Row& row_a = a[row_number];
    const Row& row_b = b[row_number];
    check_row_width(row_a, row_b, row_number, width, labels);

    if (classifier.classify(row_a, row_b) == RowClass::Suspicious) {
      if (print.debug2) {
        std::cout << "   Row " << row_number
                  << ": all identifiers differ, marked suspicious"
                  << std::endl;
      }
      result.suspicious.push_back(
          classifier.make_suspicious(row_number, row_a, row_b));
      continue;
    }

    size_t found =
        analyzer.process_row(row_number, row_a, row_b, result.differences);
    if (print.debug2 && found > 0) {
      std::cout << "   Row " << row_number << ": " << found
                << " differing cells" << std::endl;
    }
    result.counter.rows_processed++;
  }

  result.counter.rows_suspicious = result.suspicious.size();
  result.counter.cell_differences = result.differences.total();

  ReportBuilder builder(labels, header_a, header_b, original, o_ids);
  result.differences_report = builder.build_differences(result.differences);
  result.suspicious_report = builder.build_suspicious(result.suspicious);
  return result;
}

void TableComparator::print_suspicious(const ComparisonResult& result) const {
  if (result.suspicious.empty() || print.quiet) {
    return;
  }
  std::cout << "\033[1;33mThese records are suspicious:\033[0m all "
               "identifiers on the same row did not match across the two "
               "sheets. So a (potentially) different article was on the same "
               "row in the two sheets."
            << std::endl;
  if (result.suspicious.size() < SUSPICIOUS_DUMP_LIMIT) {
    nlohmann::json dump = nlohmann::json::array();
    for (const auto& row : result.suspicious_report) {
      dump.push_back(row);
    }
    std::cout << dump.dump(2) << std::endl;
  }
}

void TableComparator::print_summary(const ComparisonResult& result,
                                    const SourceLabels& labels) const {
  if (print.quiet) {
    return;
  }
  const CountStats& counter = result.counter;
  std::cout << "Original file " << labels.original << " number of rows "
            << counter.rows_original << std::endl;
  std::cout << labels.a << " number of rows " << counter.rows_a << std::endl;
  std::cout << labels.b << " number of rows " << counter.rows_b << std::endl;
  std::cout << counter.rows_suspicious
            << " suspicious rows which were not processed for differences "
               "(all the IDs on those rows did not match across the two CSVs "
               "being compared)."
            << std::endl;
  std::cout << counter.rows_processed << " rows were processed for differences"
            << std::endl;
  if (counter.cell_differences == 0) {
    std::cout << "\033[1;32mNo differences found.\033[0m" << std::endl;
  } else {
    std::cout << "\033[1;33m" << counter.cell_differences
              << " differing cells\033[0m in "
              << result.differences.column_count() << " columns" << std::endl;
  }
}

std::string TableComparator::results_filename(const SourceLabels& labels) {
  return labels.a + "_comparison_" + labels.b + ".csv";
}

std::string TableComparator::suspicious_filename(const SourceLabels& labels) {
  return labels.a + "_suspicious_" + labels.b + ".csv";
}
