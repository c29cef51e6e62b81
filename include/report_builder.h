/**
 * @brief Renders aggregated differences and suspicious rows as tables
 */

#ifndef REPORT_BUILDER_H
#define REPORT_BUILDER_H

#include <vector>

#include "difference_map.h"
#include "table_types.h"

/**
 * @brief Builds the Differences and Suspicious output tables
 *
 * Differences are grouped by column; each group opens with a labelled
 * sub-header row and closes with an empty separator row. Every difference
 * row carries cross-reference identifiers looked up in the Original table
 * at the same row number.
 */
class ReportBuilder {
 public:
  ReportBuilder(const SourceLabels& labels, const Header& header_a,
                const Header& header_b, const Table& original,
                const IdentifierColumns& original_ids);
  ~ReportBuilder() = default;

  Table build_differences(const DifferenceMap& differences) const;
  Table build_suspicious(const std::vector<SuspiciousRow>& suspicious) const;

  Row differences_header(size_t column_index) const;
  Row suspicious_header() const;

 private:
  SourceLabels labels;
  const Header& header_a;
  const Header& header_b;
  const Table& original;
  IdentifierColumns o_ids;

  const Row& original_row(size_t row_number) const;
};

#endif  // REPORT_BUILDER_H
