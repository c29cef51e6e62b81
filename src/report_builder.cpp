#include "report_builder.h"

#include <algorithm>
#include <string>

#include "compare_error.h"

ReportBuilder::ReportBuilder(const SourceLabels& labels,
                             const Header& header_a, const Header& header_b,
                             const Table& original,
                             const IdentifierColumns& original_ids)
    : labels(labels),
      header_a(header_a),
      header_b(header_b),
      original(original),
      o_ids(original_ids) {}

Row ReportBuilder::differences_header(size_t column_index) const {
  return {"Row #",
          labels.a + " " + header_a[column_index],
          labels.b + " " + header_b[column_index],
          labels.original + " PMCID",
          labels.original + " PMID",
          labels.original + " DOI",
          labels.original + " Article title"};
}

Row ReportBuilder::suspicious_header() const {
  return {"Row #",
          labels.a + " PMCID",
          labels.b + " PMCID",
          labels.a + " PMID",
          labels.b + " PMID",
          labels.a + " DOI",
          labels.b + " DOI",
          labels.a + " Article title",
          labels.b + " Article title"};
}

const Row& ReportBuilder::original_row(size_t row_number) const {
  if (row_number >= original.size()) {
    ErrorContext context;
    context.row = row_number;
    context.source_a = labels.original;
    throw CompareError(ErrorKind::RowCountExceeded,
                       "Original file " + labels.original + " has no row " +
                           std::to_string(row_number) +
                           " to cross-reference (it has " +
                           std::to_string(original.size()) + " rows).",
                       context);
  }
  const Row& row = original[row_number];
  const size_t needed =
      std::max({o_ids.pmcid, o_ids.pmid, o_ids.doi, o_ids.title}) + 1;
  if (row.size() < needed) {
    ErrorContext context;
    context.row = row_number;
    context.position = needed - 1;
    context.source_a = labels.original;
    context.value_a = std::to_string(row.size());
    throw CompareError(ErrorKind::RowTooShort,
                       "Row " + std::to_string(row_number) + " of " +
                           labels.original + " has only " +
                           std::to_string(row.size()) + " cells.",
                       context);
  }
  return row;
}

Table ReportBuilder::build_differences(const DifferenceMap& differences) const {
  Table results;
  for (const auto& column : differences) {
    if (column.second.empty()) {
      continue;
    }
    results.push_back(differences_header(column.first));
    for (const auto& entry : column.second) {
      const size_t row_number = entry.first;
      const Row& o_row = original_row(row_number);
      // spreadsheet line number: the header occupies line 1
      results.push_back({std::to_string(row_number + 1), entry.second.value_a,
                         entry.second.value_b, o_row[o_ids.pmcid],
                         o_row[o_ids.pmid], o_row[o_ids.doi],
                         o_row[o_ids.title]});
    }
    results.push_back(Row{});
  }
  return results;
}

Table ReportBuilder::build_suspicious(
    const std::vector<SuspiciousRow>& suspicious) const {
  Table results;
  results.push_back(suspicious_header());
  for (const auto& entry : suspicious) {
    results.push_back({std::to_string(entry.row_number), entry.pmcid_a,
                       entry.pmcid_b, entry.pmid_a, entry.pmid_b, entry.doi_a,
                       entry.doi_b, entry.title_a, entry.title_b});
  }
  return results;
}
