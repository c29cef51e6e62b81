#include "row_classifier.h"

RowClassifier::RowClassifier(const ComparatorRegistry& registry,
                             const IdentifierColumns& columns)
    : registry(registry), ids(columns) {}

RowClass RowClassifier::classify(const Row& row_a, const Row& row_b) const {
  if (registry.compare(ids.pmcid, row_a[ids.pmcid], row_b[ids.pmcid]) ||
      registry.compare(ids.pmid, row_a[ids.pmid], row_b[ids.pmid]) ||
      registry.compare(ids.doi, row_a[ids.doi], row_b[ids.doi])) {
    return RowClass::Comparable;
  }
  return RowClass::Suspicious;
}

SuspiciousRow RowClassifier::make_suspicious(size_t row_number,
                                             const Row& row_a,
                                             const Row& row_b) const {
  SuspiciousRow entry;
  entry.row_number = row_number;
  entry.pmcid_a = row_a[ids.pmcid];
  entry.pmcid_b = row_b[ids.pmcid];
  entry.pmid_a = row_a[ids.pmid];
  entry.pmid_b = row_b[ids.pmid];
  entry.doi_a = row_a[ids.doi];
  entry.doi_b = row_b[ids.doi];
  entry.title_a = row_a[ids.title];
  entry.title_b = row_b[ids.title];
  return entry;
}
