/**
 * @brief Decides whether a data row pair describes the same record
 */

#ifndef ROW_CLASSIFIER_H
#define ROW_CLASSIFIER_H

#include <cstddef>

#include "comparator_registry.h"
#include "table_types.h"

enum class RowClass {
  Comparable,  // at least one identifier agrees
  Suspicious   // PMCID, PMID and DOI all disagree
};

/**
 * @brief Classifies row pairs by corroborating identifiers
 *
 * A single missing identifier in one table is common; disagreement on every
 * identifier means the rows most likely describe different records, so such
 * rows are reported for review instead of being diffed cell by cell.
 */
class RowClassifier {
 public:
  RowClassifier(const ComparatorRegistry& registry,
                const IdentifierColumns& columns);
  ~RowClassifier() = default;

  RowClass classify(const Row& row_a, const Row& row_b) const;

  // Raw identifier and title values of both rows
  SuspiciousRow make_suspicious(size_t row_number, const Row& row_a,
                                const Row& row_b) const;

 private:
  const ComparatorRegistry& registry;
  IdentifierColumns ids;
};

#endif  // ROW_CLASSIFIER_H
