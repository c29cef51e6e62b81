/**
 * @brief Cell-by-cell comparison of comparable row pairs
 */

#ifndef DIFFERENCE_ANALYZER_H
#define DIFFERENCE_ANALYZER_H

#include <cstddef>

#include "comparator_registry.h"
#include "difference_map.h"
#include "table_types.h"

/**
 * @brief Records cell-level differences between two comparable rows
 *
 * This class is responsible for:
 * - Applying the registered comparator of each column to a row pair
 * - Recording every disagreeing cell in a DifferenceMap
 */
class DifferenceAnalyzer {
 public:
  explicit DifferenceAnalyzer(const ComparatorRegistry& registry);
  ~DifferenceAnalyzer() = default;

  // Compares every column both rows have. Returns the number of
  // differences recorded.
  size_t process_row(size_t row_number, const Row& row_a, const Row& row_b,
                     DifferenceMap& differences) const;

 private:
  const ComparatorRegistry& registry;
};

#endif  // DIFFERENCE_ANALYZER_H
